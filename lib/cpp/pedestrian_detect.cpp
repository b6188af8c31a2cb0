/////////////////////////////////////////////////////////////////////////////
// Pedestrian detection over a pretrained Darknet (YOLO) model.
//
/////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <fstream>

#include <boost/algorithm/string/trim.hpp>

#include "app.h"
#include "pedestrian_detect.h"

using namespace std;


#define PERSON_LABEL "person"


detection_t make_detection(float confidence, const cv::Rect &box) {
    detection_t d;
    d.confidence = confidence;
    d.box = box;
    d.centroid = cv::Point(box.x + box.width / 2, box.y + box.height / 2);
    return d;
}

// Loads class labels, one per line
vector<string> load_labels(const string &names_path) {
    ifstream f(names_path);
    if (!f)
        throw AppError("Detector labels not found: " + names_path);

    vector<string> labels;
    string line;
    while (getline(f, line)) {
        boost::algorithm::trim(line);
        labels.push_back(line);
    }

    return labels;
}


DnnPedestrianDetector::DnnPedestrianDetector(const string &cfg_path,
                                             const string &weights_path,
                                             const string &names_path,
                                             float min_confidence,
                                             float nms_threshold,
                                             int input_size) {
    m_min_confidence = min_confidence;
    m_nms_threshold = nms_threshold;
    m_input_size = input_size;

    vector<string> labels = load_labels(names_path);
    auto it = find(labels.begin(), labels.end(), PERSON_LABEL);
    if (it == labels.end())
        throw AppError("No \"" PERSON_LABEL "\" label in " + names_path);
    m_person_id = static_cast<int>(it - labels.begin());

    try {
        m_net = cv::dnn::readNetFromDarknet(cfg_path, weights_path);
    } catch (const cv::Exception &e) {
        throw AppError("Failed to load detector model " + weights_path + ": " + e.what());
    }
    if (m_net.empty())
        throw AppError("Failed to load detector model " + weights_path);

    m_layer_names = m_net.getUnconnectedOutLayersNames();
    info("Pedestrian detector loaded from " + weights_path);
}

// Runs the network over frame and returns the person boxes surviving the
// confidence filter and non-max suppression, clipped to the frame.
vector<detection_t> DnnPedestrianDetector::detect(const cv::Mat &frame) {
    vector<detection_t> results;
    if (frame.empty())
        return results;

    const int W = frame.cols;
    const int H = frame.rows;

    cv::Mat blob = cv::dnn::blobFromImage(
        frame, 1 / 255.0, cv::Size(m_input_size, m_input_size),
        cv::Scalar(), true, false);
    m_net.setInput(blob);

    vector<cv::Mat> outputs;
    m_net.forward(outputs, m_layer_names);

    vector<cv::Rect> boxes;
    vector<float> confidences;

    // Each row: center x, center y, w, h, objectness, class scores...
    for (const cv::Mat &output : outputs) {
        for (int r = 0; r < output.rows; r++) {
            const float *row = output.ptr<float>(r);
            if (output.cols <= 5 + m_person_id)
                continue;

            cv::Mat scores = output.row(r).colRange(5, output.cols);
            cv::Point class_id;
            double confidence;
            cv::minMaxLoc(scores, NULL, &confidence, NULL, &class_id);

            if (class_id.x != m_person_id || confidence <= m_min_confidence)
                continue;

            int width = static_cast<int>(row[2] * W);
            int height = static_cast<int>(row[3] * H);
            int x = static_cast<int>(row[0] * W - width / 2);
            int y = static_cast<int>(row[1] * H - height / 2);

            boxes.push_back(cv::Rect(x, y, width, height));
            confidences.push_back(static_cast<float>(confidence));
        }
    }

    vector<int> keep;
    cv::dnn::NMSBoxes(boxes, confidences, m_min_confidence, m_nms_threshold, keep);

    const cv::Rect bounds(0, 0, W, H);
    for (int i : keep) {
        cv::Rect box = boxes[i] & bounds;
        if (box.area() > 0)
            results.push_back(make_detection(confidences[i], box));
    }

    return results;
}
