/////////////////////////////////////////////////////////////////////////////
// Pedestrian detection over a pretrained Darknet (YOLO) model, run through
// OpenCV's dnn module. Only "person" detections are reported.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_PEDESTRIAN_DETECT_H
#define GAZEGUARD_PEDESTRIAN_DETECT_H

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>


typedef struct detection {
        float confidence;
        cv::Rect box;
        cv::Point centroid;
	    } detection_t;

detection_t make_detection(float confidence, const cv::Rect &box);


class PedestrianDetector {
    public:
        virtual ~PedestrianDetector() {}
        virtual std::vector<detection_t> detect(const cv::Mat &frame) = 0;
};


class DnnPedestrianDetector : public PedestrianDetector {
    public:
        DnnPedestrianDetector(const std::string &cfg_path,
                              const std::string &weights_path,
                              const std::string &names_path,
                              float min_confidence,
                              float nms_threshold,
                              int input_size);

        std::vector<detection_t> detect(const cv::Mat &frame);
        int person_id() const { return m_person_id; }

    private:
        cv::dnn::Net m_net;
        std::vector<std::string> m_layer_names;
        int m_person_id;
        float m_min_confidence;
        float m_nms_threshold;
        int m_input_size;
};


std::vector<std::string> load_labels(const std::string &names_path);


#endif // Top-level include guard
