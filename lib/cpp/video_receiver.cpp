/////////////////////////////////////////////////////////////////////////////
// Receives the scene camera video through OpenCV.
//
/////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "app.h"
#include "video_receiver.h"

using namespace std;
using namespace std::chrono;


static bool is_camera_index(const string &source) {
    return !source.empty() &&
        all_of(source.begin(), source.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)) != 0; });
}

// Parses a camera index, throwing AppError when it's out of range.
static int camera_index(const string &source) {
    try {
        return stoi(source);
    } catch (const std::logic_error &) {
        throw AppError("Invalid camera index " + source);
    }
}


VideoReceiver::VideoReceiver(const string &source, int width, int height) {
    m_source = source;
    m_width = width;
    m_height = height;
    m_frame_index = 0;
}

VideoReceiver::~VideoReceiver() {
    close();
}

// Opens the video source. Camera sources are asked for the configured
// resolution; files and streams keep their own.
void VideoReceiver::open() {
    if (m_capture.isOpened())
        return;

    bool ok;
    try {
        if (is_camera_index(m_source)) {
            ok = m_capture.open(camera_index(m_source));
            if (ok && m_width > 0 && m_height > 0) {
                m_capture.set(cv::CAP_PROP_FRAME_WIDTH, m_width);
                m_capture.set(cv::CAP_PROP_FRAME_HEIGHT, m_height);
            }
        } else {
            ok = m_capture.open(m_source);
        }
    } catch (const cv::Exception &e) {
        m_capture.release();
        throw AppError("Failed to open video source " + m_source + ": " + e.what());
    }

    if (!ok || !m_capture.isOpened())
        throw AppError("Failed to open video source " + m_source);

    m_frame_index = 0;
    info("Video source " + m_source + " opened at " +
         to_string(static_cast<int>(m_capture.get(cv::CAP_PROP_FRAME_WIDTH))) + "x" +
         to_string(static_cast<int>(m_capture.get(cv::CAP_PROP_FRAME_HEIGHT))));
}

void VideoReceiver::close() {
    if (m_capture.isOpened())
        m_capture.release();
}

bool VideoReceiver::is_open() const {
    return m_capture.isOpened();
}

// Reads the next frame. Returns false at end of stream or on a read error.
bool VideoReceiver::read(cv::Mat &frame, video_frame_info_t *frame_info) {
    if (!m_capture.isOpened() || !m_capture.read(frame) || frame.empty())
        return false;

    if (frame_info) {
        frame_info->frame_index = m_frame_index;
        frame_info->unixtime_us = time_point_cast<microseconds>(
            system_clock::now()).time_since_epoch().count();
    }
    m_frame_index++;

    return true;
}


/////////////////////////////////////////////////////////////////////////////
// Frame helpers

cv::Mat decode_frame(const vector<uint8_t> &buf) {
    if (buf.empty())
        return cv::Mat();

    return cv::imdecode(buf, cv::IMREAD_COLOR);
}

cv::Mat resize_to_width(const cv::Mat &img, int width) {
    if (img.empty() || img.cols == width)
        return img;

    double ratio = static_cast<double>(width) / img.cols;
    cv::Mat resized;
    cv::resize(img, resized, cv::Size(width, static_cast<int>(img.rows * ratio)),
               0, 0, cv::INTER_AREA);
    return resized;
}
