/////////////////////////////////////////////////////////////////////////////
// Receives the scene camera video: either a local camera (by index) or any
// file/URL OpenCV can open.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_VIDEO_RECEIVER_H
#define GAZEGUARD_VIDEO_RECEIVER_H

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>


typedef struct video_frame_info {
        int64_t frame_index;
        int64_t unixtime_us;
	    } video_frame_info_t;


class VideoReceiver {
    public:
        VideoReceiver(const std::string &source, int width, int height);
        ~VideoReceiver();

        void open();
        void close();
        bool is_open() const;
        bool read(cv::Mat &frame, video_frame_info_t *frame_info=NULL);
        const std::string& source() const { return m_source; }

    private:
        std::string m_source;
        int m_width;
        int m_height;
        int64_t m_frame_index;
        cv::VideoCapture m_capture;
};


// Decodes an encoded (e.g. JPEG) frame buffer. Empty if not decodable.
cv::Mat decode_frame(const std::vector<uint8_t> &buf);

// Resizes img to the given width, keeping its aspect ratio.
cv::Mat resize_to_width(const cv::Mat &img, int width);


#endif // Top-level include guard
