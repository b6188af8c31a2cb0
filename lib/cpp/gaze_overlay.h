/////////////////////////////////////////////////////////////////////////////
// Per-frame annotation of the scene video: the gaze marker and coordinates,
// and for the pedestrian variant each tracked person colored by whether the
// user has looked at them.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_GAZE_OVERLAY_H
#define GAZEGUARD_GAZE_OVERLAY_H

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "app.h"
#include "eyetracker_structdef.h"
#include "pedestrian_detect.h"
#include "pedestrian_track.h"


#define PERSON_SEEN_COLOR cv::Scalar(0, 255, 0)
#define PERSON_ALERT_COLOR cv::Scalar(0, 0, 255)
#define PERSON_UNSEEN_COLOR cv::Scalar(0, 255, 255)
#define PERSON_LABEL_COLOR cv::Scalar(0, 255, 0)


typedef struct overlay_style {
        int marker_size;
        cv::Scalar marker_color;
        int secondary_marker_size;
        cv::Scalar secondary_marker_color;
        cv::Point text_org;
        cv::Scalar text_color;
        double font_scale;
        int text_thickness;
	    } overlay_style_t;

overlay_style_t overlay_style_from_config(const app_config_t &cfg);


enum person_status_t {
    PERSON_SEEN,
    PERSON_UNSEEN,
    PERSON_ALERT
};

std::string gaze_text(const gaze_pixel_t &gaze);
void draw_gaze_text(cv::Mat &img, const gaze_pixel_t &gaze, const overlay_style_t &style);
void draw_gaze_marker(cv::Mat &img, const gaze_pixel_t &gaze, const overlay_style_t &style);
void draw_person(cv::Mat &img, const Person &person, person_status_t status);


// The plain viewer: gaze coordinates and marker only.
class GazeOverlay {
    public:
        explicit GazeOverlay(const overlay_style_t &style);
        gaze_pixel_t process(cv::Mat &frame, const gaze_point_t &gaze);

    private:
        overlay_style_t m_style;
};


typedef struct overlay_result {
        cv::Mat image;
        gaze_pixel_t gaze;
        int n_tracked;
        int n_alert;
        bool alert;
        std::vector<track_event_t> events;
	    } overlay_result_t;

typedef struct pedestrian_params {
        int frame_width;
        int seen_margin_px;
        int seen_dwell_frames;
        double close_height_ratio;
	    } pedestrian_params_t;

pedestrian_params_t pedestrian_params_from_config(const app_config_t &cfg);


// The pedestrian variant: detect, track and classify the people in each
// frame. Seen state is kept per tracked person across frames.
class PedestrianOverlay {
    public:
        PedestrianOverlay(std::shared_ptr<PedestrianDetector> detector,
                          const CentroidTracker &tracker,
                          const overlay_style_t &style,
                          const pedestrian_params_t &params);

        overlay_result_t process(const cv::Mat &frame, const gaze_point_t &gaze);
        person_status_t classify(Person &person, const gaze_pixel_t &gaze, int frame_height);
        CentroidTracker& tracker() { return m_tracker; }

    private:
        std::shared_ptr<PedestrianDetector> m_detector;
        CentroidTracker m_tracker;
        overlay_style_t m_style;
        pedestrian_params_t m_params;
        std::set<int> m_alerting;
};


#endif // Top-level include guard
