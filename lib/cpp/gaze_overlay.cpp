/////////////////////////////////////////////////////////////////////////////
// Per-frame annotation of the scene video.
//
/////////////////////////////////////////////////////////////////////////////

#include <opencv2/imgproc.hpp>

#include "gaze_overlay.h"
#include "video_receiver.h"

using namespace std;


#define MARKER_THICKNESS 2
#define CENTROID_RADIUS 4
#define PERSON_BOX_THICKNESS 2
#define PERSON_LABEL_SCALE 0.5
#define PERSON_LABEL_OFFSET 10


static cv::Scalar to_scalar(const vector<int> &bgr) {
    return cv::Scalar(bgr[0], bgr[1], bgr[2]);
}

overlay_style_t overlay_style_from_config(const app_config_t &cfg) {
    overlay_style_t style;
    style.marker_size = cfg.marker_size;
    style.marker_color = to_scalar(cfg.marker_color);
    style.secondary_marker_size = cfg.secondary_marker_size;
    style.secondary_marker_color = to_scalar(cfg.secondary_marker_color);
    style.text_org = cv::Point(cfg.text_org[0], cfg.text_org[1]);
    style.text_color = to_scalar(cfg.text_color);
    style.font_scale = cfg.font_scale;
    style.text_thickness = cfg.text_thickness;
    return style;
}

pedestrian_params_t pedestrian_params_from_config(const app_config_t &cfg) {
    pedestrian_params_t params;
    params.frame_width = cfg.frame_width;
    params.seen_margin_px = cfg.seen_margin_px;
    params.seen_dwell_frames = cfg.seen_dwell_frames;
    params.close_height_ratio = cfg.close_height_ratio;
    return params;
}


/////////////////////////////////////////////////////////////////////////////
// Drawing

string gaze_text(const gaze_pixel_t &gaze) {
    if (!gaze.valid)
        return "nan, nan";

    return to_string(gaze.x_coord) + ", " + to_string(gaze.y_coord);
}

void draw_gaze_text(cv::Mat &img, const gaze_pixel_t &gaze, const overlay_style_t &style) {
    cv::putText(img,
                gaze_text(gaze),
                style.text_org,
                cv::FONT_HERSHEY_SIMPLEX,
                style.font_scale,
                style.text_color,
                style.text_thickness,
                cv::LINE_AA);
}

// Marks the gaze point with an inner and an outer ring. Nothing is drawn for
// an invalid gaze point.
void draw_gaze_marker(cv::Mat &img, const gaze_pixel_t &gaze, const overlay_style_t &style) {
    if (!gaze.valid)
        return;

    cv::Point center(gaze.x_coord, gaze.y_coord);
    cv::circle(img, center, style.marker_size, style.marker_color, MARKER_THICKNESS);
    cv::circle(img, center, style.secondary_marker_size,
               style.secondary_marker_color, MARKER_THICKNESS);
}

void draw_person(cv::Mat &img, const Person &person, person_status_t status) {
    cv::putText(img,
                "ID " + to_string(person.id),
                cv::Point(person.centroid.x - PERSON_LABEL_OFFSET,
                          person.centroid.y - PERSON_LABEL_OFFSET),
                cv::FONT_HERSHEY_SIMPLEX,
                PERSON_LABEL_SCALE,
                PERSON_LABEL_COLOR,
                2);
    cv::circle(img, person.centroid, CENTROID_RADIUS, PERSON_LABEL_COLOR, cv::FILLED);

    cv::Scalar color;
    switch (status) {
        case PERSON_SEEN: color = PERSON_SEEN_COLOR; break;
        case PERSON_ALERT: color = PERSON_ALERT_COLOR; break;
        default: color = PERSON_UNSEEN_COLOR; break;
    }

    const cv::Rect &box = person.rect.box;
    cv::rectangle(img, box.tl(), box.br(), color, PERSON_BOX_THICKNESS);
}


/////////////////////////////////////////////////////////////////////////////
// GazeOverlay

GazeOverlay::GazeOverlay(const overlay_style_t &style) {
    m_style = style;
}

gaze_pixel_t GazeOverlay::process(cv::Mat &frame, const gaze_point_t &gaze) {
    gaze_pixel_t px = gaze_to_frame(gaze, frame.cols, frame.rows);

    draw_gaze_text(frame, px, m_style);
    draw_gaze_marker(frame, px, m_style);

    return px;
}


/////////////////////////////////////////////////////////////////////////////
// PedestrianOverlay

PedestrianOverlay::PedestrianOverlay(shared_ptr<PedestrianDetector> detector,
                                     const CentroidTracker &tracker,
                                     const overlay_style_t &style,
                                     const pedestrian_params_t &params)
    : m_detector(detector), m_tracker(tracker) {
    m_style = style;
    m_params = params;
}

// Decides how to show a person: seen (now or earlier), or unseen and either
// close enough to alert on or not.
person_status_t PedestrianOverlay::classify(
    Person &person, const gaze_pixel_t &gaze, int frame_height) {
    if (person.is_seen)
        return PERSON_SEEN;

    if (person.is_person_seen(gaze, m_params.seen_margin_px, m_params.seen_dwell_frames))
        return PERSON_SEEN;

    if (person.is_person_close(frame_height, m_params.close_height_ratio))
        return PERSON_ALERT;

    return PERSON_UNSEEN;
}

overlay_result_t PedestrianOverlay::process(const cv::Mat &frame, const gaze_point_t &gaze) {
    overlay_result_t result;
    result.n_alert = 0;
    result.alert = false;

    result.image = resize_to_width(frame, m_params.frame_width).clone();
    cv::Mat &image = result.image;

    // Gaze is mapped onto the resized frame the people are detected in
    result.gaze = gaze_to_frame(gaze, image.cols, image.rows);

    vector<detection_t> detections = m_detector->detect(image);
    m_tracker.update(detections);
    person_map_t &objects = m_tracker.objects();
    result.events = m_tracker.events();
    result.n_tracked = static_cast<int>(objects.size());

    set<int> alerting;
    for (auto &kv : objects) {
        Person &person = kv.second;
        bool was_seen = person.is_seen;

        person_status_t status = classify(person, result.gaze, image.rows);
        draw_person(image, person, status);

        if (!was_seen && person.is_seen) {
            track_event_t ev = {TRACK_EVENT_SEEN, person.id, person.rect.box};
            result.events.push_back(ev);
        }

        if (status == PERSON_ALERT) {
            result.n_alert++;
            alerting.insert(person.id);

            if (!m_alerting.count(person.id)) {
                track_event_t ev = {TRACK_EVENT_ALERT, person.id, person.rect.box};
                result.events.push_back(ev);
            }
        }
    }

    m_alerting = alerting;
    result.alert = result.n_alert > 0;

    draw_gaze_text(image, result.gaze, m_style);
    draw_gaze_marker(image, result.gaze, m_style);

    return result;
}
