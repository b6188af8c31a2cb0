/////////////////////////////////////////////////////////////////////////////
// Centroid tracking of detected pedestrians across frames, and the per-person
// state of whether the user has looked at them.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_PEDESTRIAN_TRACK_H
#define GAZEGUARD_PEDESTRIAN_TRACK_H

#include <map>
#include <vector>

#include <opencv2/core.hpp>

#include "eyetracker_structdef.h"
#include "pedestrian_detect.h"


class Person {
    public:
        int id;
        cv::Point centroid;
        detection_t rect;
        bool is_seen;
        int gaze_frames;

        Person();
        Person(int object_id, const detection_t &detection);

        bool is_person_seen(const gaze_pixel_t &gaze, int margin=0, int dwell=1);
        bool is_person_close(int frame_height, double height_ratio) const;
};


enum track_event_type_t {
    TRACK_EVENT_REGISTER,
    TRACK_EVENT_DEREGISTER,
    TRACK_EVENT_SEEN,
    TRACK_EVENT_ALERT
};

const char* track_event_name(track_event_type_t type);

typedef struct track_event {
        track_event_type_t type;
        int object_id;
        cv::Rect box;
	    } track_event_t;


typedef std::map<int, Person> person_map_t;

class CentroidTracker {
    public:
        CentroidTracker(int max_disappeared=50, double max_distance=-1);

        const person_map_t& update(const std::vector<detection_t> &detections);
        person_map_t& objects() { return m_objects; }
        const std::vector<track_event_t>& events() const { return m_events; }
        int disappeared(int object_id) const;

    private:
        void register_object(const detection_t &detection);
        void deregister_object(int object_id);
        void mark_disappeared(int object_id);

        int m_next_object_id;
        int m_max_disappeared;
        double m_max_distance;
        person_map_t m_objects;
        std::map<int, int> m_disappeared;
        std::vector<track_event_t> m_events;
};


#endif // Top-level include guard
