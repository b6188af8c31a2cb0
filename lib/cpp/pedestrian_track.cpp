/////////////////////////////////////////////////////////////////////////////
// Centroid tracking of detected pedestrians across frames.
//
/////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>

#include "pedestrian_track.h"

using namespace std;


/////////////////////////////////////////////////////////////////////////////
// Person

Person::Person() {
    id = -1;
    rect = make_detection(0, cv::Rect());
    centroid = rect.centroid;
    is_seen = false;
    gaze_frames = 0;
}

Person::Person(int object_id, const detection_t &detection) {
    id = object_id;
    rect = detection;
    centroid = detection.centroid;
    is_seen = false;
    gaze_frames = 0;
}

// Updates the seen state from the current gaze point. The person counts as
// seen once the gaze has been within their box (grown by margin px) for dwell
// consecutive frames. Once seen, always seen.
bool Person::is_person_seen(const gaze_pixel_t &gaze, int margin, int dwell) {
    if (is_seen)
        return true;

    const cv::Rect &box = rect.box;
    cv::Rect grown(box.x - margin, box.y - margin,
                   box.width + 2 * margin, box.height + 2 * margin);

    if (gaze.valid && grown.contains(cv::Point(gaze.x_coord, gaze.y_coord)))
        gaze_frames++;
    else
        gaze_frames = 0;

    if (gaze_frames >= dwell)
        is_seen = true;

    return is_seen;
}

// A person is close when their box takes up at least height_ratio of the
// frame's height.
bool Person::is_person_close(int frame_height, double height_ratio) const {
    if (frame_height <= 0)
        return false;

    return rect.box.height >= height_ratio * frame_height;
}


const char* track_event_name(track_event_type_t type) {
    switch (type) {
        case TRACK_EVENT_REGISTER: return "REGISTER";
        case TRACK_EVENT_DEREGISTER: return "DEREGISTER";
        case TRACK_EVENT_SEEN: return "SEEN";
        case TRACK_EVENT_ALERT: return "ALERT";
    }
    return "UNKNOWN";
}


/////////////////////////////////////////////////////////////////////////////
// CentroidTracker

CentroidTracker::CentroidTracker(int max_disappeared, double max_distance) {
    m_next_object_id = 0;
    m_max_disappeared = max_disappeared;
    m_max_distance = max_distance;
}

int CentroidTracker::disappeared(int object_id) const {
    auto it = m_disappeared.find(object_id);
    return it == m_disappeared.end() ? -1 : it->second;
}

void CentroidTracker::register_object(const detection_t &detection) {
    int object_id = m_next_object_id++;

    m_objects[object_id] = Person(object_id, detection);
    m_disappeared[object_id] = 0;

    track_event_t ev = {TRACK_EVENT_REGISTER, object_id, detection.box};
    m_events.push_back(ev);
}

void CentroidTracker::deregister_object(int object_id) {
    track_event_t ev = {TRACK_EVENT_DEREGISTER, object_id, m_objects[object_id].rect.box};
    m_events.push_back(ev);

    m_objects.erase(object_id);
    m_disappeared.erase(object_id);
}

// Counts a frame the object went unmatched in, dropping it past the limit
void CentroidTracker::mark_disappeared(int object_id) {
    m_disappeared[object_id]++;

    if (m_disappeared[object_id] > m_max_disappeared)
        deregister_object(object_id);
}

// Matches the given detections against the tracked objects by nearest
// centroid and returns the tracked objects, by id.
const person_map_t& CentroidTracker::update(const vector<detection_t> &detections) {
    m_events.clear();

    // No detections: everything tracked went unseen this frame
    if (detections.empty()) {
        vector<int> ids;
        for (const auto &kv : m_disappeared)
            ids.push_back(kv.first);
        for (int object_id : ids)
            mark_disappeared(object_id);

        return m_objects;
    }

    // Nothing tracked yet: take every detection
    if (m_objects.empty()) {
        for (const detection_t &d : detections)
            register_object(d);

        return m_objects;
    }

    vector<int> object_ids;
    vector<cv::Point> object_centroids;
    for (const auto &kv : m_objects) {
        object_ids.push_back(kv.first);
        object_centroids.push_back(kv.second.centroid);
    }

    const size_t n_rows = object_ids.size();
    const size_t n_cols = detections.size();

    // Distance between each tracked centroid and each input centroid
    vector<vector<double>> D(n_rows, vector<double>(n_cols));
    vector<size_t> row_argmin(n_rows);
    vector<double> row_min(n_rows);
    for (size_t r = 0; r < n_rows; r++) {
        for (size_t c = 0; c < n_cols; c++) {
            double dx = object_centroids[r].x - detections[c].centroid.x;
            double dy = object_centroids[r].y - detections[c].centroid.y;
            D[r][c] = sqrt(dx * dx + dy * dy);
        }
        row_argmin[r] = min_element(D[r].begin(), D[r].end()) - D[r].begin();
        row_min[r] = D[r][row_argmin[r]];
    }

    // Visit rows closest-first, each taking its nearest input centroid
    vector<size_t> rows(n_rows);
    iota(rows.begin(), rows.end(), 0);
    stable_sort(rows.begin(), rows.end(),
        [&row_min](size_t a, size_t b) { return row_min[a] < row_min[b]; });

    set<size_t> used_rows;
    set<size_t> used_cols;

    for (size_t row : rows) {
        size_t col = row_argmin[row];

        if (used_rows.count(row) || used_cols.count(col))
            continue;
        if (m_max_distance >= 0 && D[row][col] > m_max_distance)
            continue;

        Person &person = m_objects[object_ids[row]];
        person.rect = detections[col];
        person.centroid = detections[col].centroid;
        m_disappeared[object_ids[row]] = 0;

        used_rows.insert(row);
        used_cols.insert(col);
    }

    for (size_t row = 0; row < n_rows; row++) {
        if (!used_rows.count(row))
            mark_disappeared(object_ids[row]);
    }

    for (size_t col = 0; col < n_cols; col++) {
        if (!used_cols.count(col))
            register_object(detections[col]);
    }

    return m_objects;
}
