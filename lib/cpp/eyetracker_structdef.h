/////////////////////////////////////////////////////////////////////////////
// Misc structs for use by the eyetracker and gaze modules.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_EYETRACKER_STRUCTDEF_H
#define GAZEGUARD_EYETRACKER_STRUCTDEF_H

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>


// A single gaze sample. Coords are normalized to the scene image, (0, 0) at
// the top-left and (1, 1) at the bottom-right. Invalid samples are NaN.
typedef struct gaze_point {
        int64_t unixtime_us;
        float x_normed;
        float y_normed;
	    } gaze_point_t;

// A gaze point mapped onto a frame, in pixels.
typedef struct gaze_pixel {
        bool valid;
        int x_coord;
        int y_coord;
	    } gaze_pixel_t;


inline gaze_point_t gaze_invalid(int64_t unixtime_us = 0) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    gaze_point_t gp = {unixtime_us, nan, nan};
    return gp;
}

inline bool gaze_is_valid(const gaze_point_t &gp) {
    return !(std::isnan(gp.x_normed) || std::isnan(gp.y_normed));
}

// Off-frame gaze is clamped to within a frame's size of the frame's edges.
#define GAZE_OFF_FRAME_MIN -1.0
#define GAZE_OFF_FRAME_MAX 2.0

// Maps a normalized gaze point onto a frame of the given size.
inline gaze_pixel_t gaze_to_frame(const gaze_point_t &gp, int width, int height) {
    gaze_pixel_t px = {false, 0, 0};

    if (!gaze_is_valid(gp))
        return px;

    double x = std::max(GAZE_OFF_FRAME_MIN, std::min<double>(gp.x_normed, GAZE_OFF_FRAME_MAX));
    double y = std::max(GAZE_OFF_FRAME_MIN, std::min<double>(gp.y_normed, GAZE_OFF_FRAME_MAX));

    px.valid = true;
    px.x_coord = static_cast<int>(x * width);
    px.y_coord = static_cast<int>(y * height);
    return px;
}


#endif // Top-level include guard
