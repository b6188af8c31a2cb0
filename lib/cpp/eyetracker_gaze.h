/////////////////////////////////////////////////////////////////////////////
// A gaze source backed by the eye tracker's gaze point stream. Samples are
// received on an async thread, converted to system time and forwarded to
// the callback given to start().
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_EYETRACKER_GAZE_H
#define GAZEGUARD_EYETRACKER_GAZE_H

#include <atomic>
#include <memory>
#include <string>

#include <boost/thread.hpp>

#include "eyetracker.h"
#include "gaze_source.h"


class EyeTrackerGaze : public EyeTracker, public GazeSource {
    public:
        EyeTrackerGaze(const std::string &license_path, const std::string &calib_path);
        ~EyeTrackerGaze();

        bool start(gaze_callback_t cb);
        void stop();
        bool connected() const;
        bool set_stream_rate(int hz);

        void on_gaze_point(tobii_gaze_point_t const *gaze_point);
        void stream_gaze();

    private:
        gaze_callback_t m_callback;
        std::atomic<bool> m_connected;
        std::shared_ptr<boost::thread> m_async_streamer;
};


#endif // Top-level include guard
