/////////////////////////////////////////////////////////////////////////////
// A gaze source that replays a recorded CSV of gaze samples, for running the
// viewers against a video file without an eye tracker attached.
//
// CSV rows: unixtime_us, x_normed, y_normed ("nan" marks invalid samples)
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_GAZE_REPLAY_H
#define GAZEGUARD_GAZE_REPLAY_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <boost/thread.hpp>

#include "gaze_source.h"


std::vector<gaze_point_t> load_gaze_csv(const std::string &file_path);
void gaze_data_tocsv(const std::string &file_path, const std::vector<gaze_point_t> &samples);


class GazeReplay : public GazeSource {
    public:
        GazeReplay(const std::vector<gaze_point_t> &samples, bool loop=false);
        ~GazeReplay();

        bool start(gaze_callback_t cb);
        void stop();
        bool connected() const;
        bool set_stream_rate(int hz);
        bool finished() const;
        int64_t period_us() const { return m_period_us; }

    private:
        void replay();

        std::vector<gaze_point_t> m_samples;
        bool m_loop;
        int64_t m_period_us;
        gaze_callback_t m_callback;
        std::atomic<bool> m_running;
        std::atomic<bool> m_finished;
        std::shared_ptr<boost::thread> m_async_replayer;
};


#endif // Top-level include guard
