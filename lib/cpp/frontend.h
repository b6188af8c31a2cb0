/////////////////////////////////////////////////////////////////////////////
// The frontend ties the gaze source, the scene video and the log session
// together: it brings them up once the eye tracker is connected and tears
// them down in order on shutdown.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_FRONTEND_H
#define GAZEGUARD_FRONTEND_H

#include <atomic>
#include <memory>
#include <string>

#include "app.h"
#include "gaze_source.h"
#include "log_session.h"
#include "video_receiver.h"


class Frontend {
    public:
        Frontend(std::shared_ptr<GazeSource> gaze_source,
                 std::shared_ptr<VideoReceiver> video_receiver,
                 std::shared_ptr<LogSession> log_session,
                 int gaze_buff_sz,
                 int gaze_smooth_over,
                 int gaze_stream_rate_hz);
        ~Frontend();

        void start();
        bool poll_connect();
        void shutdown();
        bool connected() const { return m_connected; }

        gaze_point_t gaze();
        void log_gaze();
        void log_event(int64_t unixtime_us, const track_event_t &event);

        GazeStream& gaze_stream() { return m_gaze_stream; }
        VideoReceiver& video() { return *m_video; }

    private:
        void handle_connect_response();
        void handle_camera_start_response(const std::string &error);

        std::shared_ptr<GazeSource> m_gaze_source;
        std::shared_ptr<VideoReceiver> m_video;
        std::shared_ptr<LogSession> m_log_session;
        GazeStream m_gaze_stream;
        int m_gaze_stream_rate_hz;
        bool m_started;
        bool m_shutdown;
        std::atomic<bool> m_connected;
};


// Builds the frontend the gaze programs run on: the eye tracker (or a gaze
// replay when args name one), the configured video source and, iff enabled,
// the log session.
std::shared_ptr<Frontend> make_frontend(const app_config_t &cfg, const app_args_t &args);


#endif // Top-level include guard
