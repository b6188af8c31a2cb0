/////////////////////////////////////////////////////////////////////////////
// The frontend: gaze source, scene video and log session lifecycle.
//
/////////////////////////////////////////////////////////////////////////////

#include "app.h"
#include "frontend.h"

using namespace std;


Frontend::Frontend(shared_ptr<GazeSource> gaze_source,
                   shared_ptr<VideoReceiver> video_receiver,
                   shared_ptr<LogSession> log_session,
                   int gaze_buff_sz,
                   int gaze_smooth_over,
                   int gaze_stream_rate_hz)
    : m_gaze_source(gaze_source),
      m_video(video_receiver),
      m_log_session(log_session),
      m_gaze_stream(gaze_buff_sz, gaze_smooth_over) {
    m_gaze_stream_rate_hz = gaze_stream_rate_hz;
    m_started = false;
    m_shutdown = false;
    m_connected = false;
}

Frontend::~Frontend() {
    shutdown();
}

// Taps into the gaze stream. The rest of the session is brought up by
// poll_connect() once the source reports a connection.
void Frontend::start() {
    if (m_started)
        return;

    GazeStream *stream = &m_gaze_stream;
    bool ok = m_gaze_source->start([stream](const gaze_point_t &gp) {
        stream->enque_gaze_data(gp);
    });
    if (!ok)
        throw AppError("Failed to start the gaze stream");

    m_started = true;
    poll_connect();
}

// Runs the connect handler iff the gaze source has connected since the last
// call. Returns the frontend's connected state.
bool Frontend::poll_connect() {
    if (!m_connected && m_started && !m_shutdown && m_gaze_source->connected())
        handle_connect_response();

    return m_connected;
}

// Sets the gaze stream rate, starts the camera and the log session, then
// flags the frontend as connected.
void Frontend::handle_connect_response() {
    m_gaze_source->set_stream_rate(m_gaze_stream_rate_hz);

    try {
        m_video->open();
    } catch (const AppError &e) {
        handle_camera_start_response(e.what());
    }

    if (m_log_session)
        m_log_session->start();

    m_connected = true;
}

// Ends the session if the camera couldn't be started.
void Frontend::handle_camera_start_response(const string &err) {
    error("Camera start error: " + err);
    shutdown();
    throw AppError("Camera start error: " + err);
}

// Stops the video stream, camera capture, log session then the gaze source.
// Safe to call more than once.
void Frontend::shutdown() {
    if (m_shutdown)
        return;
    m_shutdown = true;

    m_video->close();

    if (m_log_session) {
        log_gaze();
        m_log_session->stop();
    }

    m_gaze_source->stop();
    m_connected = false;
}

gaze_point_t Frontend::gaze() {
    return m_gaze_stream.current();
}

// Hands the samples received since the last call to the log session.
void Frontend::log_gaze() {
    vector<gaze_point_t> samples = m_gaze_stream.drain();
    if (m_log_session && !samples.empty())
        m_log_session->log_gaze(samples);
}

void Frontend::log_event(int64_t unixtime_us, const track_event_t &event) {
    if (m_log_session)
        m_log_session->log_event(unixtime_us, event);
}

