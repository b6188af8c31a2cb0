/////////////////////////////////////////////////////////////////////////////
// The viewer window and its frame loop.
//
/////////////////////////////////////////////////////////////////////////////

#include <csignal>
#include <iostream>

#include <boost/thread.hpp>
#include <opencv2/highgui.hpp>

#include "app.h"
#include "gaze_viewer.h"

using namespace std;


#define CONNECT_POLL_MS 10

static volatile sig_atomic_t exited = 0;

static void signal_handler(int) {
    exited = 1;
}

void install_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
}

bool exit_requested() {
    return exited != 0;
}


GazeViewer::GazeViewer(shared_ptr<Frontend> frontend,
                       const overlay_style_t &style,
                       const string &window_name)
    : m_frontend(frontend), m_gaze_overlay(style) {
    m_window_name = window_name;
    m_print_gaze = false;
    m_alert = false;
    m_closed = false;
    m_window_shown = false;
}

GazeViewer::~GazeViewer() {
    close();
}

void GazeViewer::set_pedestrian_overlay(shared_ptr<PedestrianOverlay> overlay) {
    m_pedestrian_overlay = overlay;
}

void GazeViewer::set_alert_player(shared_ptr<AlertPlayer> player) {
    m_alert_player = player;
}

// Blocks until the frontend is connected. Returns false if interrupted first.
bool GazeViewer::wait_connected() {
    bold("Plug in your tracker and ensure the eye tracker runtime is running.");

    m_frontend->start();
    while (!m_frontend->poll_connect()) {
        if (exit_requested())
            return false;
        boost::this_thread::sleep_for(boost::chrono::milliseconds{CONNECT_POLL_MS});
    }

    info("Frontend connected.");
    return true;
}

// Annotates a single frame and returns the image to display. Tracking events
// are logged to the session and the alert sound follows the alert state.
cv::Mat GazeViewer::process_frame(const cv::Mat &frame, int64_t unixtime_us) {
    gaze_point_t gaze = m_frontend->gaze();
    cv::Mat image;

    if (m_pedestrian_overlay) {
        overlay_result_t result = m_pedestrian_overlay->process(frame, gaze);

        for (const track_event_t &ev : result.events)
            m_frontend->log_event(unixtime_us, ev);

        m_alert = result.alert;
        if (m_alert_player)
            m_alert_player->update(m_alert);

        image = result.image;
    } else {
        image = frame.clone();
        gaze_pixel_t px = m_gaze_overlay.process(image, gaze);

        if (m_print_gaze)
            cout << gaze_text(px) << endl;
    }

    m_frontend->log_gaze();
    return image;
}

// Runs the frame loop. Returns the process exit code.
int GazeViewer::run() {
    if (!wait_connected()) {
        close();
        return 0;
    }

    cv::Mat frame;
    video_frame_info_t frame_info;
    int rc = 0;

    while (!exit_requested()) {
        try {
            if (!m_frontend->video().read(frame, &frame_info)) {
                info("End of video stream.");
                break;
            }

            cv::Mat image = process_frame(frame, frame_info.unixtime_us);
            cv::imshow(m_window_name, image);
            m_window_shown = true;

            if ((cv::waitKey(1) & 0xFF) == QUIT_KEY)
                break;
        } catch (const cv::Exception &e) {
            error(string("Video frame processing failed: ") + e.what());
            rc = 1;
            break;
        }
    }

    close();
    return rc;
}

// Shuts the frontend down and closes the window.
void GazeViewer::close() {
    if (m_closed)
        return;
    m_closed = true;

    if (m_alert_player)
        m_alert_player->stop();

    m_frontend->shutdown();

    if (m_window_shown)
        cv::destroyAllWindows();
}
