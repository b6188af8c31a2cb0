/////////////////////////////////////////////////////////////////////////////
// The viewer window: receives the scene video, annotates each frame with the
// user's gaze (and, with a pedestrian overlay, the people around them) and
// displays it until the user presses 'q' or the stream ends.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_GAZE_VIEWER_H
#define GAZEGUARD_GAZE_VIEWER_H

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "alert_sound.h"
#include "frontend.h"
#include "gaze_overlay.h"


#define QUIT_KEY 'q'


class GazeViewer {
    public:
        GazeViewer(std::shared_ptr<Frontend> frontend,
                   const overlay_style_t &style,
                   const std::string &window_name);
        ~GazeViewer();

        void set_pedestrian_overlay(std::shared_ptr<PedestrianOverlay> overlay);
        void set_alert_player(std::shared_ptr<AlertPlayer> player);
        void set_print_gaze(bool enabled) { m_print_gaze = enabled; }

        bool wait_connected();
        int run();
        cv::Mat process_frame(const cv::Mat &frame, int64_t unixtime_us);
        void close();

        bool connected() const { return m_frontend->connected(); }
        bool alert() const { return m_alert; }

    private:
        std::shared_ptr<Frontend> m_frontend;
        GazeOverlay m_gaze_overlay;
        std::shared_ptr<PedestrianOverlay> m_pedestrian_overlay;
        std::shared_ptr<AlertPlayer> m_alert_player;
        std::string m_window_name;
        bool m_print_gaze;
        bool m_alert;
        bool m_closed;
        bool m_window_shown;
};


// Installs SIGINT/SIGTERM handlers that ask the viewer loop to exit.
void install_signal_handlers();
bool exit_requested();


#endif // Top-level include guard
