/////////////////////////////////////////////////////////////////////////////
// Displays the scene camera video with the user's gaze point and the people
// around them. Each tracked person is boxed green once the user has looked at
// them, yellow while unseen, and red while unseen and close, in which case
// the warning sound plays. Press 'q' to quit.
//
// Usage: gaze_guard [--config path] [--video source] [--gaze-replay csv]
//
/////////////////////////////////////////////////////////////////////////////

#include <memory>

#include "alert_sound.h"
#include "app.h"
#include "frontend.h"
#include "gaze_overlay.h"
#include "gaze_viewer.h"
#include "pedestrian_detect.h"
#include "pedestrian_track.h"

using namespace std;


int main(int argc, char **argv) {
    try {
        app_args_t args;
        if (!app_parse_args(argc, argv, "Usage: gaze_guard [options]", &args))
            return 0;

        app_config_load(args.config_path);
        app_config_t cfg = app_config_from_yaml();

        install_signal_handlers();

        // Load the detector before connecting, it's the slow part
        shared_ptr<PedestrianDetector> detector = make_shared<DnnPedestrianDetector>(
            cfg.detector_cfg_path,
            cfg.detector_weights_path,
            cfg.detector_names_path,
            cfg.detector_min_confidence,
            cfg.detector_nms_threshold,
            cfg.detector_input_size
        );

        overlay_style_t style = overlay_style_from_config(cfg);

        GazeViewer viewer(make_frontend(cfg, args), style, cfg.window_name);
        viewer.set_pedestrian_overlay(make_shared<PedestrianOverlay>(
            detector,
            CentroidTracker(cfg.tracker_max_disappeared, cfg.tracker_max_distance),
            style,
            pedestrian_params_from_config(cfg)
        ));

        if (cfg.alert_enabled)
            viewer.set_alert_player(make_shared<AlertPlayer>(
                cfg.alert_player_cmd, cfg.alert_sound_path));

        return viewer.run();
    } catch (const AppError &e) {
        error(e.what());
        return 1;
    } catch (const std::exception &e) {
        error(e.what());
        return 1;
    }
}
