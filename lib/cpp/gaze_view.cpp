/////////////////////////////////////////////////////////////////////////////
// Displays the scene camera video with the user's gaze point marked on it,
// printing the gaze coordinates for each frame. Press 'q' to quit.
//
// Usage: gaze_view [--config path] [--video source] [--gaze-replay csv]
//
/////////////////////////////////////////////////////////////////////////////

#include "app.h"
#include "frontend.h"
#include "gaze_viewer.h"

using namespace std;


int main(int argc, char **argv) {
    try {
        app_args_t args;
        if (!app_parse_args(argc, argv, "Usage: gaze_view [options]", &args))
            return 0;

        app_config_load(args.config_path);
        app_config_t cfg = app_config_from_yaml();

        install_signal_handlers();

        GazeViewer viewer(make_frontend(cfg, args),
                          overlay_style_from_config(cfg),
                          cfg.window_name);
        viewer.set_print_gaze(true);

        return viewer.run();
    } catch (const AppError &e) {
        error(e.what());
        return 1;
    } catch (const std::exception &e) {
        error(e.what());
        return 1;
    }
}
