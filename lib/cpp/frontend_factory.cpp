/////////////////////////////////////////////////////////////////////////////
// Builds a Frontend from the app config and the command line.
//
/////////////////////////////////////////////////////////////////////////////

#include "app.h"
#include "eyetracker_gaze.h"
#include "frontend.h"
#include "gaze_replay.h"

using namespace std;


shared_ptr<Frontend> make_frontend(const app_config_t &cfg, const app_args_t &args) {
    shared_ptr<GazeSource> gaze_source;
    if (!args.gaze_replay_path.empty()) {
        vector<gaze_point_t> samples = load_gaze_csv(args.gaze_replay_path);
        info("Replaying " + to_string(samples.size()) + " gaze samples from " +
             args.gaze_replay_path);
        gaze_source = make_shared<GazeReplay>(samples, args.gaze_replay_loop);
    } else {
        gaze_source = make_shared<EyeTrackerGaze>(cfg.license_path, cfg.calib_path);
    }

    string video_source = args.video_source.empty() ? cfg.video_source : args.video_source;
    shared_ptr<VideoReceiver> video = make_shared<VideoReceiver>(
        video_source, cfg.video_width, cfg.video_height);

    shared_ptr<LogSession> log_session;
    if (cfg.log_session_enabled)
        log_session = make_shared<LogSession>(
            cfg.log_session_db_path, cfg.log_session_write_freq);

    return make_shared<Frontend>(gaze_source,
                                 video,
                                 log_session,
                                 cfg.gaze_buff_sz,
                                 cfg.gaze_smooth_over,
                                 cfg.gaze_stream_rate_hz);
}
