/////////////////////////////////////////////////////////////////////////////
// Misc application level helpers: config access and console logging.
//
/////////////////////////////////////////////////////////////////////////////

#include <iostream>

#include <boost/program_options.hpp>

#include "app.h"

using namespace std;

namespace po = boost::program_options;


YAML::Node APP_CFG = YAML::Node(YAML::NodeType::Map);


// Loads the application's config from the given yaml file into APP_CFG.
void app_config_load(const string &path) {
    try {
        APP_CFG = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        throw AppError("Config file not found: " + path);
    } catch (const YAML::ParserException &e) {
        throw AppError("Config file malformed: " + path + " (" + e.what() + ")");
    }

    if (!APP_CFG.IsMap())
        throw AppError("Config file is not a key/value map: " + path);
}

// Replaces APP_CFG with the given node. Used by tests and the replay tools.
void app_config_set(const YAML::Node &node) {
    APP_CFG = node;
}

app_config_t app_config_from_yaml() {
    app_config_t cfg;

    cfg.license_path = app_cfg<string>("EYETRACKER_LICENSE_PATH", "");
    cfg.calib_path = app_cfg<string>("EYETRACKER_CALIB_PATH", "");
    cfg.gaze_stream_rate_hz = app_cfg<int>("GAZE_STREAM_RATE_HZ", 125);
    cfg.gaze_buff_sz = app_cfg<int>("GAZE_BUFF_SZ", 256);
    cfg.gaze_smooth_over = app_cfg<int>("GAZE_SMOOTH_OVER", 1);

    cfg.video_source = app_cfg<string>("VIDEO_SOURCE", "1");
    cfg.video_width = app_cfg<int>("VIDEO_WIDTH", 1280);
    cfg.video_height = app_cfg<int>("VIDEO_HEIGHT", 720);
    cfg.frame_width = app_cfg<int>("FRAME_WIDTH", 640);

    cfg.marker_size = app_cfg<int>("MARKER_SIZE", 5);
    cfg.marker_color = app_cfg<vector<int>>("MARKER_COLOR", {0, 250, 50});
    cfg.secondary_marker_size = app_cfg<int>("SECONDARY_MARKER_SIZE", 20);
    cfg.secondary_marker_color = app_cfg<vector<int>>(
        "SECONDARY_MARKER_COLOR", {250, 0, 0});
    cfg.text_org = app_cfg<vector<int>>("TEXT_ORG", {50, 50});
    cfg.text_color = app_cfg<vector<int>>("TEXT_COLOR", {0, 0, 255});
    cfg.font_scale = app_cfg<double>("FONT_SCALE", 0.5);
    cfg.text_thickness = app_cfg<int>("TEXT_THICKNESS", 2);
    cfg.window_name = app_cfg<string>("WINDOW_NAME", "preview");

    cfg.detector_cfg_path = app_cfg<string>("DETECTOR_CFG_PATH", "yolov4-tiny.cfg");
    cfg.detector_weights_path = app_cfg<string>(
        "DETECTOR_WEIGHTS_PATH", "yolov4-tiny.weights");
    cfg.detector_names_path = app_cfg<string>("DETECTOR_NAMES_PATH", "coco.names");
    cfg.detector_min_confidence = app_cfg<float>("DETECTOR_MIN_CONFIDENCE", 0.2f);
    cfg.detector_nms_threshold = app_cfg<float>("DETECTOR_NMS_THRESHOLD", 0.3f);
    cfg.detector_input_size = app_cfg<int>("DETECTOR_INPUT_SIZE", 416);

    cfg.tracker_max_disappeared = app_cfg<int>("TRACKER_MAX_DISAPPEARED", 50);
    cfg.tracker_max_distance = app_cfg<double>("TRACKER_MAX_DISTANCE", -1.0);
    cfg.seen_margin_px = app_cfg<int>("SEEN_MARGIN_PX", 0);
    cfg.seen_dwell_frames = app_cfg<int>("SEEN_DWELL_FRAMES", 1);
    cfg.close_height_ratio = app_cfg<double>("CLOSE_HEIGHT_RATIO", 0.5);

    cfg.alert_enabled = app_cfg<bool>("ALERT_ENABLED", true);
    cfg.alert_player_cmd = app_cfg<string>("ALERT_PLAYER_CMD", "mpg123 -q");
    cfg.alert_sound_path = app_cfg<string>(
        "ALERT_SOUND_PATH", "/sound/soundeffect.mp3");

    cfg.log_session_enabled = app_cfg<bool>("LOG_SESSION_ENABLED", true);
    cfg.log_session_db_path = app_cfg<string>(
        "LOG_SESSION_DB_PATH", "gaze_session.db");
    cfg.log_session_write_freq = app_cfg<int>("LOG_SESSION_WRITE_FREQ", 125);

    // Sanity checks on values the pipeline divides or indexes by
    if (cfg.gaze_buff_sz < 1 || cfg.gaze_smooth_over < 1)
        throw AppError("GAZE_BUFF_SZ and GAZE_SMOOTH_OVER must be positive");
    if (cfg.frame_width < 1)
        throw AppError("FRAME_WIDTH must be positive");
    if (cfg.seen_dwell_frames < 1)
        throw AppError("SEEN_DWELL_FRAMES must be positive");
    if (cfg.marker_color.size() != 3 || cfg.secondary_marker_color.size() != 3 ||
        cfg.text_color.size() != 3)
        throw AppError("Colors must be given as [b, g, r]");
    if (cfg.text_org.size() != 2)
        throw AppError("TEXT_ORG must be given as [x, y]");

    return cfg;
}


/////////////////////////////////////////////////////////////////////////////
// Command line

bool app_parse_args(int argc, char **argv, const string &usage, app_args_t *args) {
    po::options_description desc(usage + "\n\nOptions");
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<string>(&args->config_path)->default_value(CONFIG_FILE_PATH),
            "Config file path")
        ("video,v", po::value<string>(&args->video_source)->default_value(""),
            "Video source, a camera index or file/URL (overrides VIDEO_SOURCE)")
        ("gaze-replay,g", po::value<string>(&args->gaze_replay_path)->default_value(""),
            "Replay gaze from the given csv instead of the eye tracker")
        ("loop", po::bool_switch(&args->gaze_replay_loop),
            "Loop the gaze replay");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        throw AppError(string("Invalid arguments: ") + e.what());
    }

    if (vm.count("help")) {
        cout << desc << endl;
        return false;
    }

    return true;
}


/////////////////////////////////////////////////////////////////////////////
// Console output

// Prints the given string to stdout, formatted as an info str.
void info(const string &s) {
    cout << app_cfg<string>("ANSII_ESC_OK", "\033[92m");
    cout << "INFO: " << app_cfg<string>("ANSII_ESC_ENDCOLOR", "\033[0m");
    cout << s << endl;
}

// Prints the given string to stdout, formatted as a warning.
void warn(const string &s) {
    cout << app_cfg<string>("ANSII_ESC_WARNING", "\033[93m");
    cout << "WARN: " << app_cfg<string>("ANSII_ESC_ENDCOLOR", "\033[0m");
    cout << s << endl;
}

// Prints the given string to stderr, formatted as an error.
void error(const string &s) {
    cerr << app_cfg<string>("ANSII_ESC_ERROR", "\033[91m");
    cerr << "ERROR: " << app_cfg<string>("ANSII_ESC_ENDCOLOR", "\033[0m");
    cerr << s << endl;
}

// Prints the given string to stdout in bold.
void bold(const string &s) {
    cout << app_cfg<string>("ANSII_ESC_BOLD", "\033[1m");
    cout << s << app_cfg<string>("ANSII_ESC_ENDCOLOR", "\033[0m") << endl;
}
