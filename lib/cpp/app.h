/////////////////////////////////////////////////////////////////////////////
// Misc application level helpers: config access and console logging.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_APP_H
#define GAZEGUARD_APP_H

#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>


#define CONFIG_FILE_PATH "/opt/app/src/config.yaml"


// Raised on unrecoverable setup failures (config, device, model, video, db).
class AppError : public std::runtime_error {
    public:
        explicit AppError(const std::string &what)
            : std::runtime_error(what) {}
};


// The application's config, as loaded by app_config_load().
// Usage ex: app_cfg<string>("VIDEO_SOURCE", "1")
extern YAML::Node APP_CFG;

void app_config_load(const std::string &path);
void app_config_set(const YAML::Node &node);

// Returns APP_CFG[key] as T, or fallback if the key is absent.
template <typename T>
T app_cfg(const std::string &key, const T &fallback) {
    const YAML::Node &cfg = APP_CFG;
    const YAML::Node node = cfg[key];
    if (!node.IsDefined() || node.IsNull())
        return fallback;

    try {
        return node.as<T>();
    } catch (const YAML::Exception &) {
        throw AppError("Config key " + key + " has an invalid value");
    }
}


// Typed snapshot of the keys used by the gaze programs.
typedef struct app_config {
    // Eye tracker
    std::string license_path;
    std::string calib_path;
    int gaze_stream_rate_hz;
    int gaze_buff_sz;
    int gaze_smooth_over;

    // Scene video
    std::string video_source;
    int video_width;
    int video_height;
    int frame_width;

    // Overlay
    int marker_size;
    std::vector<int> marker_color;
    int secondary_marker_size;
    std::vector<int> secondary_marker_color;
    std::vector<int> text_org;
    std::vector<int> text_color;
    double font_scale;
    int text_thickness;
    std::string window_name;

    // Pedestrian detector
    std::string detector_cfg_path;
    std::string detector_weights_path;
    std::string detector_names_path;
    float detector_min_confidence;
    float detector_nms_threshold;
    int detector_input_size;

    // Pedestrian tracker
    int tracker_max_disappeared;
    double tracker_max_distance;
    int seen_margin_px;
    int seen_dwell_frames;
    double close_height_ratio;

    // Audio alert
    bool alert_enabled;
    std::string alert_player_cmd;
    std::string alert_sound_path;

    // Log session
    bool log_session_enabled;
    std::string log_session_db_path;
    int log_session_write_freq;
} app_config_t;

app_config_t app_config_from_yaml();


// Command line shared by the gaze programs.
typedef struct app_args {
    std::string config_path;
    std::string video_source;
    std::string gaze_replay_path;
    bool gaze_replay_loop;
} app_args_t;

// Parses argv into args. Returns false if the program should exit (--help).
bool app_parse_args(int argc, char **argv, const std::string &usage, app_args_t *args);


// Console output, prefixed and colored per the ANSII_ESC_* config keys.
void info(const std::string &s);
void warn(const std::string &s);
void error(const std::string &s);
void bold(const std::string &s);


#endif // Top-level include guard
