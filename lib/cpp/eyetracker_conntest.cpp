// Connects to the default eye tracker, prints its details and a few gaze
// points.

#include <cstdio>
#include <string>

#include "app.h"
#include "eyetracker_gaze.h"

using namespace std;


#define N_SAMPLES 10
#define SAMPLE_TIMEOUT_MS 5000


int main(int argc, char **argv) {
    try {
        app_args_t args;
        if (!app_parse_args(argc, argv, "Usage: eyetracker_conntest [options]", &args))
            return 0;

        app_config_load(args.config_path);
        app_config_t cfg = app_config_from_yaml();

        EyeTrackerGaze gaze(cfg.license_path, cfg.calib_path);

        printf("\n*** Eye Tracking Device Detected!\n");
        gaze.print_device_info();

        GazeStream stream(N_SAMPLES, 1);
        if (!gaze.start([&stream](const gaze_point_t &gp) { stream.enque_gaze_data(gp); })) {
            error("Failed to start the gaze stream.");
            return 1;
        }

        printf("Device current gaze point:\n");
        bool received = gaze_wait_for_samples(stream, gaze, N_SAMPLES, SAMPLE_TIMEOUT_MS);
        bool still_connected = gaze.connected();
        gaze.stop();

        if (!received) {
            error("Received " + to_string(stream.total_received()) + " of " +
                  to_string(N_SAMPLES) + " gaze samples before " +
                  (still_connected ? "timing out." : "the device disconnected."));
            return 1;
        }

        for (const gaze_point_t &gp : stream.drain())
            printf("Gaze point: %f, %f\n", gp.x_normed, gp.y_normed);
    } catch (const AppError &e) {
        error(e.what());
        return 1;
    } catch (const std::exception &e) {
        error(e.what());
        return 1;
    }

    return 0;
}
