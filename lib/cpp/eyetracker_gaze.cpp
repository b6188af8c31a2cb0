/////////////////////////////////////////////////////////////////////////////
// A gaze source backed by the eye tracker's gaze point stream.
//
/////////////////////////////////////////////////////////////////////////////

#include "app.h"
#include "eyetracker_gaze.h"

using namespace std;


#define RECONNECT_INTERVAL_MS 500

static void cb_gaze_point(tobii_gaze_point_t const*, void*);


EyeTrackerGaze::EyeTrackerGaze(const string &license_path, const string &calib_path)
    : EyeTracker(license_path, calib_path) {
    m_connected = false;

    // Since we care about device timestamps, start time synchronization
    sync_device_time();
}

EyeTrackerGaze::~EyeTrackerGaze() {
    stop();
}

// Starts the async gaze thread
bool EyeTrackerGaze::start(gaze_callback_t cb) {
    if (m_async_streamer) {
        warn("Gaze stream start attempted but already running.");
        return false;
    }

    m_callback = cb;

    tobii_error_t error = tobii_gaze_point_subscribe(m_device, cb_gaze_point, this);
    if (error != NO_ERROR) {
        ::error("tobii_gaze_point_subscribe failed: " + tobii_error_str(error));
        return false;
    }

    m_connected = true;
    m_async_streamer = make_shared<boost::thread>(
        &EyeTrackerGaze::stream_gaze, this);

    return true;
}

// Stops the async gaze thread
void EyeTrackerGaze::stop() {
    if (!m_async_streamer)
        return;

    m_async_streamer->interrupt();
    m_async_streamer->join();
    m_async_streamer = NULL;

    tobii_error_t error = tobii_gaze_point_unsubscribe(m_device);
    if (error != NO_ERROR && error != TOBII_ERROR_NOT_SUBSCRIBED)
        warn("tobii_gaze_point_unsubscribe failed: " + tobii_error_str(error));

    m_connected = false;
}

bool EyeTrackerGaze::connected() const {
    return m_connected;
}

// Sets the device's gaze output frequency. Requires a config-level license on
// most devices.
bool EyeTrackerGaze::set_stream_rate(int hz) {
    tobii_error_t error = tobii_set_output_frequency(m_device, static_cast<float>(hz));
    if (error != NO_ERROR) {
        if (error == TOBII_ERROR_INSUFFICIENT_LICENSE)
            warn("Gaze stream rate unchanged (insufficient license).");
        else
            warn("Gaze stream rate unchanged: " + tobii_error_str(error));
        return false;
    }

    info("Gaze stream rate set to " + to_string(hz) + " Hz.");
    return true;
}

// Forwards a sample to the callback. Invalid samples are forwarded as NaN so
// consumers know the user isn't looking at the scene.
void EyeTrackerGaze::on_gaze_point(tobii_gaze_point_t const *gaze_point) {
    int64_t timestamp_us = devicetime_to_systime(gaze_point->timestamp_us);

    gaze_point_t gp = gaze_invalid(timestamp_us);
    if (gaze_point->validity == TOBII_VALIDITY_VALID) {
        gp.x_normed = gaze_point->position_xy[0];
        gp.y_normed = gaze_point->position_xy[1];
    }

    if (m_callback)
        m_callback(gp);
}

// Processes device callbacks until interrupted. Reconnects on connection loss.
void EyeTrackerGaze::stream_gaze() {
    try {
        while (true) {
            boost::this_thread::interruption_point();

            tobii_error_t error = tobii_wait_for_callbacks(1, &m_device);
            if (error == NO_ERROR || error == TOBII_ERROR_TIMED_OUT)
                error = tobii_device_process_callbacks(m_device);

            if (error == TOBII_ERROR_CONNECTION_FAILED) {
                if (m_connected)
                    warn("Eye tracker connection lost, reconnecting...");
                m_connected = false;

                if (tobii_device_reconnect(m_device) == NO_ERROR) {
                    info("Eye tracker reconnected.");
                    m_connected = true;
                } else {
                    boost::this_thread::sleep_for(
                        boost::chrono::milliseconds{RECONNECT_INTERVAL_MS});
                }
            } else if (error != NO_ERROR && error != TOBII_ERROR_TIMED_OUT) {
                ::error("Gaze stream stopped: " + tobii_error_str(error));
                m_connected = false;
                return;
            }
        }
    } catch (boost::thread_interrupted&) {}
}


/////////////////////////////////////////////////////////////////////////////
// Gaze point callback for use with tobii_gaze_point_subscribe().
// ASSUMES: user_data is a ptr to an object of type EyeTrackerGaze.
static void cb_gaze_point(tobii_gaze_point_t const *gaze_point, void *obj) {
    static_cast<EyeTrackerGaze*>(obj)->on_gaze_point(gaze_point);
}
