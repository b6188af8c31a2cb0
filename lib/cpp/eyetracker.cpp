/////////////////////////////////////////////////////////////////////////////
// An abstraction of an eye tracker device (Tobii Stream Engine).
//
/////////////////////////////////////////////////////////////////////////////

#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <vector>

#include "app.h"
#include "eyetracker.h"

using namespace std;
using namespace std::chrono;


static void sync_device_time_async(tobii_device_t *device);
static size_t read_license_file(const string &path, vector<uint16_t> *license);
static void single_url_receiver(char const *url, void *user_data);

/////////////////////////////////////////////////////////////////////////////
// Class

// Connects to the first local eye tracker. Opens it with elevated privileges
// iff a valid license file is given, else opens it unelevated.
EyeTracker::EyeTracker(const string &license_path, const string &calib_path) {
    m_license_path = license_path;
    m_calib_path = calib_path;
    m_device_time_offset = 0;
    m_device = NULL;
    m_api = NULL;
    m_is_elevated = false;

    // Instantiate eyetracker api
    tobii_error_t error = tobii_api_create(&m_api, NULL, NULL);
    if (error != NO_ERROR)
        throw AppError("tobii_api_create failed: " + tobii_error_str(error));

    char url[URL_MAX_LEN] = {0};
    error = tobii_enumerate_local_device_urls(m_api, single_url_receiver, url);
    if (error != NO_ERROR || *url == '\0') {
        tobii_api_destroy(m_api);
        throw AppError("No eye tracker found. Is the tracker plugged in?");
    }

    // Attempt to open the eyetracker with elevated privileges
    vector<uint16_t> license_key;
    size_t license_size = 0;
    if (!m_license_path.empty())
        license_size = read_license_file(m_license_path, &license_key);

    if (license_size > 0) {
        tobii_license_key_t license = {license_key.data(), license_size};
        tobii_license_validation_result_t validation_result =
            TOBII_LICENSE_VALIDATION_RESULT_TAMPERED;
        error = tobii_device_create_ex(m_api,
                                       url,
                                       &license,
                                       1,
                                       &validation_result,
                                       &m_device
        );

        if (error == NO_ERROR &&
            validation_result == TOBII_LICENSE_VALIDATION_RESULT_OK) {
            info("Using elevated eyetracking device.");
            m_is_elevated = true;
        } else {
            if (error != NO_ERROR)
                warn("tobii_device_create_ex failed: " + tobii_error_str(error) +
                     ". Using non-elevated device instead...");
            else if (validation_result == TOBII_LICENSE_VALIDATION_RESULT_EXPIRED)
                warn("License expired. Using non-elevated device instead...");
            else
                warn("License invalid. Using non-elevated device instead...");

            if (m_device) {
                tobii_device_destroy(m_device);
                m_device = NULL;
            }
        }
    }

    // If open elevated failed or wasn't requested, open in unelevated mode
    if (!m_is_elevated) {
        error = tobii_device_create(m_api, url, &m_device);
        if (error != NO_ERROR) {
            tobii_api_destroy(m_api);
            throw AppError("tobii_device_create failed: " + tobii_error_str(error));
        }
    }

    // Load calibration from file -- if no exist, will warn
    calibration_load();
}

EyeTracker::~EyeTracker() {
    // Cleanup the time synchronizer iff needed
    if (m_async_time_syncer) {
        m_async_time_syncer->interrupt();
        m_async_time_syncer->join();
    }

    tobii_error_t error = tobii_device_destroy(m_device);
    if (error != NO_ERROR)
        warn("tobii_device_destroy failed: " + tobii_error_str(error));

    error = tobii_api_destroy(m_api);
    if (error != NO_ERROR)
        warn("tobii_api_destroy failed: " + tobii_error_str(error));
}

// The device clock and the system clock it's connected to may drift over time
// therefore they need to be synchronized every ~30 seconds for accurate device
// timestamps. Calling this function will cause that to occur asynchronously.
void EyeTracker::sync_device_time() {
    if (m_async_time_syncer)
        return;  // No need to run multiple times

    //Establish device to system clock offset (in microseconds)
    int64_t device_now = 0;
    tobii_error_t error = tobii_system_clock(m_api, &device_now);
    if (error != NO_ERROR) {
        warn("tobii_system_clock failed: " + tobii_error_str(error));
        return;
    }

    m_device_time_offset =
        time_point_cast<microseconds>(system_clock::now()
            ).time_since_epoch().count() - device_now;

    m_async_time_syncer = make_shared<boost::thread>(
        sync_device_time_async, m_device);
}

// Given a device timestamp, returns the timestamp after applying the system
// clock offset to it. This is necessary because the device knows nothing
// about the epoch.
// Note: You MUST call sync_device_time at least once before using this.
int64_t EyeTracker::devicetime_to_systime(int64_t device_time) {
    return device_time + m_device_time_offset;
}

// Prints eyetracker device info
void EyeTracker::print_device_info() {
    tobii_device_info_t info;

    tobii_error_t error = tobii_get_device_info(m_device, &info);
    if (error != NO_ERROR) {
        warn("tobii_get_device_info failed: " + tobii_error_str(error));
        return;
    }

    printf("Device SN: %s\n", info.serial_number);
    printf("Device Model: %s\n", info.model);
    printf("Device Generation: %s\n", info.generation);
    printf("Device Firmware Ver: %s\n", info.firmware_version);
    printf("Device Calibration Ver: %s\n", info.hw_calibration_version);
    printf("Device Calibration Date: %s\n", info.hw_calibration_date);
    printf("Device Integration Type: %s\n", info.integration_type);
    printf("Device Runtime Build Ver: %s\n", info.runtime_build_version);

    print_feature_group();

    tobii_supported_t supported = TOBII_NOT_SUPPORTED;
    error = tobii_stream_supported(m_device, TOBII_STREAM_GAZE_POINT, &supported);
    if (error != NO_ERROR)
        warn("tobii_stream_supported failed: " + tobii_error_str(error));
    printf("Device supports stream gaze point: %s\n",
           supported == TOBII_SUPPORTED ? "True" : "False");
    printf("Device elevated: %s\n", m_is_elevated ? "True" : "False");

    float hz = 0;
    if (tobii_get_output_frequency(m_device, &hz) == NO_ERROR)
        printf("Device output frequency: %.1f Hz\n", hz);
}

// Prints the device's active feature group to stdout. Note that the feature
// group is mostly dependent on the license file loaded, if any.
void EyeTracker::print_feature_group() {
    tobii_feature_group_t feature_group;
    tobii_error_t error = tobii_get_feature_group(m_device, &feature_group);
    if (error != NO_ERROR) {
        warn("tobii_get_feature_group failed: " + tobii_error_str(error));
        return;
    }

    printf("Device Feature Group: ");
    if(feature_group == TOBII_FEATURE_GROUP_BLOCKED)
        printf("Blocked");
    else if(feature_group == TOBII_FEATURE_GROUP_CONSUMER)
        printf("Consumer");
    else if(feature_group == TOBII_FEATURE_GROUP_CONFIG)
        printf("Config");
    else if(feature_group == TOBII_FEATURE_GROUP_PROFESSIONAL)
        printf("Professional");
    else if(feature_group == TOBII_FEATURE_GROUP_INTERNAL)
        printf("Internal");
    else
        printf("Unknown");
    printf("\n");
}

// Sets the eyetracker's calibration from file
void EyeTracker::calibration_load() {
    if (m_calib_path.empty())
        return;

    fstream f(m_calib_path, ios::in | ios::binary);

    if (!f) {
        warn("Calibration load failed, no file at " + m_calib_path);
        return;
    }

    // Read up to max bytes
    vector<char> data(CALIB_FILE_MAX_BYTES);
    f.read(data.data(), CALIB_FILE_MAX_BYTES);
    size_t size = f.gcount();
    f.close();

    tobii_error_t error = tobii_calibration_apply(m_device, data.data(), size);
    if (error != NO_ERROR) {
        if (error == TOBII_ERROR_INSUFFICIENT_LICENSE)
            warn("Calibration load failed (insufficient license).");
        else
            warn("Calibration load failed: " + tobii_error_str(error));
    } else {
        info("Calibration loaded successfully.");
    }
}

/////////////////////////////////////////////////////////////////////////////
// Misc Helpers

string tobii_error_str(tobii_error_t error) {
    return string(tobii_error_message(error));
}

// Syncs eyetracker device time w/ system clock every 30s until interrupted
static void sync_device_time_async(tobii_device_t *device) {
    try {
        while (true) {
            tobii_error_t error = tobii_update_timesync(device);
            if (error != NO_ERROR && error != TOBII_ERROR_CONNECTION_FAILED)
                warn("tobii_update_timesync failed: " + tobii_error_str(error));
            boost::this_thread::sleep_for(boost::chrono::seconds{30});
        }
    } catch (boost::thread_interrupted&) {}
}

// Reads an eyetracker license file into license, returning its size in bytes
static size_t read_license_file(const string &path, vector<uint16_t> *license) {
    ifstream f(path, ios::in | ios::binary | ios::ate);

    if (!f) {
        error("License load failed (file not found): " + path);
        return 0;
    }

    streamsize file_size = f.tellg();
    if (file_size <= 0) {
        error("License load failed (file is empty): " + path);
        return 0;
    }

    f.seekg(0, ios::beg);
    license->assign(file_size / sizeof(uint16_t) + 1, 0);
    f.read(reinterpret_cast<char*>(license->data()), file_size);

    return static_cast<size_t>(file_size);
}

// Populates user_data with the first eyetracker found.
static void single_url_receiver(char const *url, void *user_data) {
    char *buffer = static_cast<char*>(user_data);

    if (*buffer != '\0') return; // only keep first device

    if (strlen(url) < URL_MAX_LEN)
        strcpy(buffer, url);
}
