/////////////////////////////////////////////////////////////////////////////
// An abstraction of an eye tracker device (Tobii Stream Engine).
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_EYETRACKER_H
#define GAZEGUARD_EYETRACKER_H

#include <cstdint>
#include <memory>
#include <string>

#include <tobii/tobii.h>
#include <tobii/tobii_config.h>
#include <tobii/tobii_streams.h>
#include <tobii/tobii_licensing.h>

#include <boost/thread.hpp>


#define URL_MAX_LEN 256
#define CALIB_FILE_MAX_BYTES 400000
#define NO_ERROR TOBII_ERROR_NO_ERROR


class EyeTracker {
    public:
        EyeTracker(const std::string &license_path, const std::string &calib_path);
        virtual ~EyeTracker();
        void sync_device_time();
        void print_device_info();
        void print_feature_group();
        int64_t devicetime_to_systime(int64_t);
        bool is_elevated() const { return m_is_elevated; }

    protected:
        int64_t m_device_time_offset;
        tobii_device_t *m_device;
        tobii_api_t *m_api;
        bool m_is_elevated;
        std::string m_license_path;
        std::string m_calib_path;
        void calibration_load();

    private:
        std::shared_ptr<boost::thread> m_async_time_syncer;
};


// Returns a printable description of the given stream engine error.
std::string tobii_error_str(tobii_error_t error);


#endif // Top-level include guard
