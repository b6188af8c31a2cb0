/////////////////////////////////////////////////////////////////////////////
// Shared test helpers: scratch files and gaze sample builders.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_TEST_HELPERS_H
#define GAZEGUARD_TEST_HELPERS_H

#include <string>

#include <boost/filesystem.hpp>

#include "eyetracker_structdef.h"


// A scratch path under the system temp dir, removed (recursively) when the
// object goes out of scope.
class ScratchPath {
    public:
        explicit ScratchPath(const std::string &suffix = "") {
            m_path = boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path("gazeguard-%%%%-%%%%" + suffix);
        }

        ~ScratchPath() {
            boost::system::error_code ec;
            boost::filesystem::remove_all(m_path, ec);
        }

        std::string str() const { return m_path.string(); }
        const boost::filesystem::path& path() const { return m_path; }

    private:
        boost::filesystem::path m_path;
};


inline gaze_point_t make_gaze(int64_t unixtime_us, float x, float y) {
    gaze_point_t gp = {unixtime_us, x, y};
    return gp;
}


#endif // Top-level include guard
