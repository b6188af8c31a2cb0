/////////////////////////////////////////////////////////////////////////////
// A logging session recording the gaze samples and pedestrian tracking
// events of a run to an sqlite db, for troubleshooting and later review.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_LOG_SESSION_H
#define GAZEGUARD_LOG_SESSION_H

#include <memory>
#include <string>
#include <vector>

#include <boost/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <sqlite3.h>

#include "eyetracker_structdef.h"
#include "pedestrian_track.h"


#define GAZE_SAMPLES_TABLE "GazeSamples"
#define TRACK_EVENTS_TABLE "TrackEvents"


class LogSession {
    public:
        LogSession(const std::string &db_path, int write_freq);
        ~LogSession();

        void start();
        void stop();
        bool is_active() const { return m_db != NULL; }
        void log_gaze(const std::vector<gaze_point_t> &samples);
        void log_event(int64_t unixtime_us, const track_event_t &event);
        long count(const std::string &table);

    private:
        void write_gaze(std::shared_ptr<std::vector<gaze_point_t>> samples);
        void join_writer();

        std::string m_db_path;
        int m_write_freq;
        sqlite3 *m_db;
        std::shared_ptr<std::vector<gaze_point_t>> m_pending;
        std::shared_ptr<boost::thread> m_async_writer;
        boost::mutex m_db_mutex;
};


#endif // Top-level include guard
