/////////////////////////////////////////////////////////////////////////////
// A gaze source that replays a recorded CSV of gaze samples.
//
/////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <boost/algorithm/string.hpp>

#include "app.h"
#include "gaze_replay.h"

using namespace std;


#define REPLAY_DEFAULT_PERIOD_US (1000000 / 125)


// Parses a float field, accepting "nan". Returns false on garbage.
static bool parse_float(const string &field, float *out) {
    const char *begin = field.c_str();
    char *end = NULL;

    *out = strtof(begin, &end);
    return end != begin && *end == '\0';
}

// Loads gaze samples from the given csv. A first row that isn't numeric is
// treated as a header. Blank lines are skipped.
vector<gaze_point_t> load_gaze_csv(const string &file_path) {
    ifstream f(file_path);
    if (!f)
        throw AppError("Gaze csv not found: " + file_path);

    vector<gaze_point_t> samples;
    string line;
    int line_no = 0;

    while (getline(f, line)) {
        line_no++;
        boost::algorithm::trim(line);
        if (line.empty())
            continue;

        vector<string> fields;
        boost::algorithm::split(fields, line, boost::is_any_of(","));
        for (string &field : fields)
            boost::algorithm::trim(field);

        gaze_point_t gp;
        bool ok = fields.size() == 3;
        if (ok) {
            char *end = NULL;
            gp.unixtime_us = strtoll(fields[0].c_str(), &end, 10);
            ok = end != fields[0].c_str() && *end == '\0' &&
                 parse_float(fields[1], &gp.x_normed) &&
                 parse_float(fields[2], &gp.y_normed);
        }

        if (!ok) {
            if (line_no == 1 && samples.empty())
                continue;  // header
            throw AppError(
                "Malformed gaze csv row " + to_string(line_no) + " in " + file_path);
        }

        samples.push_back(gp);
    }

    return samples;
}

// Writes the given samples to csv, creating the file if it doesn't exist else
// appending to it.
void gaze_data_tocsv(const string &file_path, const vector<gaze_point_t> &samples) {
    ofstream f(file_path, fstream::out | fstream::app);
    if (!f)
        throw AppError("Failed to open gaze csv for writing: " + file_path);

    for (const gaze_point_t &gp : samples)
        f << gp.unixtime_us << ", " << gp.x_normed << ", " << gp.y_normed << "\n";
}


/////////////////////////////////////////////////////////////////////////////
// Class

GazeReplay::GazeReplay(const vector<gaze_point_t> &samples, bool loop) {
    m_samples = samples;
    m_loop = loop;

    // The recording's mean sample gap, else the device's default rate
    m_period_us = REPLAY_DEFAULT_PERIOD_US;
    if (samples.size() > 1) {
        int64_t mean_gap_us = (samples.back().unixtime_us - samples.front().unixtime_us) /
            static_cast<int64_t>(samples.size() - 1);
        if (mean_gap_us > 0)
            m_period_us = mean_gap_us;
    }
    m_running = false;
    m_finished = false;
}

GazeReplay::~GazeReplay() {
    stop();
}

bool GazeReplay::start(gaze_callback_t cb) {
    if (m_async_replayer) {
        warn("Gaze replay start attempted but already running.");
        return false;
    }
    if (m_samples.empty()) {
        warn("Gaze replay has no samples.");
        return false;
    }

    m_callback = cb;
    m_running = true;
    m_finished = false;
    m_async_replayer = make_shared<boost::thread>(&GazeReplay::replay, this);

    return true;
}

void GazeReplay::stop() {
    if (!m_async_replayer)
        return;

    m_async_replayer->interrupt();
    m_async_replayer->join();
    m_async_replayer = NULL;
    m_running = false;
}

bool GazeReplay::connected() const {
    return m_running;
}

// A recording plays back at the rate it was recorded at.
bool GazeReplay::set_stream_rate(int) {
    return false;
}

bool GazeReplay::finished() const {
    return m_finished;
}

// Delivers the samples honoring the gaps between their timestamps. Repeated
// timestamps and the wrap back to the first sample are paced by the nominal
// period. Each looped pass is shifted forward in time so delivered
// timestamps keep increasing.
void GazeReplay::replay() {
    const int64_t span_us = max<int64_t>(
        m_samples.back().unixtime_us - m_samples.front().unixtime_us, 0) + m_period_us;
    int64_t pass_offset_us = 0;

    try {
        do {
            int64_t prev_us = m_samples.front().unixtime_us;
            bool first = true;

            for (const gaze_point_t &gp : m_samples) {
                int64_t gap_us = gp.unixtime_us - prev_us;
                if (first)
                    gap_us = pass_offset_us > 0 ? m_period_us : 0;
                else if (gap_us <= 0)
                    gap_us = m_period_us;

                if (gap_us > 0)
                    boost::this_thread::sleep_for(boost::chrono::microseconds{gap_us});
                else
                    boost::this_thread::interruption_point();

                prev_us = gp.unixtime_us;
                first = false;

                gaze_point_t shifted = gp;
                shifted.unixtime_us += pass_offset_us;
                m_callback(shifted);
            }

            pass_offset_us += span_us;
        } while (m_loop);
    } catch (boost::thread_interrupted&) {
        return;
    }

    m_finished = true;
}
