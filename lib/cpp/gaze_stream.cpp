/////////////////////////////////////////////////////////////////////////////
// GazeStream: a circular buffer of the latest valid gaze samples plus a
// backlog of every sample not yet handed to the log session.
//
/////////////////////////////////////////////////////////////////////////////

#include <algorithm>

#include <boost/chrono.hpp>
#include <boost/thread.hpp>

#include "gaze_source.h"

using namespace std;


#define UNLOGGED_BUFF_FACTOR 8
#define SAMPLE_WAIT_POLL_MS 10


GazeStream::GazeStream(int buff_sz, int smooth_over) {
    m_buff_sz = buff_sz;
    m_smooth_over = smooth_over;
    m_gaze_buff.reset(new gaze_buff_t(buff_sz));
    m_unlogged.reset(new gaze_buff_t(buff_sz * UNLOGGED_BUFF_FACTOR));
    m_latest = gaze_invalid();
    m_total = 0;
}

// Enques a sample. Invalid samples are not buffered for smoothing but do
// invalidate the current gaze point until the next valid one arrives.
void GazeStream::enque_gaze_data(const gaze_point_t &gp) {
    boost::mutex::scoped_lock lock(m_async_mutex);

    m_latest = gp;
    m_total++;
    m_unlogged->push_back(gp);

    if (gaze_is_valid(gp))
        m_gaze_buff->push_back(gp);
}

// Returns the current gaze point, averaged over (at most) the m_smooth_over
// latest valid samples. Invalid if the newest sample was invalid.
gaze_point_t GazeStream::current() {
    boost::mutex::scoped_lock lock(m_async_mutex);

    if (m_total == 0 || !gaze_is_valid(m_latest))
        return gaze_invalid(m_latest.unixtime_us);

    int buff_sz = m_gaze_buff->size();
    int n_samples = min(buff_sz, m_smooth_over);
    double avg_x = 0;
    double avg_y = 0;

    for (int j = buff_sz - n_samples; j < buff_sz; j++) {
        const gaze_point_t &gp = m_gaze_buff->at(j);
        avg_x += gp.x_normed;
        avg_y += gp.y_normed;
    }

    gaze_point_t smoothed;
    smoothed.unixtime_us = m_latest.unixtime_us;
    smoothed.x_normed = static_cast<float>(avg_x / n_samples);
    smoothed.y_normed = static_cast<float>(avg_y / n_samples);
    return smoothed;
}

// Moves out every sample received since the last drain, oldest first.
vector<gaze_point_t> GazeStream::drain() {
    boost::mutex::scoped_lock lock(m_async_mutex);

    vector<gaze_point_t> samples(m_unlogged->begin(), m_unlogged->end());
    m_unlogged->clear();
    return samples;
}

// Returns the number of valid samples currently buffered.
int GazeStream::size() {
    boost::mutex::scoped_lock lock(m_async_mutex);
    return m_gaze_buff->size();
}

int64_t GazeStream::total_received() {
    boost::mutex::scoped_lock lock(m_async_mutex);
    return m_total;
}


bool gaze_wait_for_samples(GazeStream &stream,
                           const GazeSource &source,
                           int64_t n_samples,
                           int timeout_ms) {
    boost::chrono::steady_clock::time_point deadline =
        boost::chrono::steady_clock::now() + boost::chrono::milliseconds(timeout_ms);

    while (stream.total_received() < n_samples) {
        if (!source.connected() || boost::chrono::steady_clock::now() >= deadline)
            return false;
        boost::this_thread::sleep_for(boost::chrono::milliseconds{SAMPLE_WAIT_POLL_MS});
    }
    return true;
}
