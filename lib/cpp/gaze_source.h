/////////////////////////////////////////////////////////////////////////////
// The interface every gaze provider implements, and the buffered stream
// gaze samples are collected into.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef GAZEGUARD_GAZE_SOURCE_H
#define GAZEGUARD_GAZE_SOURCE_H

#include <functional>
#include <memory>
#include <vector>

#include <boost/circular_buffer.hpp>
#include <boost/thread/mutex.hpp>

#include "eyetracker_structdef.h"


typedef std::function<void(const gaze_point_t&)> gaze_callback_t;


// A provider of gaze-in-image samples, either a device or a recording.
class GazeSource {
    public:
        virtual ~GazeSource() {}

        // Starts delivering samples to cb. Returns false if the source could
        // not be started.
        virtual bool start(gaze_callback_t cb) = 0;
        virtual void stop() = 0;
        virtual bool connected() const = 0;

        // Requests the given sample rate. Returns false if unsupported.
        virtual bool set_stream_rate(int hz) = 0;
};


typedef boost::circular_buffer<gaze_point_t> gaze_buff_t;

// Thread-safe collection of the latest gaze samples. Samples are pushed from
// the source's thread and read from the frame loop.
class GazeStream {
    public:
        GazeStream(int buff_sz, int smooth_over);

        void enque_gaze_data(const gaze_point_t &gp);
        gaze_point_t current();
        std::vector<gaze_point_t> drain();
        int size();
        int64_t total_received();

    protected:
        int m_buff_sz;
        int m_smooth_over;

    private:
        std::unique_ptr<gaze_buff_t> m_gaze_buff;
        std::unique_ptr<gaze_buff_t> m_unlogged;
        gaze_point_t m_latest;
        int64_t m_total;
        boost::mutex m_async_mutex;
};


// Blocks until stream has received n_samples in total. Returns false if
// source disconnects or timeout_ms elapses first.
bool gaze_wait_for_samples(GazeStream &stream,
                           const GazeSource &source,
                           int64_t n_samples,
                           int timeout_ms);


#endif // Top-level include guard
