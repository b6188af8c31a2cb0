#include <limits>

#include <gtest/gtest.h>

#include "gaze_source.h"
#include "test_helpers.h"

using namespace std;


TEST(GazeStructTest, MapsNormalizedGazeOntoFrame) {
    gaze_pixel_t px = gaze_to_frame(make_gaze(0, 0.5f, 0.25f), 640, 480);
    EXPECT_TRUE(px.valid);
    EXPECT_EQ(320, px.x_coord);
    EXPECT_EQ(120, px.y_coord);

    px = gaze_to_frame(gaze_invalid(), 640, 480);
    EXPECT_FALSE(px.valid);
}

TEST(GazeStructTest, ClampsFarOffFrameGaze) {
    gaze_pixel_t px = gaze_to_frame(make_gaze(0, 1e30f, -1e30f), 640, 480);
    EXPECT_TRUE(px.valid);
    EXPECT_EQ(1280, px.x_coord);
    EXPECT_EQ(-480, px.y_coord);

    const float inf = numeric_limits<float>::infinity();
    px = gaze_to_frame(make_gaze(0, -inf, inf), 640, 480);
    EXPECT_TRUE(px.valid);
    EXPECT_EQ(-640, px.x_coord);
    EXPECT_EQ(960, px.y_coord);

    // Slightly off frame is kept as is
    px = gaze_to_frame(make_gaze(0, 1.5f, -0.25f), 640, 480);
    EXPECT_EQ(960, px.x_coord);
    EXPECT_EQ(-120, px.y_coord);
}

TEST(GazeStreamTest, NothingReceivedIsInvalid) {
    GazeStream stream(8, 1);

    EXPECT_FALSE(gaze_is_valid(stream.current()));
    EXPECT_EQ(0, stream.size());
    EXPECT_EQ(0, stream.total_received());
    EXPECT_TRUE(stream.drain().empty());
}

TEST(GazeStreamTest, CurrentIsLatestSample) {
    GazeStream stream(8, 1);
    stream.enque_gaze_data(make_gaze(100, 0.1f, 0.2f));
    stream.enque_gaze_data(make_gaze(200, 0.3f, 0.4f));

    gaze_point_t gp = stream.current();
    EXPECT_EQ(200, gp.unixtime_us);
    EXPECT_FLOAT_EQ(0.3f, gp.x_normed);
    EXPECT_FLOAT_EQ(0.4f, gp.y_normed);
}

TEST(GazeStreamTest, SmoothsOverLatestSamples) {
    GazeStream stream(8, 2);
    stream.enque_gaze_data(make_gaze(100, 0.9f, 0.9f));
    stream.enque_gaze_data(make_gaze(200, 0.2f, 0.4f));
    stream.enque_gaze_data(make_gaze(300, 0.4f, 0.6f));

    gaze_point_t gp = stream.current();
    EXPECT_EQ(300, gp.unixtime_us);
    EXPECT_NEAR(0.3, gp.x_normed, 1e-6);
    EXPECT_NEAR(0.5, gp.y_normed, 1e-6);
}

TEST(GazeStreamTest, InvalidSampleInvalidatesUntilNextValid) {
    GazeStream stream(8, 1);
    stream.enque_gaze_data(make_gaze(100, 0.5f, 0.5f));
    stream.enque_gaze_data(gaze_invalid(200));

    gaze_point_t gp = stream.current();
    EXPECT_FALSE(gaze_is_valid(gp));
    EXPECT_EQ(200, gp.unixtime_us);
    EXPECT_EQ(1, stream.size());

    stream.enque_gaze_data(make_gaze(300, 0.6f, 0.7f));
    EXPECT_TRUE(gaze_is_valid(stream.current()));
}

TEST(GazeStreamTest, DrainReturnsEverySampleOnce) {
    GazeStream stream(4, 1);
    stream.enque_gaze_data(make_gaze(1, 0.1f, 0.1f));
    stream.enque_gaze_data(gaze_invalid(2));
    stream.enque_gaze_data(make_gaze(3, 0.3f, 0.3f));

    vector<gaze_point_t> samples = stream.drain();
    ASSERT_EQ(3u, samples.size());
    EXPECT_EQ(1, samples[0].unixtime_us);
    EXPECT_FALSE(gaze_is_valid(samples[1]));
    EXPECT_EQ(3, samples[2].unixtime_us);

    EXPECT_TRUE(stream.drain().empty());
    EXPECT_EQ(3, stream.total_received());
}

TEST(GazeStreamTest, BufferIsBounded) {
    GazeStream stream(4, 1);
    for (int i = 0; i < 10; i++)
        stream.enque_gaze_data(make_gaze(i, 0.5f, 0.5f));

    EXPECT_EQ(4, stream.size());
    EXPECT_EQ(10, stream.total_received());
}
