#include <memory>

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include "app.h"
#include "frontend.h"
#include "gaze_viewer.h"
#include "sql_helpers.h"
#include "test_helpers.h"

using namespace std;


namespace {

// A gaze source the test connects and feeds by hand
class FakeGazeSource : public GazeSource {
    public:
        bool start_ok = true;
        bool is_connected = false;
        bool started = false;
        bool stopped = false;
        int rate_hz = 0;
        gaze_callback_t callback;

        bool start(gaze_callback_t cb) {
            if (!start_ok)
                return false;
            callback = cb;
            started = true;
            return true;
        }

        void stop() { stopped = true; }
        bool connected() const { return is_connected; }

        bool set_stream_rate(int hz) {
            rate_hz = hz;
            return true;
        }

        void push(const gaze_point_t &gp) { callback(gp); }
};

class FakeDetector : public PedestrianDetector {
    public:
        vector<detection_t> detections;
        vector<detection_t> detect(const cv::Mat &) { return detections; }
};

// Fails the way a broken network does inside cv::dnn
class ThrowingDetector : public PedestrianDetector {
    public:
        vector<detection_t> detect(const cv::Mat &) {
            CV_Error(cv::Error::StsError, "forward failed");
        }
};

}  // namespace


// Writes n small frames as a numbered png sequence under dir and returns the
// sequence's VideoCapture pattern
static string write_frames(const boost::filesystem::path &dir, int n) {
    boost::filesystem::create_directories(dir);
    for (int i = 0; i < n; i++) {
        cv::Mat img(240, 320, CV_8UC3, cv::Scalar(0, 0, 0));
        cv::imwrite((dir / ("frame_0" + to_string(i) + ".png")).string(), img);
    }
    return (dir / "frame_%02d.png").string();
}


class FrontendTest : public ::testing::Test {
    protected:
        void SetUp() override {
            app_config_set(YAML::Node(YAML::NodeType::Map));
            source = make_shared<FakeGazeSource>();
        }

        shared_ptr<Frontend> make(const string &video_source,
                                  shared_ptr<LogSession> log_session = shared_ptr<LogSession>()) {
            return make_shared<Frontend>(
                source,
                make_shared<VideoReceiver>(video_source, 0, 0),
                log_session,
                16, 1, 125);
        }

        shared_ptr<FakeGazeSource> source;
        ScratchPath scratch;
};


TEST_F(FrontendTest, ConnectsOnceSourceIsConnected) {
    shared_ptr<Frontend> frontend = make(write_frames(scratch.path(), 2));

    frontend->start();
    EXPECT_TRUE(source->started);
    EXPECT_FALSE(frontend->poll_connect());
    EXPECT_FALSE(frontend->video().is_open());

    source->is_connected = true;
    EXPECT_TRUE(frontend->poll_connect());
    EXPECT_TRUE(frontend->connected());
    EXPECT_EQ(125, source->rate_hz);
    EXPECT_TRUE(frontend->video().is_open());

    frontend->shutdown();
    EXPECT_FALSE(frontend->connected());
    EXPECT_FALSE(frontend->video().is_open());
    EXPECT_TRUE(source->stopped);
}

TEST_F(FrontendTest, GazeFlowsFromSource) {
    shared_ptr<Frontend> frontend = make(write_frames(scratch.path(), 1));
    frontend->start();

    EXPECT_FALSE(gaze_is_valid(frontend->gaze()));

    source->push(make_gaze(10, 0.25f, 0.5f));
    gaze_point_t gp = frontend->gaze();
    EXPECT_TRUE(gaze_is_valid(gp));
    EXPECT_FLOAT_EQ(0.25f, gp.x_normed);
    EXPECT_EQ(1, frontend->gaze_stream().total_received());
}

TEST_F(FrontendTest, GazeStartFailureThrows) {
    source->start_ok = false;
    shared_ptr<Frontend> frontend = make(write_frames(scratch.path(), 1));

    EXPECT_THROW(frontend->start(), AppError);
}

TEST_F(FrontendTest, CameraStartErrorShutsDown) {
    ScratchPath missing(".mp4");
    shared_ptr<Frontend> frontend = make(missing.str());

    source->is_connected = true;
    EXPECT_THROW(frontend->start(), AppError);
    EXPECT_TRUE(source->stopped);
    EXPECT_FALSE(frontend->connected());

    // Shut down for good
    EXPECT_FALSE(frontend->poll_connect());
}

TEST_F(FrontendTest, ShutdownLogsRemainingGaze) {
    ScratchPath db(".db");
    shared_ptr<LogSession> session = make_shared<LogSession>(db.str(), 100);
    shared_ptr<Frontend> frontend = make(write_frames(scratch.path(), 1), session);

    source->is_connected = true;
    frontend->start();
    ASSERT_TRUE(session->is_active());

    source->push(make_gaze(1, 0.5f, 0.5f));
    source->push(gaze_invalid(2));
    frontend->log_gaze();
    EXPECT_EQ(0, session->count(GAZE_SAMPLES_TABLE));

    source->push(make_gaze(3, 0.5f, 0.5f));
    frontend->shutdown();
    frontend->shutdown();
    EXPECT_FALSE(session->is_active());

    sqlite3 *raw = sqlite_get_db(db.str().c_str());
    ASSERT_TRUE(raw != NULL);
    EXPECT_EQ(3, sqlite_count(raw, GAZE_SAMPLES_TABLE));
    sqlite3_close(raw);
}


/////////////////////////////////////////////////////////////////////////////
// GazeViewer frame processing, without a window

static overlay_style_t test_style() {
    app_config_t cfg = app_config_from_yaml();
    return overlay_style_from_config(cfg);
}

TEST_F(FrontendTest, ViewerAnnotatesPlainFrames) {
    shared_ptr<Frontend> frontend = make(write_frames(scratch.path(), 1));
    GazeViewer viewer(frontend, test_style(), "preview");

    source->is_connected = true;
    ASSERT_TRUE(viewer.wait_connected());

    source->push(make_gaze(1, 0.5f, 0.5f));
    cv::Mat frame = cv::Mat::zeros(240, 320, CV_8UC3);
    cv::Mat image = viewer.process_frame(frame, 1);

    EXPECT_EQ(frame.size(), image.size());
    EXPECT_EQ(0, cv::countNonZero(frame.reshape(1)));
    EXPECT_GT(cv::countNonZero(image.reshape(1)), 0);
    EXPECT_FALSE(viewer.alert());

    viewer.close();
    EXPECT_TRUE(source->stopped);
}

TEST_F(FrontendTest, ViewerRaisesAndLogsAlerts) {
    ScratchPath db(".db");
    shared_ptr<LogSession> session = make_shared<LogSession>(db.str(), 100);
    shared_ptr<Frontend> frontend = make(write_frames(scratch.path(), 1), session);

    shared_ptr<FakeDetector> detector = make_shared<FakeDetector>();
    detector->detections.push_back(make_detection(0.9f, cv::Rect(100, 50, 60, 300)));

    pedestrian_params_t params = pedestrian_params_from_config(app_config_from_yaml());
    GazeViewer viewer(frontend, test_style(), "preview");
    viewer.set_pedestrian_overlay(make_shared<PedestrianOverlay>(
        detector, CentroidTracker(), test_style(), params));

    source->is_connected = true;
    ASSERT_TRUE(viewer.wait_connected());

    source->push(make_gaze(1, 0.9f, 0.1f));
    cv::Mat image = viewer.process_frame(cv::Mat::zeros(480, 640, CV_8UC3), 1);

    EXPECT_EQ(640, image.cols);
    EXPECT_TRUE(viewer.alert());

    // REGISTER then ALERT
    EXPECT_EQ(2, session->count(TRACK_EVENTS_TABLE));

    viewer.close();
    EXPECT_FALSE(session->is_active());
}

TEST_F(FrontendTest, ViewerStopsOnFrameError) {
    ScratchPath db(".db");
    shared_ptr<LogSession> session = make_shared<LogSession>(db.str(), 100);
    shared_ptr<Frontend> frontend = make(write_frames(scratch.path(), 2), session);

    GazeViewer viewer(frontend, test_style(), "preview");
    viewer.set_pedestrian_overlay(make_shared<PedestrianOverlay>(
        make_shared<ThrowingDetector>(), CentroidTracker(), test_style(),
        pedestrian_params_from_config(app_config_from_yaml())));

    source->is_connected = true;

    EXPECT_EQ(1, viewer.run());
    EXPECT_TRUE(source->stopped);
    EXPECT_FALSE(frontend->connected());
    EXPECT_FALSE(session->is_active());
}
