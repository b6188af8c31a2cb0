#include <fstream>

#include <gtest/gtest.h>

#include "app.h"
#include "pedestrian_detect.h"
#include "test_helpers.h"

using namespace std;


TEST(DetectionTest, CentroidOfBox) {
    detection_t d = make_detection(0.5f, cv::Rect(10, 20, 30, 41));
    EXPECT_FLOAT_EQ(0.5f, d.confidence);
    EXPECT_EQ(cv::Point(25, 40), d.centroid);
}

TEST(DetectionTest, LoadsTrimmedLabels) {
    ScratchPath names(".names");
    {
        ofstream f(names.str());
        f << "person\r\nbicycle \ncar\n";
    }

    vector<string> labels = load_labels(names.str());
    ASSERT_EQ(3u, labels.size());
    EXPECT_EQ("person", labels[0]);
    EXPECT_EQ("bicycle", labels[1]);
}

TEST(DetectionTest, DetectorNeedsPersonLabel) {
    ScratchPath missing(".names");
    EXPECT_THROW(DnnPedestrianDetector("x.cfg", "x.weights", missing.str(), 0.2f, 0.3f, 416),
                 AppError);

    ScratchPath names(".names");
    {
        ofstream f(names.str());
        f << "bicycle\ncar\n";
    }
    EXPECT_THROW(DnnPedestrianDetector("x.cfg", "x.weights", names.str(), 0.2f, 0.3f, 416),
                 AppError);
}

TEST(DetectionTest, MissingModelThrows) {
    ScratchPath names(".names");
    {
        ofstream f(names.str());
        f << "person\n";
    }
    ScratchPath cfg(".cfg");
    ScratchPath weights(".weights");

    EXPECT_THROW(DnnPedestrianDetector(cfg.str(), weights.str(), names.str(), 0.2f, 0.3f, 416),
                 AppError);
}
