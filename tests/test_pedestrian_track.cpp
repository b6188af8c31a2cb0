#include <gtest/gtest.h>

#include "pedestrian_track.h"

using namespace std;


static detection_t det(int x, int y, int w = 20, int h = 40) {
    return make_detection(0.9f, cv::Rect(x, y, w, h));
}

static gaze_pixel_t pixel(int x, int y) {
    gaze_pixel_t px = {true, x, y};
    return px;
}


/////////////////////////////////////////////////////////////////////////////
// Person

TEST(PersonTest, CentroidIsBoxCenter) {
    Person p(3, det(10, 10, 20, 40));
    EXPECT_EQ(3, p.id);
    EXPECT_EQ(cv::Point(20, 30), p.centroid);
    EXPECT_FALSE(p.is_seen);
}

TEST(PersonTest, SeenWhenGazeInBoxAndStaysSeen) {
    Person p(0, det(10, 10, 20, 40));

    EXPECT_FALSE(p.is_person_seen(pixel(5, 5)));
    EXPECT_TRUE(p.is_person_seen(pixel(15, 20)));

    gaze_pixel_t none = {false, 0, 0};
    EXPECT_TRUE(p.is_person_seen(none));
    EXPECT_TRUE(p.is_person_seen(pixel(500, 500)));
}

TEST(PersonTest, MarginGrowsTheHitBox) {
    Person strict(0, det(10, 10, 20, 40));
    EXPECT_FALSE(strict.is_person_seen(pixel(7, 20), 0));

    Person loose(1, det(10, 10, 20, 40));
    EXPECT_TRUE(loose.is_person_seen(pixel(7, 20), 5));
}

TEST(PersonTest, DwellNeedsConsecutiveFrames) {
    Person p(0, det(10, 10, 20, 40));

    EXPECT_FALSE(p.is_person_seen(pixel(15, 20), 0, 3));
    EXPECT_FALSE(p.is_person_seen(pixel(15, 20), 0, 3));
    EXPECT_FALSE(p.is_person_seen(pixel(100, 100), 0, 3));
    EXPECT_EQ(0, p.gaze_frames);

    EXPECT_FALSE(p.is_person_seen(pixel(15, 20), 0, 3));
    EXPECT_FALSE(p.is_person_seen(pixel(15, 20), 0, 3));
    EXPECT_TRUE(p.is_person_seen(pixel(15, 20), 0, 3));
}

TEST(PersonTest, CloseByBoxHeight) {
    Person p(0, det(0, 0, 20, 40));

    EXPECT_TRUE(p.is_person_close(80, 0.5));
    EXPECT_FALSE(p.is_person_close(100, 0.5));
    EXPECT_FALSE(p.is_person_close(0, 0.5));
}

TEST(TrackEventTest, Names) {
    EXPECT_STREQ("REGISTER", track_event_name(TRACK_EVENT_REGISTER));
    EXPECT_STREQ("DEREGISTER", track_event_name(TRACK_EVENT_DEREGISTER));
    EXPECT_STREQ("SEEN", track_event_name(TRACK_EVENT_SEEN));
    EXPECT_STREQ("ALERT", track_event_name(TRACK_EVENT_ALERT));
}


/////////////////////////////////////////////////////////////////////////////
// CentroidTracker

TEST(CentroidTrackerTest, RegistersFirstDetections) {
    CentroidTracker tracker;
    const person_map_t &objects = tracker.update({det(0, 0), det(100, 0)});

    ASSERT_EQ(2u, objects.size());
    EXPECT_EQ(cv::Point(10, 20), objects.at(0).centroid);
    EXPECT_EQ(cv::Point(110, 20), objects.at(1).centroid);

    ASSERT_EQ(2u, tracker.events().size());
    EXPECT_EQ(TRACK_EVENT_REGISTER, tracker.events()[0].type);
    EXPECT_EQ(0, tracker.events()[0].object_id);
    EXPECT_EQ(1, tracker.events()[1].object_id);
}

TEST(CentroidTrackerTest, MatchesByNearestCentroid) {
    CentroidTracker tracker;
    tracker.update({det(0, 0), det(100, 0)});

    // Same people, listed in the other order and moved a little
    const person_map_t &objects = tracker.update({det(104, 2), det(3, 1)});

    ASSERT_EQ(2u, objects.size());
    EXPECT_EQ(cv::Point(13, 21), objects.at(0).centroid);
    EXPECT_EQ(cv::Point(114, 22), objects.at(1).centroid);
    EXPECT_EQ(cv::Rect(3, 1, 20, 40), objects.at(0).rect.box);
    EXPECT_TRUE(tracker.events().empty());
}

TEST(CentroidTrackerTest, KeepsSeenStateAcrossFrames) {
    CentroidTracker tracker;
    tracker.update({det(0, 0)});
    tracker.objects()[0].is_seen = true;

    tracker.update({det(2, 2)});
    EXPECT_TRUE(tracker.objects().at(0).is_seen);
}

TEST(CentroidTrackerTest, DeregistersAfterMaxDisappeared) {
    CentroidTracker tracker(2);
    tracker.update({det(0, 0)});

    tracker.update({});
    tracker.update({});
    ASSERT_EQ(1u, tracker.objects().size());
    EXPECT_EQ(2, tracker.disappeared(0));

    tracker.update({});
    EXPECT_TRUE(tracker.objects().empty());
    EXPECT_EQ(-1, tracker.disappeared(0));
    ASSERT_EQ(1u, tracker.events().size());
    EXPECT_EQ(TRACK_EVENT_DEREGISTER, tracker.events()[0].type);
}

TEST(CentroidTrackerTest, ReappearanceResetsDisappearedCount) {
    CentroidTracker tracker(2);
    tracker.update({det(0, 0)});
    tracker.update({});
    EXPECT_EQ(1, tracker.disappeared(0));

    tracker.update({det(1, 1)});
    EXPECT_EQ(0, tracker.disappeared(0));
}

TEST(CentroidTrackerTest, ExtraDetectionsAreRegisteredAndMissingMarked) {
    CentroidTracker tracker(5);
    tracker.update({det(0, 0), det(100, 0)});

    tracker.update({det(1, 0)});
    EXPECT_EQ(0, tracker.disappeared(0));
    EXPECT_EQ(1, tracker.disappeared(1));

    tracker.update({det(2, 0), det(180, 0), det(300, 0)});
    ASSERT_EQ(3u, tracker.objects().size());
    EXPECT_EQ(0, tracker.disappeared(1));
    EXPECT_EQ(cv::Point(190, 20), tracker.objects().at(1).centroid);
    EXPECT_EQ(cv::Point(310, 20), tracker.objects().at(2).centroid);
}

TEST(CentroidTrackerTest, MaxDistanceGatesMatches) {
    CentroidTracker tracker(5, 20);
    tracker.update({det(0, 0)});

    tracker.update({det(200, 200)});
    ASSERT_EQ(2u, tracker.objects().size());
    EXPECT_EQ(1, tracker.disappeared(0));
    EXPECT_EQ(0, tracker.disappeared(1));
}

TEST(CentroidTrackerTest, IdsAreNeverReused) {
    CentroidTracker tracker(0);
    tracker.update({det(0, 0)});
    tracker.update({});
    EXPECT_TRUE(tracker.objects().empty());

    tracker.update({det(0, 0)});
    ASSERT_EQ(1u, tracker.objects().size());
    EXPECT_EQ(1, tracker.objects().begin()->first);
}
