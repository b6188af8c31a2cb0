#include <boost/thread.hpp>
#include <gtest/gtest.h>

#include "alert_sound.h"

using namespace std;


// "sleep 5" stands in for a player busy with a long sound, "true x" for one
// that finishes right away.

TEST(AlertPlayerTest, PlaysWhileAlertHolds) {
    AlertPlayer player("sleep", "5");

    player.update(true);
    EXPECT_TRUE(player.is_playing());
    EXPECT_EQ(1, player.times_started());

    player.update(true);
    EXPECT_EQ(1, player.times_started());

    player.update(false);
    EXPECT_FALSE(player.is_playing());

    player.update(true);
    EXPECT_EQ(2, player.times_started());
    player.stop();
    EXPECT_FALSE(player.is_playing());
}

TEST(AlertPlayerTest, RestartsAFinishedSound) {
    AlertPlayer player("true", "x");

    player.update(true);
    ASSERT_EQ(1, player.times_started());

    for (int i = 0; i < 2000 && player.is_playing(); i++)
        boost::this_thread::sleep_for(boost::chrono::milliseconds{1});
    ASSERT_FALSE(player.is_playing());

    player.update(true);
    EXPECT_EQ(2, player.times_started());
}

TEST(AlertPlayerTest, MissingPlayerDisablesAlerts) {
    AlertPlayer player("no-such-alert-player-exe", "alert.mp3");
    EXPECT_FALSE(player.disabled());

    player.update(true);
    EXPECT_TRUE(player.disabled());
    EXPECT_EQ(0, player.times_started());
    EXPECT_FALSE(player.is_playing());
}

TEST(AlertPlayerTest, EmptyCommandDisablesAlerts) {
    AlertPlayer player("  ", "alert.mp3");
    EXPECT_TRUE(player.disabled());

    player.update(true);
    EXPECT_EQ(0, player.times_started());
}
