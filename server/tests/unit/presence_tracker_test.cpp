#include <gtest/gtest.h>

#include "codebattle/presence_tracker.hpp"

TEST(PresenceTrackerTest, BindIndexesByConnectionAndParty) {
  codebattle::PresenceTracker tracker;
  tracker.Bind("c1", "AB12", "p1@x");
  auto entry = tracker.FindByConnection("c1");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->room_id, "AB12");
  EXPECT_EQ(entry->party_id, "p1@x");
  EXPECT_EQ(tracker.RoomOf("p1@x"), "AB12");
  EXPECT_EQ(tracker.ConnectionOf("p1@x"), "c1");
}

TEST(PresenceTrackerTest, RebindDropsPreviousConnection) {
  codebattle::PresenceTracker tracker;
  tracker.Bind("c1", "AB12", "p1@x");
  tracker.Bind("c2", "AB12", "p1@x");
  EXPECT_FALSE(tracker.FindByConnection("c1").has_value());
  EXPECT_EQ(tracker.ConnectionOf("p1@x"), "c2");
  EXPECT_EQ(tracker.BoundConnections(), 1u);
  EXPECT_EQ(tracker.TrackedParties(), 1u);
}

TEST(PresenceTrackerTest, ConnectionTakenOverByAnotherPartyUnbindsTheFirst) {
  codebattle::PresenceTracker tracker;
  tracker.Bind("c1", "AB12", "p1@x");
  tracker.Bind("c1", "AB12", "p2@x");
  EXPECT_EQ(tracker.FindByConnection("c1")->party_id, "p2@x");
  EXPECT_EQ(tracker.RoomOf("p1@x"), "AB12");
  EXPECT_FALSE(tracker.ConnectionOf("p1@x").has_value());
}

TEST(PresenceTrackerTest, TrackWithoutConnection) {
  codebattle::PresenceTracker tracker;
  tracker.Track("AB12", "p1@x");
  EXPECT_EQ(tracker.RoomOf("p1@x"), "AB12");
  EXPECT_EQ(tracker.BoundConnections(), 0u);
  tracker.Bind("c9", "AB12", "p1@x");
  EXPECT_EQ(tracker.FindByConnection("c9")->room_id, "AB12");
}

TEST(PresenceTrackerTest, DetachKeepsMembershipReleaseDropsIt) {
  codebattle::PresenceTracker tracker;
  tracker.Bind("c1", "AB12", "p1@x");
  tracker.Bind("c2", "AB12", "p2@x");

  tracker.Detach("c1");
  EXPECT_FALSE(tracker.FindByConnection("c1").has_value());
  EXPECT_EQ(tracker.RoomOf("p1@x"), "AB12");

  tracker.Release("p2@x");
  EXPECT_FALSE(tracker.FindByConnection("c2").has_value());
  EXPECT_FALSE(tracker.RoomOf("p2@x").has_value());

  tracker.Clear();
  EXPECT_EQ(tracker.TrackedParties(), 0u);
}
