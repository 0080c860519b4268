#include <chrono>
#include <stdexcept>

#include <gtest/gtest.h>

#include "codebattle/room_store.hpp"

namespace {

codebattle::Room MakeRoom(const std::string& id, codebattle::RoomPhase phase, std::size_t members) {
  codebattle::Room room;
  room.id = id;
  room.phase = phase;
  room.challenge = {{"title", "Sum of numbers"}};
  room.created_at = std::chrono::system_clock::now();
  for (std::size_t i = 0; i < members; ++i) {
    auto email = "p" + std::to_string(i + 1) + "@x";
    room.members.push_back({email, "conn-" + std::to_string(i + 1), {{"email", email}}});
  }
  if (phase == codebattle::RoomPhase::kActive) {
    room.started_at = room.created_at;
  }
  return room;
}

}  // namespace

TEST(RoomStoreTest, InsertRejectsDuplicatesAndOverCapacity) {
  codebattle::RoomStore store;
  EXPECT_TRUE(store.Insert(MakeRoom("AB12", codebattle::RoomPhase::kWaiting, 0)));
  EXPECT_FALSE(store.Insert(MakeRoom("AB12", codebattle::RoomPhase::kWaiting, 1)));
  EXPECT_FALSE(store.Insert(MakeRoom("CD34", codebattle::RoomPhase::kActive, 3)));
  EXPECT_EQ(store.Size(), 1u);
}

TEST(RoomStoreTest, SummariesFollowInsertionOrder) {
  codebattle::RoomStore store;
  store.Insert(MakeRoom("ZZ99", codebattle::RoomPhase::kWaiting, 1));
  store.Insert(MakeRoom("AA11", codebattle::RoomPhase::kActive, 2));
  auto summaries = store.Summaries();
  ASSERT_EQ(summaries.size(), 2u);
  EXPECT_EQ(summaries[0].room_id, "ZZ99");
  EXPECT_EQ(summaries[0].user_count, 1u);
  EXPECT_EQ(summaries[1].room_id, "AA11");
  auto j = codebattle::ToJson(summaries[1]);
  EXPECT_EQ(j["userCount"], 2);
  EXPECT_EQ(j["challenge"]["title"], "Sum of numbers");
}

TEST(RoomStoreTest, ArchiveMovesRoomToHistory) {
  codebattle::RoomStore store;
  store.Insert(MakeRoom("AB12", codebattle::RoomPhase::kActive, 2));
  auto record = store.Archive("AB12", {"p2@x", "p1@x", "opponent_left"}, std::chrono::system_clock::now());
  ASSERT_TRUE(record.has_value());
  EXPECT_FALSE(store.Contains("AB12"));
  EXPECT_EQ(record->room.phase, codebattle::RoomPhase::kEnded);
  for (const auto& member : record->room.members) {
    EXPECT_FALSE(member.connection_id.has_value());
  }
  ASSERT_EQ(store.History().size(), 1u);
  auto j = codebattle::ToJson(store.History()[0]);
  EXPECT_EQ(j["winner"], "p2@x");
  EXPECT_EQ(j["phase"], "ended");
  EXPECT_TRUE(j.contains("completedAt"));
  EXPECT_FALSE(store.Archive("AB12", {"p2@x", "p1@x", "opponent_left"}, std::chrono::system_clock::now()).has_value());
}

TEST(RoomStoreTest, SnapshotRoundTripKeepsRoomsAndDropsConnections) {
  codebattle::RoomStore store;
  store.Insert(MakeRoom("AB12", codebattle::RoomPhase::kActive, 2));
  store.Insert(MakeRoom("CD34", codebattle::RoomPhase::kWaiting, 0));
  auto snapshot = store.ToSnapshot();
  EXPECT_EQ(snapshot.dump().find("conn-1"), std::string::npos);

  codebattle::RoomStore restored;
  restored.RestoreFromSnapshot(snapshot);
  ASSERT_EQ(restored.RoomIds(), (std::vector<std::string>{"AB12", "CD34"}));
  const auto* active = restored.Find("AB12");
  ASSERT_NE(active, nullptr);
  EXPECT_EQ(active->phase, codebattle::RoomPhase::kActive);
  EXPECT_EQ(active->challenge["title"], "Sum of numbers");
  ASSERT_EQ(active->members.size(), 2u);
  EXPECT_EQ(active->members[0].party_id, "p1@x");
  EXPECT_FALSE(active->members[0].connection_id.has_value());
  EXPECT_TRUE(active->started_at.has_value());
  EXPECT_TRUE(restored.Find("CD34")->members.empty());
}

TEST(RoomStoreTest, RestoreFallsBackToStartedFlag) {
  nlohmann::json snapshot = nlohmann::json::array(
      {{{"roomId", "AB12"}, {"challenge", nullptr}, {"started", true}, {"users", nlohmann::json::array()}}});
  codebattle::RoomStore store;
  store.RestoreFromSnapshot(snapshot);
  EXPECT_EQ(store.Find("AB12")->phase, codebattle::RoomPhase::kActive);
}

TEST(RoomStoreTest, InvalidSnapshotLeavesStoreUntouched) {
  codebattle::RoomStore store;
  store.Insert(MakeRoom("AB12", codebattle::RoomPhase::kWaiting, 1));

  EXPECT_THROW(store.RestoreFromSnapshot(nlohmann::json::object()), std::invalid_argument);
  nlohmann::json duplicate = nlohmann::json::array({{{"roomId", "X1"}}, {{"roomId", "X1"}}});
  EXPECT_THROW(store.RestoreFromSnapshot(duplicate), std::invalid_argument);
  nlohmann::json ended = nlohmann::json::array({{{"roomId", "X2"}, {"phase", "ended"}}});
  EXPECT_THROW(store.RestoreFromSnapshot(ended), std::invalid_argument);
  nlohmann::json crowded = nlohmann::json::array(
      {{{"roomId", "X3"},
        {"users", {{{"email", "a"}}, {{"email", "b"}}, {{"email", "c"}}}}}});
  EXPECT_THROW(store.RestoreFromSnapshot(crowded), std::invalid_argument);

  EXPECT_EQ(store.Size(), 1u);
  EXPECT_TRUE(store.Contains("AB12"));
}
