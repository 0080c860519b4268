/*
 * 설명: 라이브 방 테이블과 히스토리, 스냅샷 직렬화/복원을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_store_test.cpp
 */
#include "codebattle/room_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace codebattle {

bool RoomStore::Insert(Room room) {
  if (room.id.empty() || rooms_.count(room.id) > 0 || room.members.size() > Room::kCapacity) {
    return false;
  }
  order_.push_back(room.id);
  auto id = room.id;
  rooms_.emplace(std::move(id), std::move(room));
  return true;
}

Room* RoomStore::Find(const std::string& room_id) {
  auto it = rooms_.find(room_id);
  return it == rooms_.end() ? nullptr : &it->second;
}

const Room* RoomStore::Find(const std::string& room_id) const {
  auto it = rooms_.find(room_id);
  return it == rooms_.end() ? nullptr : &it->second;
}

bool RoomStore::Erase(const std::string& room_id) {
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return false;
  }
  rooms_.erase(it);
  order_.erase(std::remove(order_.begin(), order_.end(), room_id), order_.end());
  return true;
}

std::optional<HistoryRecord> RoomStore::Archive(const std::string& room_id, RoomOutcome outcome,
                                                std::chrono::system_clock::time_point completed_at) {
  auto it = rooms_.find(room_id);
  if (it == rooms_.end() || it->second.outcome) {
    return std::nullopt;
  }
  Room room = std::move(it->second);
  Erase(room_id);
  room.phase = RoomPhase::kEnded;
  room.outcome = std::move(outcome);
  for (auto& member : room.members) {
    member.connection_id.reset();
  }
  history_.push_back(HistoryRecord{std::move(room), completed_at});
  return history_.back();
}

std::vector<RoomSummary> RoomStore::Summaries() const {
  std::vector<RoomSummary> summaries;
  summaries.reserve(order_.size());
  for (const auto& id : order_) {
    const auto& room = rooms_.at(id);
    summaries.push_back(RoomSummary{room.id, room.members.size(), room.challenge});
  }
  return summaries;
}

nlohmann::json RoomStore::ToSnapshot() const {
  nlohmann::json snapshot = nlohmann::json::array();
  for (const auto& id : order_) {
    snapshot.push_back(ToPersistedJson(rooms_.at(id)));
  }
  return snapshot;
}

void RoomStore::RestoreFromSnapshot(const nlohmann::json& snapshot) {
  if (!snapshot.is_array()) {
    throw std::invalid_argument("스냅샷이 배열이 아닙니다");
  }
  RoomStore restored;
  for (const auto& record : snapshot) {
    if (!restored.Insert(RoomFromPersistedJson(record))) {
      throw std::invalid_argument("중복된 roomId 가 있습니다");
    }
  }
  rooms_ = std::move(restored.rooms_);
  order_ = std::move(restored.order_);
}

}  // namespace codebattle
