/*
 * 설명: 라이브 방 테이블(생성 순서 유지)과 종료된 방의 히스토리를 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "codebattle/room.hpp"

namespace codebattle {

// 동기화하지 않는다. 호출자(RoomCoordinator)가 상호배제를 보장한다.
class RoomStore {
 public:
  bool Insert(Room room);
  Room* Find(const std::string& room_id);
  const Room* Find(const std::string& room_id) const;
  bool Contains(const std::string& room_id) const { return rooms_.count(room_id) > 0; }
  bool Erase(const std::string& room_id);

  // 결과를 기록하고 라이브 테이블에서 히스토리로 옮긴다. 방이 없거나 이미 종료됐으면 nullopt.
  std::optional<HistoryRecord> Archive(const std::string& room_id, RoomOutcome outcome,
                                       std::chrono::system_clock::time_point completed_at);

  std::size_t Size() const { return rooms_.size(); }
  std::vector<std::string> RoomIds() const { return order_; }
  std::vector<RoomSummary> Summaries() const;
  const std::vector<HistoryRecord>& History() const { return history_; }

  nlohmann::json ToSnapshot() const;
  // 기존 라이브 방을 모두 버리고 스냅샷으로 교체한다. 잘못된 스냅샷이면 예외를 던지고 상태는 바뀌지 않는다.
  void RestoreFromSnapshot(const nlohmann::json& snapshot);

 private:
  std::unordered_map<std::string, Room> rooms_;
  std::vector<std::string> order_;
  std::vector<HistoryRecord> history_;
};

}  // namespace codebattle
