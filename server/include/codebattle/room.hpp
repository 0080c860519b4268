/*
 * 설명: 방(room)과 멤버, 결과, 히스토리 레코드의 데이터 모델과 영속 JSON 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace codebattle {

enum class RoomPhase { kWaiting, kActive, kEnded };

std::string_view ToString(RoomPhase phase);
std::optional<RoomPhase> ParseRoomPhase(std::string_view value);

struct RoomMember {
  std::string party_id;
  // 연결이 끊겼거나 스냅샷에서 복원된 멤버는 비어 있다. 영속화하지 않는다.
  std::optional<std::string> connection_id;
  nlohmann::json profile;
};

struct RoomOutcome {
  std::string winner;
  std::string loser;
  std::string reason;
};

struct Room {
  static constexpr std::size_t kCapacity = 2;

  std::string id;
  std::vector<RoomMember> members;
  nlohmann::json challenge;
  RoomPhase phase{RoomPhase::kWaiting};
  std::optional<RoomOutcome> outcome;
  std::chrono::system_clock::time_point created_at{};
  std::optional<std::chrono::system_clock::time_point> started_at;

  RoomMember* FindMember(const std::string& party_id);
  const RoomMember* FindMember(const std::string& party_id) const;
  const RoomMember* FindMemberByConnection(const std::string& connection_id) const;
  bool IsFull() const { return members.size() >= kCapacity; }
  bool Started() const { return phase != RoomPhase::kWaiting; }
  nlohmann::json Profiles() const;
};

struct HistoryRecord {
  Room room;
  std::chrono::system_clock::time_point completed_at;
};

struct RoomSummary {
  std::string room_id;
  std::size_t user_count;
  nlohmann::json challenge;
};

nlohmann::json ToJson(const RoomSummary& summary);
nlohmann::json ToJson(const HistoryRecord& record);

// 영속 스냅샷용 표현. 연결 식별자는 포함하지 않는다.
nlohmann::json ToPersistedJson(const Room& room);
// 잘못된 레코드는 std::invalid_argument 를 던진다.
Room RoomFromPersistedJson(const nlohmann::json& record);

std::string ToIsoString(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> ParseIsoString(const std::string& text);

}  // namespace codebattle
