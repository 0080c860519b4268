/*
 * 설명: 연결 -> (방, 참가자), 참가자 -> (방, 연결) 역색인을 유지해 재입장 판별과 O(1) 연결 종료 처리를 지원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_tracker_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace codebattle {

struct PresenceEntry {
  std::string room_id;
  std::string party_id;
};

// 동기화하지 않는다. RoomCoordinator 의 임계 구역 안에서만 갱신한다.
class PresenceTracker {
 public:
  // 참가자를 방/연결에 묶는다. 참가자의 이전 연결 매핑은 제거된다.
  void Bind(const std::string& connection_id, const std::string& room_id, const std::string& party_id);
  // 연결 없이 방 소속만 기록한다 (스냅샷 복원 직후 상태).
  void Track(const std::string& room_id, const std::string& party_id);
  // 참가자와 그 연결 매핑을 모두 제거한다.
  void Release(const std::string& party_id);
  // 연결 매핑만 제거하고 참가자의 방 소속은 유지한다.
  void Detach(const std::string& connection_id);
  void Clear();

  std::optional<PresenceEntry> FindByConnection(const std::string& connection_id) const;
  std::optional<std::string> RoomOf(const std::string& party_id) const;
  std::optional<std::string> ConnectionOf(const std::string& party_id) const;
  std::size_t BoundConnections() const { return by_connection_.size(); }
  std::size_t TrackedParties() const { return by_party_.size(); }

 private:
  struct PartyEntry {
    std::string room_id;
    std::optional<std::string> connection_id;
  };

  std::unordered_map<std::string, PresenceEntry> by_connection_;
  std::unordered_map<std::string, PartyEntry> by_party_;
};

}  // namespace codebattle
