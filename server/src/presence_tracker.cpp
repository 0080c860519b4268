/*
 * 설명: 연결/참가자 역색인을 갱신하고 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_tracker_test.cpp
 */
#include "codebattle/presence_tracker.hpp"

namespace codebattle {

void PresenceTracker::Bind(const std::string& connection_id, const std::string& room_id,
                           const std::string& party_id) {
  auto party_it = by_party_.find(party_id);
  if (party_it != by_party_.end() && party_it->second.connection_id &&
      *party_it->second.connection_id != connection_id) {
    by_connection_.erase(*party_it->second.connection_id);
  }
  auto conn_it = by_connection_.find(connection_id);
  if (conn_it != by_connection_.end() && conn_it->second.party_id != party_id) {
    auto other = by_party_.find(conn_it->second.party_id);
    if (other != by_party_.end()) {
      other->second.connection_id.reset();
    }
  }
  by_connection_[connection_id] = PresenceEntry{room_id, party_id};
  by_party_[party_id] = PartyEntry{room_id, connection_id};
}

void PresenceTracker::Track(const std::string& room_id, const std::string& party_id) {
  auto party_it = by_party_.find(party_id);
  if (party_it != by_party_.end() && party_it->second.connection_id) {
    by_connection_.erase(*party_it->second.connection_id);
  }
  by_party_[party_id] = PartyEntry{room_id, std::nullopt};
}

void PresenceTracker::Release(const std::string& party_id) {
  auto party_it = by_party_.find(party_id);
  if (party_it == by_party_.end()) {
    return;
  }
  if (party_it->second.connection_id) {
    auto conn_it = by_connection_.find(*party_it->second.connection_id);
    if (conn_it != by_connection_.end() && conn_it->second.party_id == party_id) {
      by_connection_.erase(conn_it);
    }
  }
  by_party_.erase(party_it);
}

void PresenceTracker::Detach(const std::string& connection_id) {
  auto conn_it = by_connection_.find(connection_id);
  if (conn_it == by_connection_.end()) {
    return;
  }
  auto party_it = by_party_.find(conn_it->second.party_id);
  if (party_it != by_party_.end()) {
    party_it->second.connection_id.reset();
  }
  by_connection_.erase(conn_it);
}

void PresenceTracker::Clear() {
  by_connection_.clear();
  by_party_.clear();
}

std::optional<PresenceEntry> PresenceTracker::FindByConnection(const std::string& connection_id) const {
  auto it = by_connection_.find(connection_id);
  if (it == by_connection_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> PresenceTracker::RoomOf(const std::string& party_id) const {
  auto it = by_party_.find(party_id);
  if (it == by_party_.end()) {
    return std::nullopt;
  }
  return it->second.room_id;
}

std::optional<std::string> PresenceTracker::ConnectionOf(const std::string& party_id) const {
  auto it = by_party_.find(party_id);
  if (it == by_party_.end()) {
    return std::nullopt;
  }
  return it->second.connection_id;
}

}  // namespace codebattle
