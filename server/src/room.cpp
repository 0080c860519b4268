/*
 * 설명: 방 데이터 모델의 조회 헬퍼와 영속 JSON 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_store_test.cpp
 */
#include "codebattle/room.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace codebattle {

std::string_view ToString(RoomPhase phase) {
  switch (phase) {
    case RoomPhase::kWaiting:
      return "waiting";
    case RoomPhase::kActive:
      return "active";
    case RoomPhase::kEnded:
      return "ended";
  }
  return "waiting";
}

std::optional<RoomPhase> ParseRoomPhase(std::string_view value) {
  if (value == "waiting") {
    return RoomPhase::kWaiting;
  }
  if (value == "active") {
    return RoomPhase::kActive;
  }
  if (value == "ended") {
    return RoomPhase::kEnded;
  }
  return std::nullopt;
}

RoomMember* Room::FindMember(const std::string& party_id) {
  for (auto& member : members) {
    if (member.party_id == party_id) {
      return &member;
    }
  }
  return nullptr;
}

const RoomMember* Room::FindMember(const std::string& party_id) const {
  for (const auto& member : members) {
    if (member.party_id == party_id) {
      return &member;
    }
  }
  return nullptr;
}

const RoomMember* Room::FindMemberByConnection(const std::string& connection_id) const {
  for (const auto& member : members) {
    if (member.connection_id && *member.connection_id == connection_id) {
      return &member;
    }
  }
  return nullptr;
}

nlohmann::json Room::Profiles() const {
  nlohmann::json users = nlohmann::json::array();
  for (const auto& member : members) {
    users.push_back(member.profile);
  }
  return users;
}

nlohmann::json ToJson(const RoomSummary& summary) {
  return {{"roomId", summary.room_id}, {"userCount", summary.user_count}, {"challenge", summary.challenge}};
}

nlohmann::json ToJson(const HistoryRecord& record) {
  nlohmann::json j = ToPersistedJson(record.room);
  j["completedAt"] = ToIsoString(record.completed_at);
  if (record.room.outcome) {
    j["winner"] = record.room.outcome->winner;
    j["loser"] = record.room.outcome->loser;
    j["reason"] = record.room.outcome->reason;
  }
  return j;
}

nlohmann::json ToPersistedJson(const Room& room) {
  nlohmann::json users = nlohmann::json::array();
  for (const auto& member : room.members) {
    users.push_back({{"email", member.party_id}, {"userData", member.profile}});
  }
  nlohmann::json j{{"roomId", room.id},
                   {"challenge", room.challenge},
                   {"started", room.Started()},
                   {"phase", ToString(room.phase)},
                   {"createdAt", ToIsoString(room.created_at)},
                   {"users", users}};
  if (room.started_at) {
    j["startedAt"] = ToIsoString(*room.started_at);
  }
  return j;
}

Room RoomFromPersistedJson(const nlohmann::json& record) {
  if (!record.is_object()) {
    throw std::invalid_argument("방 레코드가 객체가 아닙니다");
  }
  auto id_it = record.find("roomId");
  if (id_it == record.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
    throw std::invalid_argument("roomId 가 없습니다");
  }
  Room room;
  room.id = id_it->get<std::string>();
  room.challenge = record.value("challenge", nlohmann::json());

  std::optional<RoomPhase> phase;
  auto phase_it = record.find("phase");
  if (phase_it != record.end() && phase_it->is_string()) {
    phase = ParseRoomPhase(phase_it->get<std::string>());
  }
  if (!phase) {
    auto started_it = record.find("started");
    bool started = started_it != record.end() && started_it->is_boolean() && started_it->get<bool>();
    phase = started ? RoomPhase::kActive : RoomPhase::kWaiting;
  }
  if (*phase == RoomPhase::kEnded) {
    throw std::invalid_argument("종료된 방은 라이브 스냅샷에 포함될 수 없습니다");
  }
  room.phase = *phase;

  auto users_it = record.find("users");
  if (users_it != record.end()) {
    if (!users_it->is_array()) {
      throw std::invalid_argument("users 가 배열이 아닙니다");
    }
    for (const auto& user : *users_it) {
      if (!user.is_object() || !user.contains("email") || !user["email"].is_string()) {
        throw std::invalid_argument("멤버 email 이 없습니다");
      }
      auto party_id = user["email"].get<std::string>();
      if (room.FindMember(party_id) || room.IsFull()) {
        throw std::invalid_argument("멤버 구성이 올바르지 않습니다");
      }
      room.members.push_back(RoomMember{party_id, std::nullopt, user.value("userData", nlohmann::json::object())});
    }
  }

  auto created_it = record.find("createdAt");
  if (created_it != record.end() && created_it->is_string()) {
    room.created_at = ParseIsoString(created_it->get<std::string>()).value_or(std::chrono::system_clock::now());
  } else {
    room.created_at = std::chrono::system_clock::now();
  }
  auto started_at_it = record.find("startedAt");
  if (started_at_it != record.end() && started_at_it->is_string()) {
    room.started_at = ParseIsoString(started_at_it->get<std::string>());
  }
  return room;
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

std::optional<std::chrono::system_clock::time_point> ParseIsoString(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

}  // namespace codebattle
