/*
 * 설명: 방 상태 머신(Waiting -> Active -> Ended / 삭제)과 메시지 분기, 전파, 스냅샷 요청을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_coordinator_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "codebattle/room_coordinator.hpp"

#include <algorithm>

#include "codebattle/api_response.hpp"

namespace codebattle {
namespace {
constexpr std::size_t kIdBytes = 4;
constexpr std::size_t kMaxIdAttempts = 16;

std::string StringField(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

bool IsBlank(const nlohmann::json& value) {
  return value.is_null() || (value.is_string() && value.get<std::string>().empty());
}

nlohmann::json SenderName(const RoomMember& member) {
  auto it = member.profile.find("fullName");
  if (it != member.profile.end() && it->is_string()) {
    return *it;
  }
  return member.party_id;
}
}  // namespace

RoomCoordinator::RoomCoordinator(std::shared_ptr<RoomStore> store, std::shared_ptr<ConnectionRegistry> registry,
                                 std::shared_ptr<ChallengeCatalog> challenges,
                                 std::shared_ptr<RoomPersistence> persistence,
                                 std::shared_ptr<Observability> observability, CoordinatorConfig config)
    : store_(std::move(store)), registry_(std::move(registry)), challenges_(std::move(challenges)),
      persistence_(std::move(persistence)), observability_(std::move(observability)),
      broadcaster_(registry_, observability_), config_(config),
      room_id_generator_(MakeRandomHexIdGenerator(kIdBytes)),
      connection_id_generator_(MakeRandomHexIdGenerator(kIdBytes)) {
  RebuildPresence();
}

void RoomCoordinator::SetRoomIdGenerator(IdGenerator generator) {
  std::lock_guard<std::mutex> lock(mutex_);
  room_id_generator_ = std::move(generator);
}

void RoomCoordinator::SetConnectionIdGenerator(IdGenerator generator) {
  std::lock_guard<std::mutex> lock(mutex_);
  connection_id_generator_ = std::move(generator);
}

void RoomCoordinator::RebuildPresence() {
  std::lock_guard<std::mutex> lock(mutex_);
  presence_.Clear();
  for (const auto& room_id : store_->RoomIds()) {
    const Room* room = store_->Find(room_id);
    for (const auto& member : room->members) {
      if (member.connection_id) {
        presence_.Bind(*member.connection_id, room->id, member.party_id);
      } else {
        presence_.Track(room->id, member.party_id);
      }
    }
  }
}

std::string RoomCoordinator::Connect(const std::shared_ptr<ConnectionHandle>& handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string connection_id;
  for (std::size_t attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto candidate = connection_id_generator_();
    if (!candidate.empty() && !registry_->Contains(candidate)) {
      connection_id = std::move(candidate);
      break;
    }
  }
  if (connection_id.empty()) {
    connection_id = RandomHexId(kIdBytes * 2);
  }
  registry_->Register(connection_id, handle);
  broadcaster_.SendTo(connection_id, "welcome", {{"socketId", connection_id}});
  Log(LogLevel::kInfo, "connected", connection_id, std::nullopt, std::nullopt);
  return connection_id;
}

void RoomCoordinator::HandleMessage(const std::string& connection_id, const std::string& raw) {
  std::string error_code;
  auto env = ParseWsEnvelope(raw, error_code);
  if (!env) {
    if (observability_) {
      observability_->IncrementMalformed();
    }
    Log(LogLevel::kWarn, "malformed_message", connection_id, std::nullopt, std::nullopt, error_code);
    ReplyError(connection_id, error_code);
    return;
  }

  const auto& payload = env->payload;
  if (env->type == "create_room") {
    CreateRoom(connection_id);
  } else if (env->type == "list_rooms") {
    ListRooms(connection_id);
  } else if (env->type == "join_room") {
    auto user_it = payload.find("userData");
    nlohmann::json user_data = user_it == payload.end() ? nlohmann::json::object() : *user_it;
    JoinRoom(connection_id, StringField(payload, "roomId"), user_data, error_code);
  } else if (env->type == "leave_room") {
    auto room_id = StringField(payload, "roomId");
    if (!room_id.empty()) {
      LeaveRoom(connection_id, room_id);
    }
  } else if (env->type == "chat_message") {
    auto message_it = payload.find("message");
    RelayChat(connection_id, StringField(payload, "roomId"),
              message_it == payload.end() ? nlohmann::json() : *message_it);
  } else if (env->type == "room_event") {
    auto inner_it = payload.find("payload");
    RelayEvent(connection_id, StringField(payload, "roomId"), StringField(payload, "event"),
               inner_it == payload.end() ? nlohmann::json::object() : *inner_it);
  } else {
    Log(LogLevel::kDebug, "unknown_type", connection_id, std::nullopt, std::nullopt, env->type);
    ReplyError(connection_id, "unknown_type", env->type);
  }
}

std::string RoomCoordinator::CreateRoom(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string room_id;
  for (std::size_t attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto candidate = room_id_generator_();
    if (!candidate.empty() && !store_->Contains(candidate)) {
      room_id = std::move(candidate);
      break;
    }
  }
  if (room_id.empty()) {
    Log(LogLevel::kError, "room_id_exhausted", connection_id, std::nullopt, std::nullopt);
    ReplyError(connection_id, "room_id_exhausted");
    return {};
  }

  Room room;
  room.id = room_id;
  room.challenge = challenges_->Next();
  room.phase = RoomPhase::kWaiting;
  room.created_at = std::chrono::system_clock::now();
  nlohmann::json challenge = room.challenge;
  store_->Insert(std::move(room));
  if (observability_) {
    observability_->IncrementRoomsCreated();
  }
  Log(LogLevel::kInfo, "room_created", connection_id, room_id, std::nullopt);

  broadcaster_.SendTo(connection_id, "room_created", {{"roomId", room_id}, {"challenge", challenge}});
  BroadcastRoomsListLocked();
  PersistLocked();
  return room_id;
}

void RoomCoordinator::ListRooms(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  broadcaster_.SendTo(connection_id, "rooms_list", RoomsListPayloadLocked());
}

bool RoomCoordinator::JoinRoom(const std::string& connection_id, const std::string& room_id,
                               const nlohmann::json& user_data, std::string& error_code) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto reject = [&](const char* code) {
    error_code = code;
    Log(LogLevel::kInfo, "join_rejected", connection_id, room_id.empty() ? std::nullopt : std::optional(room_id),
        std::nullopt, code);
    broadcaster_.SendTo(connection_id, "join_error", {{"message", code}});
    return false;
  };

  const std::string party_id = user_data.is_object() ? StringField(user_data, "email") : std::string{};
  if (party_id.empty()) {
    return reject("missing_email");
  }
  Room* room = store_->Find(room_id);
  if (!room) {
    return reject("room_not_found");
  }
  if (!room->FindMember(party_id) && room->IsFull()) {
    return reject("room_full");
  }

  // 참가자는 한 번에 하나의 라이브 방에만 속한다. 다른 방(또는 같은 연결의 다른 참가자)은 먼저 퇴장시킨다.
  bool departed = false;
  auto by_connection = presence_.FindByConnection(connection_id);
  if (by_connection && (by_connection->room_id != room_id || by_connection->party_id != party_id)) {
    departed |= DepartLocked(by_connection->room_id, by_connection->party_id, connection_id);
  }
  auto party_room = presence_.RoomOf(party_id);
  if (party_room && *party_room != room_id) {
    departed |= DepartLocked(*party_room, party_id, std::nullopt);
  }
  if (departed) {
    room = store_->Find(room_id);
    if (!room) {
      PersistLocked();
      return reject("room_not_found");
    }
    if (!room->FindMember(party_id) && room->IsFull()) {
      PersistLocked();
      return reject("room_full");
    }
  }

  RoomMember* existing = room->FindMember(party_id);
  if (existing) {
    existing->connection_id = connection_id;
    existing->profile = user_data;
    presence_.Bind(connection_id, room_id, party_id);
    broadcaster_.SendTo(connection_id, "joined_room", JoinedPayload(*room));
    Log(LogLevel::kInfo, "member_rejoined", connection_id, room_id, party_id);
  } else {
    room->members.push_back(RoomMember{party_id, connection_id, user_data});
    presence_.Bind(connection_id, room_id, party_id);
    broadcaster_.SendTo(connection_id, "joined_room", JoinedPayload(*room));
    broadcaster_.BroadcastToRoom(*room, "user_joined", {{"userData", user_data}}, party_id);
    Log(LogLevel::kInfo, "member_joined", connection_id, room_id, party_id);
  }

  BroadcastRoomsListLocked();

  if (room->phase == RoomPhase::kWaiting && room->members.size() == Room::kCapacity) {
    room->phase = RoomPhase::kActive;
    room->started_at = std::chrono::system_clock::now();
    broadcaster_.BroadcastToRoom(*room, "game_started", {{"time", config_.session_time_budget.count()}});
    Log(LogLevel::kInfo, "game_started", std::nullopt, room_id, std::nullopt);
  }

  PersistLocked();
  error_code.clear();
  return true;
}

bool RoomCoordinator::LeaveRoom(const std::string& connection_id, const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Room* room = store_->Find(room_id);
  if (!room) {
    return false;
  }
  const RoomMember* member = room->FindMemberByConnection(connection_id);
  if (!member) {
    return false;
  }
  const std::string party_id = member->party_id;
  bool departed = DepartLocked(room_id, party_id, connection_id);
  if (departed) {
    PersistLocked();
  }
  return departed;
}

void RoomCoordinator::BeginShutdown() {
  if (!shutting_down_.exchange(true)) {
    Log(LogLevel::kInfo, "coordinator_shutdown", std::nullopt, std::nullopt, std::nullopt);
  }
}

void RoomCoordinator::Disconnect(const std::string& connection_id, const ConnectionHandle* handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handle) {
    registry_->Unregister(connection_id, handle);
  } else {
    registry_->Unregister(connection_id);
  }
  Log(LogLevel::kInfo, "disconnected", connection_id, std::nullopt, std::nullopt);
  if (shutting_down_) {
    return;
  }

  auto presence = presence_.FindByConnection(connection_id);
  if (!presence) {
    return;
  }
  const Room* room = store_->Find(presence->room_id);
  const RoomMember* member = room ? room->FindMember(presence->party_id) : nullptr;
  if (!member || member->connection_id != connection_id) {
    presence_.Detach(connection_id);
    return;
  }
  if (DepartLocked(presence->room_id, presence->party_id, std::nullopt)) {
    PersistLocked();
  }
}

bool RoomCoordinator::RelayChat(const std::string& connection_id, const std::string& room_id,
                                const nlohmann::json& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (room_id.empty() || IsBlank(message)) {
    return false;
  }
  const Room* room = store_->Find(room_id);
  if (!room) {
    return false;
  }
  const RoomMember* sender = room->FindMemberByConnection(connection_id);
  if (!sender) {
    return false;
  }
  nlohmann::json payload{{"sender", SenderName(*sender)}, {"senderEmail", sender->party_id}, {"message", message}};
  broadcaster_.BroadcastToRoom(*room, "chat_message", payload, sender->party_id);
  return true;
}

bool RoomCoordinator::RelayEvent(const std::string& connection_id, const std::string& room_id,
                                 const std::string& event, const nlohmann::json& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (room_id.empty() || event.empty()) {
    return false;
  }
  const Room* room = store_->Find(room_id);
  if (!room) {
    return false;
  }
  const RoomMember* sender = room->FindMemberByConnection(connection_id);
  if (!sender) {
    return false;
  }
  nlohmann::json relayed{{"event", event},
                         {"payload", payload},
                         {"sender", SenderName(*sender)},
                         {"senderEmail", sender->party_id}};
  broadcaster_.BroadcastToRoom(*room, "room_event", relayed, sender->party_id);
  return true;
}

std::vector<RoomSummary> RoomCoordinator::ListRoomSummaries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_->Summaries();
}

std::optional<Room> RoomCoordinator::FindRoom(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Room* room = store_->Find(room_id);
  if (!room) {
    return std::nullopt;
  }
  return *room;
}

std::vector<HistoryRecord> RoomCoordinator::History() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_->History();
}

std::optional<PresenceEntry> RoomCoordinator::PresenceOf(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return presence_.FindByConnection(connection_id);
}

std::size_t RoomCoordinator::LiveRoomCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_->Size();
}

bool RoomCoordinator::DepartLocked(const std::string& room_id, const std::string& party_id,
                                   const std::optional<std::string>& requester) {
  Room* room = store_->Find(room_id);
  if (!room) {
    return false;
  }
  auto it = std::find_if(room->members.begin(), room->members.end(),
                         [&party_id](const RoomMember& m) { return m.party_id == party_id; });
  if (it == room->members.end()) {
    return false;
  }
  RoomMember leaving = std::move(*it);
  room->members.erase(it);
  if (presence_.RoomOf(party_id) == room_id) {
    presence_.Release(party_id);
  }

  if (room->phase == RoomPhase::kActive && !room->members.empty()) {
    EndGameLocked(*room, leaving, requester);
  } else {
    broadcaster_.BroadcastToRoom(*room, "user_left", {{"userData", leaving.profile}, {"users", room->Profiles()}});
    if (requester) {
      broadcaster_.SendTo(*requester, "left_room", {{"roomId", room_id}});
    }
    Log(LogLevel::kInfo, "member_left", requester, room_id, party_id);
    if (room->members.empty()) {
      store_->Erase(room_id);
      Log(LogLevel::kInfo, "room_removed", std::nullopt, room_id, std::nullopt);
    }
  }

  BroadcastRoomsListLocked();
  return true;
}

void RoomCoordinator::EndGameLocked(Room& room, const RoomMember& leaving,
                                    const std::optional<std::string>& requester) {
  const RoomMember& winner = room.members.front();
  RoomOutcome outcome{winner.party_id, leaving.party_id, "opponent_left"};
  nlohmann::json payload{{"winner", winner.profile}, {"loser", leaving.profile}, {"reason", "opponent_left"}};
  broadcaster_.BroadcastToRoom(room, "game_ended", payload);
  if (requester) {
    payload["reason"] = "you_left";
    broadcaster_.SendTo(*requester, "game_ended", payload);
  }
  ReleaseRoomPresenceLocked(room);

  const std::string room_id = room.id;
  Log(LogLevel::kInfo, "game_ended", requester, room_id, outcome.winner, "loser=" + outcome.loser);
  // Archive 이후 room 참조는 무효가 된다.
  auto record = store_->Archive(room_id, std::move(outcome), std::chrono::system_clock::now());
  if (!record) {
    return;
  }
  if (observability_) {
    observability_->IncrementGamesEnded();
  }
  if (persistence_) {
    persistence_->ScheduleArchive(std::move(*record));
  }
}

void RoomCoordinator::ReleaseRoomPresenceLocked(const Room& room) {
  for (const auto& member : room.members) {
    if (presence_.RoomOf(member.party_id) == room.id) {
      presence_.Release(member.party_id);
    }
  }
}

nlohmann::json RoomCoordinator::RoomsListPayloadLocked() const {
  nlohmann::json rooms = nlohmann::json::array();
  for (const auto& summary : store_->Summaries()) {
    rooms.push_back(ToJson(summary));
  }
  return {{"rooms", rooms}};
}

void RoomCoordinator::BroadcastRoomsListLocked() { broadcaster_.BroadcastToAll("rooms_list", RoomsListPayloadLocked()); }

void RoomCoordinator::PersistLocked() {
  if (persistence_) {
    persistence_->ScheduleSnapshot(store_->ToSnapshot());
  }
}

nlohmann::json RoomCoordinator::JoinedPayload(const Room& room) const {
  return {{"roomId", room.id},
          {"users", room.Profiles()},
          {"challenge", room.challenge},
          {"started", room.Started()},
          {"phase", ToString(room.phase)}};
}

void RoomCoordinator::ReplyError(const std::string& connection_id, const std::string& message,
                                 const std::optional<std::string>& type) {
  nlohmann::json payload{{"message", message}};
  if (type) {
    payload["type"] = *type;
  }
  broadcaster_.SendTo(connection_id, "error", payload);
}

void RoomCoordinator::Log(LogLevel level, const std::string& name, const std::optional<std::string>& connection_id,
                          const std::optional<std::string>& room_id, const std::optional<std::string>& party_id,
                          const std::string& detail) const {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{level, name, connection_id, room_id, party_id, detail});
}

}  // namespace codebattle
