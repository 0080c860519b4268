/*
 * 설명: 방 생성/입장/퇴장/연결 종료/중계 이벤트를 처리하는 방 상태 머신이다.
 *       RoomStore, PresenceTracker, Broadcaster, RoomPersistence 를 하나의 임계 구역 안에서 함께 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_coordinator_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codebattle/broadcaster.hpp"
#include "codebattle/challenge_catalog.hpp"
#include "codebattle/connection_registry.hpp"
#include "codebattle/id_generator.hpp"
#include "codebattle/observability.hpp"
#include "codebattle/presence_tracker.hpp"
#include "codebattle/room_persistence.hpp"
#include "codebattle/room_store.hpp"

namespace codebattle {

struct CoordinatorConfig {
  std::chrono::seconds session_time_budget{300};
};

class RoomCoordinator {
 public:
  // persistence 와 observability 는 nullptr 일 수 있다.
  RoomCoordinator(std::shared_ptr<RoomStore> store, std::shared_ptr<ConnectionRegistry> registry,
                  std::shared_ptr<ChallengeCatalog> challenges, std::shared_ptr<RoomPersistence> persistence,
                  std::shared_ptr<Observability> observability, CoordinatorConfig config = {});

  void SetRoomIdGenerator(IdGenerator generator);
  void SetConnectionIdGenerator(IdGenerator generator);

  // 복원 등으로 RoomStore 가 외부에서 바뀐 뒤 참가자 색인을 다시 만든다.
  void RebuildPresence();

  // 새 연결을 등록하고 welcome 을 보낸다. 발급한 연결 식별자를 반환한다.
  std::string Connect(const std::shared_ptr<ConnectionHandle>& handle);
  // 원본 WS 텍스트를 파싱해 type 별로 분기한다.
  void HandleMessage(const std::string& connection_id, const std::string& raw);

  std::string CreateRoom(const std::string& connection_id);
  void ListRooms(const std::string& connection_id);
  // 실패 시 error_code 에 missing_email / room_not_found / room_full 을 채우고 join_error 를 응답한다.
  bool JoinRoom(const std::string& connection_id, const std::string& room_id, const nlohmann::json& user_data,
                std::string& error_code);
  // 방이 없거나 요청 연결이 멤버가 아니면 false (no-op).
  bool LeaveRoom(const std::string& connection_id, const std::string& room_id);
  // 이후의 Disconnect 는 연결 등록만 해제하고 방 상태(진행 중인 게임 포함)는 건드리지 않는다.
  // 서버 종료 시 남은 세션이 정리되면서 게임이 판정되는 것을 막는다.
  void BeginShutdown();
  bool ShuttingDown() const { return shutting_down_.load(); }

  // leave 와 같지만 응답할 요청자가 없다. 연결 등록도 해제한다.
  void Disconnect(const std::string& connection_id, const ConnectionHandle* handle = nullptr);
  bool RelayChat(const std::string& connection_id, const std::string& room_id, const nlohmann::json& message);
  bool RelayEvent(const std::string& connection_id, const std::string& room_id, const std::string& event,
                  const nlohmann::json& payload);

  std::vector<RoomSummary> ListRoomSummaries() const;
  std::optional<Room> FindRoom(const std::string& room_id) const;
  std::vector<HistoryRecord> History() const;
  std::optional<PresenceEntry> PresenceOf(const std::string& connection_id) const;
  std::size_t LiveRoomCount() const;

 private:
  // 퇴장 처리의 공통 경로. requester 가 있으면 그 연결에 left_room / you_left 를 응답한다.
  bool DepartLocked(const std::string& room_id, const std::string& party_id,
                    const std::optional<std::string>& requester);
  void EndGameLocked(Room& room, const RoomMember& leaving, const std::optional<std::string>& requester);
  void ReleaseRoomPresenceLocked(const Room& room);
  nlohmann::json RoomsListPayloadLocked() const;
  void BroadcastRoomsListLocked();
  void PersistLocked();
  nlohmann::json JoinedPayload(const Room& room) const;
  void ReplyError(const std::string& connection_id, const std::string& message,
                  const std::optional<std::string>& type = std::nullopt);
  void Log(LogLevel level, const std::string& name, const std::optional<std::string>& connection_id,
           const std::optional<std::string>& room_id, const std::optional<std::string>& party_id,
           const std::string& detail = "") const;

  std::shared_ptr<RoomStore> store_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<ChallengeCatalog> challenges_;
  std::shared_ptr<RoomPersistence> persistence_;
  std::shared_ptr<Observability> observability_;
  Broadcaster broadcaster_;
  PresenceTracker presence_;
  CoordinatorConfig config_;
  IdGenerator room_id_generator_;
  IdGenerator connection_id_generator_;
  mutable std::mutex mutex_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace codebattle
