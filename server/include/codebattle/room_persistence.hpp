/*
 * 설명: 방 스냅샷을 전용 strand 에서 비동기로 저장(최신본만 병합)하고 시작 시 복원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_persistence_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>

#include "codebattle/durable_store.hpp"
#include "codebattle/observability.hpp"
#include "codebattle/room_store.hpp"

namespace codebattle {

class RoomPersistence : public std::enable_shared_from_this<RoomPersistence> {
 public:
  RoomPersistence(boost::asio::io_context& ioc, std::shared_ptr<DurableStore> store, std::string snapshot_key,
                  std::shared_ptr<Observability> observability);

  // 저장소에서 스냅샷을 읽어 rooms 를 교체한다. 스냅샷이 없거나 읽기에 실패하면 false 이고 rooms 는 그대로다.
  bool Restore(RoomStore& rooms);

  // 호출 즉시 반환한다. 대기 중인 이전 스냅샷은 새 스냅샷으로 대체된다.
  void ScheduleSnapshot(const nlohmann::json& snapshot);
  void ScheduleArchive(HistoryRecord record);

  const std::string& SnapshotKey() const { return snapshot_key_; }

 private:
  void Drain();
  void Kick();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::shared_ptr<DurableStore> store_;
  std::string snapshot_key_;
  std::shared_ptr<Observability> observability_;

  std::mutex mutex_;
  std::optional<std::string> pending_snapshot_;
  std::deque<HistoryRecord> pending_archives_;
  bool draining_{false};
};

}  // namespace codebattle
