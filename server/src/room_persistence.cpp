/*
 * 설명: 스냅샷/히스토리 쓰기를 요청 처리 경로와 분리된 strand 에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_persistence_test.cpp
 */
#include "codebattle/room_persistence.hpp"

#include <exception>

#include <boost/asio/post.hpp>

namespace codebattle {

RoomPersistence::RoomPersistence(boost::asio::io_context& ioc, std::shared_ptr<DurableStore> store,
                                 std::string snapshot_key, std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)), store_(std::move(store)), snapshot_key_(std::move(snapshot_key)),
      observability_(std::move(observability)) {}

bool RoomPersistence::Restore(RoomStore& rooms) {
  try {
    auto payload = store_->Load(snapshot_key_);
    if (!payload) {
      if (observability_) {
        observability_->Log(LogContext{LogLevel::kInfo, "snapshot_absent", std::nullopt, std::nullopt, std::nullopt,
                                       "저장된 방이 없어 빈 상태로 시작합니다"});
      }
      return false;
    }
    rooms.RestoreFromSnapshot(nlohmann::json::parse(*payload));
    if (observability_) {
      observability_->Log(LogContext{LogLevel::kInfo, "snapshot_restored", std::nullopt, std::nullopt, std::nullopt,
                                     "복원된 방 수: " + std::to_string(rooms.Size())});
    }
    return true;
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->IncrementPersistenceFailure();
      observability_->Log(LogContext{LogLevel::kError, "snapshot_restore_failed", std::nullopt, std::nullopt,
                                     std::nullopt, ex.what()});
    }
    return false;
  }
}

void RoomPersistence::ScheduleSnapshot(const nlohmann::json& snapshot) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_snapshot_ = snapshot.dump();
  }
  Kick();
}

void RoomPersistence::ScheduleArchive(HistoryRecord record) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_archives_.push_back(std::move(record));
  }
  Kick();
}

void RoomPersistence::Kick() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (draining_) {
      return;
    }
    draining_ = true;
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->Drain(); });
}

void RoomPersistence::Drain() {
  for (;;) {
    std::optional<std::string> snapshot;
    std::deque<HistoryRecord> archives;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!pending_snapshot_ && pending_archives_.empty()) {
        draining_ = false;
        return;
      }
      snapshot.swap(pending_snapshot_);
      archives.swap(pending_archives_);
    }

    for (const auto& record : archives) {
      try {
        store_->AppendHistory(record);
      } catch (const std::exception& ex) {
        if (observability_) {
          observability_->IncrementPersistenceFailure();
          observability_->Log(LogContext{LogLevel::kError, "history_write_failed", std::nullopt, record.room.id,
                                         std::nullopt, ex.what()});
        }
      }
    }

    if (snapshot) {
      try {
        store_->Save(snapshot_key_, *snapshot);
        if (observability_) {
          observability_->Log(LogContext{LogLevel::kDebug, "snapshot_saved", std::nullopt, std::nullopt, std::nullopt,
                                         snapshot_key_});
        }
      } catch (const std::exception& ex) {
        if (observability_) {
          observability_->IncrementPersistenceFailure();
          observability_->Log(LogContext{LogLevel::kError, "snapshot_write_failed", std::nullopt, std::nullopt,
                                         std::nullopt, ex.what()});
        }
      }
    }
  }
}

}  // namespace codebattle
