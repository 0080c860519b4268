/*
 * 설명: 방 스냅샷과 종료 히스토리를 저장하는 영속 저장소 인터페이스와 MariaDB 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp, server/tests/unit/room_persistence_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "codebattle/db_client.hpp"
#include "codebattle/room.hpp"

namespace codebattle {

// 구현은 실패 시 예외를 던진다. 호출자(RoomPersistence)가 잡아서 기록한다.
class DurableStore {
 public:
  virtual ~DurableStore() = default;
  virtual std::optional<std::string> Load(const std::string& key) = 0;
  virtual void Save(const std::string& key, const std::string& value) = 0;
  virtual void AppendHistory(const HistoryRecord& record) = 0;
};

class MariaDbDurableStore : public DurableStore {
 public:
  explicit MariaDbDurableStore(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() const;

  std::optional<std::string> Load(const std::string& key) override;
  void Save(const std::string& key, const std::string& value) override;
  void AppendHistory(const HistoryRecord& record) override;

  std::size_t HistoryCount() const;
  // 가장 최근에 기록된 해당 방의 히스토리 JSON.
  std::optional<std::string> FindLatestHistory(const std::string& room_id) const;
  void ClearAll() const;

 private:
  std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace codebattle
