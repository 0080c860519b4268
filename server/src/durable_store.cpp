/*
 * 설명: 방 스냅샷 upsert 와 히스토리 append 를 MariaDB 에 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "codebattle/durable_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace codebattle {
namespace {
constexpr const char* kCreateSnapshots =
    "CREATE TABLE IF NOT EXISTS room_snapshots ("
    " snapshot_key VARCHAR(64) NOT NULL PRIMARY KEY,"
    " payload LONGTEXT NOT NULL,"
    " updated_at DATETIME(6) NOT NULL"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";

constexpr const char* kCreateHistory =
    "CREATE TABLE IF NOT EXISTS room_history ("
    " id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " room_id VARCHAR(64) NOT NULL,"
    " winner VARCHAR(255) NOT NULL,"
    " loser VARCHAR(255) NOT NULL,"
    " reason VARCHAR(32) NOT NULL,"
    " completed_at DATETIME NOT NULL,"
    " record LONGTEXT NOT NULL,"
    " KEY idx_room_history_room (room_id)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";
}  // namespace

MariaDbDurableStore::MariaDbDurableStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void MariaDbDurableStore::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, kCreateSnapshots, "room_snapshots 생성 실패");
    db_client_->Execute(conn, kCreateHistory, "room_history 생성 실패");
  });
}

std::optional<std::string> MariaDbDurableStore::Load(const std::string& key) {
  std::optional<std::string> payload;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT payload FROM room_snapshots WHERE snapshot_key='" << db_client_->Escape(conn, key) << "';";
    payload = db_client_->QueryScalar(conn, oss.str(), "스냅샷 조회 실패");
  });
  return payload;
}

void MariaDbDurableStore::Save(const std::string& key, const std::string& value) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO room_snapshots(snapshot_key, payload, updated_at) VALUES('" << db_client_->Escape(conn, key)
        << "', '" << db_client_->Escape(conn, value) << "', NOW(6)) "
        << "ON DUPLICATE KEY UPDATE payload=VALUES(payload), updated_at=VALUES(updated_at);";
    db_client_->Execute(conn, oss.str(), "스냅샷 저장 실패");
    return true;
  });
}

void MariaDbDurableStore::AppendHistory(const HistoryRecord& record) {
  const auto& room = record.room;
  std::string winner = room.outcome ? room.outcome->winner : "";
  std::string loser = room.outcome ? room.outcome->loser : "";
  std::string reason = room.outcome ? room.outcome->reason : "";
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO room_history(room_id, winner, loser, reason, completed_at, record) VALUES('"
        << db_client_->Escape(conn, room.id) << "', '" << db_client_->Escape(conn, winner) << "', '"
        << db_client_->Escape(conn, loser) << "', '" << db_client_->Escape(conn, reason) << "', '"
        << ToTimestamp(record.completed_at) << "', '" << db_client_->Escape(conn, ToJson(record).dump()) << "');";
    db_client_->Execute(conn, oss.str(), "히스토리 저장 실패");
    return true;
  });
}

std::size_t MariaDbDurableStore::HistoryCount() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto value = db_client_->QueryScalar(conn, "SELECT COUNT(*) FROM room_history;", "히스토리 카운트 실패");
    count = value ? static_cast<std::size_t>(std::stoull(*value)) : 0;
  });
  return count;
}

std::optional<std::string> MariaDbDurableStore::FindLatestHistory(const std::string& room_id) const {
  std::optional<std::string> record;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT record FROM room_history WHERE room_id='" << db_client_->Escape(conn, room_id)
        << "' ORDER BY id DESC LIMIT 1;";
    record = db_client_->QueryScalar(conn, oss.str(), "히스토리 조회 실패");
  });
  return record;
}

void MariaDbDurableStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM room_snapshots;", "스냅샷 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM room_history;", "히스토리 삭제 실패");
  });
}

std::string MariaDbDurableStore::ToTimestamp(const std::chrono::system_clock::time_point& tp) const {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace codebattle
