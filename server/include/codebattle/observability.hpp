/*
 * 설명: 구조화 로그(JSON 라인)와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace codebattle {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::optional<std::string> connection_id;
  std::optional<std::string> room_id;
  std::optional<std::string> party_id;
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t websocket_active{0};
  std::uint64_t live_rooms{0};
  std::uint64_t rooms_created{0};
  std::uint64_t games_ended{0};
  std::uint64_t delivery_failures{0};
  std::uint64_t persistence_failures{0};
  std::uint64_t malformed_messages{0};
};

class Observability {
 public:
  Observability() = default;
  // 테스트에서 로그 출력을 가로채기 위해 출력 스트림을 주입할 수 있다.
  Observability(LogLevel min_level, std::ostream& out);

  void SetMinLevel(LogLevel level) { min_level_.store(level); }
  void Log(const LogContext& ctx) const;

  void SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }
  void IncrementRoomsCreated() { rooms_created_.fetch_add(1); }
  void IncrementGamesEnded() { games_ended_.fetch_add(1); }
  void IncrementDeliveryFailure() { delivery_failures_.fetch_add(1); }
  void IncrementPersistenceFailure() { persistence_failures_.fetch_add(1); }
  void IncrementMalformed() { malformed_messages_.fetch_add(1); }

  MetricsSnapshot Snapshot(std::uint64_t live_rooms) const;

 private:
  std::atomic<LogLevel> min_level_{LogLevel::kInfo};
  std::ostream* out_{nullptr};
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> rooms_created_{0};
  std::atomic<std::uint64_t> games_ended_{0};
  std::atomic<std::uint64_t> delivery_failures_{0};
  std::atomic<std::uint64_t> persistence_failures_{0};
  std::atomic<std::uint64_t> malformed_messages_{0};
};

}  // namespace codebattle
