/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "codebattle/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace codebattle {
namespace {
std::string NowIsoString() {
  auto now = std::chrono::system_clock::now();
  auto tt = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(&out) {}

void Observability::Log(const LogContext& ctx) const {
  if (static_cast<int>(ctx.level) < static_cast<int>(min_level_.load())) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = NowIsoString();
  log_json["level"] = ToString(ctx.level);
  log_json["eventName"] = ctx.name;
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (ctx.room_id) {
    log_json["roomId"] = *ctx.room_id;
  }
  if (ctx.party_id) {
    log_json["partyId"] = *ctx.party_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(out_mutex_);
  std::ostream& out = out_ ? *out_ : std::cout;
  out << log_json.dump() << std::endl;
}

MetricsSnapshot Observability::Snapshot(std::uint64_t live_rooms) const {
  MetricsSnapshot snapshot;
  snapshot.websocket_active = websocket_active_.load();
  snapshot.live_rooms = live_rooms;
  snapshot.rooms_created = rooms_created_.load();
  snapshot.games_ended = games_ended_.load();
  snapshot.delivery_failures = delivery_failures_.load();
  snapshot.persistence_failures = persistence_failures_.load();
  snapshot.malformed_messages = malformed_messages_.load();
  return snapshot;
}

}  // namespace codebattle
