/*
 * 설명: 레지스트리에서 살아 있는 연결을 찾아 메시지를 전달하고 실패는 로그로만 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcaster_test.cpp
 */
#include "codebattle/broadcaster.hpp"

#include <exception>

#include "codebattle/api_response.hpp"

namespace codebattle {

Broadcaster::Broadcaster(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), observability_(std::move(observability)) {}

bool Broadcaster::SendTo(const std::string& connection_id, const std::string& type, const nlohmann::json& payload) {
  WsEnvelope env{.type = type, .payload = payload};
  return Deliver(connection_id, ToWsJson(env).dump());
}

std::size_t Broadcaster::BroadcastToRoom(const Room& room, const std::string& type, const nlohmann::json& payload,
                                         const std::optional<std::string>& except_party) {
  WsEnvelope env{.type = type, .payload = payload};
  const auto message = ToWsJson(env).dump();
  std::size_t delivered = 0;
  for (const auto& member : room.members) {
    if (except_party && member.party_id == *except_party) {
      continue;
    }
    if (!member.connection_id) {
      continue;
    }
    if (Deliver(*member.connection_id, message)) {
      ++delivered;
    }
  }
  return delivered;
}

std::size_t Broadcaster::BroadcastToAll(const std::string& type, const nlohmann::json& payload) {
  WsEnvelope env{.type = type, .payload = payload};
  const auto message = ToWsJson(env).dump();
  std::size_t delivered = 0;
  for (const auto& connection_id : registry_->ConnectionIds()) {
    if (Deliver(connection_id, message)) {
      ++delivered;
    }
  }
  return delivered;
}

bool Broadcaster::Deliver(const std::string& connection_id, const std::string& message) {
  auto handle = registry_->Find(connection_id);
  if (!handle) {
    return false;
  }
  try {
    handle->Send(message);
    return true;
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->IncrementDeliveryFailure();
      observability_->Log(LogContext{LogLevel::kWarn, "delivery_failed", connection_id, std::nullopt, std::nullopt,
                                     ex.what()});
    }
    return false;
  }
}

}  // namespace codebattle
