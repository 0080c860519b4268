/*
 * 설명: 방 멤버/단일 연결/전체 연결로 메시지를 best-effort 로 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcaster_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "codebattle/connection_registry.hpp"
#include "codebattle/observability.hpp"
#include "codebattle/room.hpp"

namespace codebattle {

class Broadcaster {
 public:
  Broadcaster(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability);

  // 전달에 성공하면 true. 연결이 없거나 송신이 실패하면 false 이고 예외는 전파하지 않는다.
  bool SendTo(const std::string& connection_id, const std::string& type, const nlohmann::json& payload);
  // except_party 에 해당하는 멤버와 연결이 없는 멤버는 건너뛴다. 전달된 수를 반환한다.
  std::size_t BroadcastToRoom(const Room& room, const std::string& type, const nlohmann::json& payload,
                              const std::optional<std::string>& except_party = std::nullopt);
  std::size_t BroadcastToAll(const std::string& type, const nlohmann::json& payload);

 private:
  bool Deliver(const std::string& connection_id, const std::string& message);

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace codebattle
