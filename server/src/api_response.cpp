/*
 * 설명: JSON 응답 엔벨로프를 생성하고 WS 메시지를 직렬화/파싱한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "codebattle/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace codebattle {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["type"] = env.type;
  j["payload"] = env.payload.is_null() ? nlohmann::json::object() : env.payload;
  return j;
}

std::optional<WsEnvelope> ParseWsEnvelope(std::string_view raw, std::string& error_code) {
  auto message = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    error_code = "invalid_json";
    return std::nullopt;
  }
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string() || type_it->get<std::string>().empty()) {
    error_code = "missing_type";
    return std::nullopt;
  }
  WsEnvelope env{.type = type_it->get<std::string>(), .payload = nlohmann::json::object()};
  auto payload_it = message.find("payload");
  if (payload_it != message.end() && payload_it->is_object()) {
    env.payload = *payload_it;
  }
  return env;
}

}  // namespace codebattle
