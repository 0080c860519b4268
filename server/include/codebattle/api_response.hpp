/*
 * 설명: HTTP 응답 엔벨로프와 WS 메시지 엔벨로프 생성/파싱을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace codebattle {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// 양방향 공통 WS 메시지: {"type": ..., "payload": {...}}
struct WsEnvelope {
  std::string type;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

// 실패 시 error_code 에 invalid_json 또는 missing_type 을 채운다.
std::optional<WsEnvelope> ParseWsEnvelope(std::string_view raw, std::string& error_code);

}  // namespace codebattle
