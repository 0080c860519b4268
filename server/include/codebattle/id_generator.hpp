/*
 * 설명: 방/연결 식별자로 쓰는 무작위 16진 문자열을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_coordinator_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace codebattle {

using IdGenerator = std::function<std::string()>;

// byte_count 바이트를 소문자 16진수로 인코딩한다 (결과 길이는 byte_count * 2).
std::string RandomHexId(std::size_t byte_count);

IdGenerator MakeRandomHexIdGenerator(std::size_t byte_count);

}  // namespace codebattle
