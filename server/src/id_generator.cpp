/*
 * 설명: 스레드별 난수 엔진으로 16진 식별자를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_coordinator_test.cpp
 */
#include "codebattle/id_generator.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace codebattle {
namespace {
std::string BytesToHex(const std::vector<unsigned char>& data) {
  std::ostringstream oss;
  for (unsigned char byte : data) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}
}  // namespace

std::string RandomHexId(std::size_t byte_count) {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<unsigned char> buffer(byte_count);
  for (auto& b : buffer) {
    b = static_cast<unsigned char>(dist(gen));
  }
  return BytesToHex(buffer);
}

IdGenerator MakeRandomHexIdGenerator(std::size_t byte_count) {
  return [byte_count]() { return RandomHexId(byte_count); };
}

}  // namespace codebattle
