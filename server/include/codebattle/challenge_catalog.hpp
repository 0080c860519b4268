/*
 * 설명: 방 생성 시 배정할 문제(challenge) 목록을 보관하고 무작위로 하나를 고른다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_catalog_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace codebattle {

class ChallengeCatalog {
 public:
  // 비어 있으면 std::invalid_argument 를 던진다.
  explicit ChallengeCatalog(std::vector<nlohmann::json> challenges);

  static std::shared_ptr<ChallengeCatalog> BuiltIn();
  // JSON 배열 파일을 읽는다. 파일이 없거나 형식이 잘못되면 std::runtime_error 를 던진다.
  static std::shared_ptr<ChallengeCatalog> LoadFromFile(const std::string& path);

  nlohmann::json Next();
  std::size_t Size() const { return challenges_.size(); }

 private:
  std::vector<nlohmann::json> challenges_;
  std::mt19937 gen_;
  std::mutex mutex_;
};

}  // namespace codebattle
