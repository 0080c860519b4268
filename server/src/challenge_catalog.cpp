/*
 * 설명: 내장 샘플 문제와 파일 기반 문제 목록을 로딩한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_catalog_test.cpp
 */
#include "codebattle/challenge_catalog.hpp"

#include <fstream>
#include <stdexcept>

namespace codebattle {

ChallengeCatalog::ChallengeCatalog(std::vector<nlohmann::json> challenges)
    : challenges_(std::move(challenges)), gen_(std::random_device{}()) {
  if (challenges_.empty()) {
    throw std::invalid_argument("문제 목록이 비어 있습니다");
  }
}

std::shared_ptr<ChallengeCatalog> ChallengeCatalog::BuiltIn() {
  nlohmann::json sum_of_numbers{
      {"title", "Sum of numbers"},
      {"description", "Write a function that returns the sum of the integers from 1 to n."},
      {"examples", nlohmann::json::array({{{"input", "5"}, {"output", "15"}}, {{"input", "10"}, {"output", "55"}}})},
      {"testCases",
       nlohmann::json::array({{{"input", "10"}, {"expectedOutput", "55"}}, {{"input", "100"}, {"expectedOutput", "5050"}}})}};
  return std::make_shared<ChallengeCatalog>(std::vector<nlohmann::json>{sum_of_numbers});
}

std::shared_ptr<ChallengeCatalog> ChallengeCatalog::LoadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("문제 파일을 열 수 없습니다: " + path);
  }
  auto parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array() || parsed.empty()) {
    throw std::runtime_error("문제 파일은 비어 있지 않은 JSON 배열이어야 합니다: " + path);
  }
  std::vector<nlohmann::json> challenges;
  for (const auto& entry : parsed) {
    if (!entry.is_object()) {
      throw std::runtime_error("문제 항목은 객체여야 합니다: " + path);
    }
    challenges.push_back(entry);
  }
  return std::make_shared<ChallengeCatalog>(std::move(challenges));
}

nlohmann::json ChallengeCatalog::Next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (challenges_.size() == 1) {
    return challenges_.front();
  }
  std::uniform_int_distribution<std::size_t> dist(0, challenges_.size() - 1);
  return challenges_[dist(gen_)];
}

}  // namespace codebattle
