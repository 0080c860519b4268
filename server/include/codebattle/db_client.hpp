/*
 * 설명: MariaDB 연결과 일시 오류 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace codebattle {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work 가 true 를 반환하면 커밋, false 면 롤백한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  // 첫 행 첫 열을 반환한다. 행이 없거나 NULL 이면 nullopt.
  std::optional<std::string> QueryScalar(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::string Escape(MYSQL* conn, const std::string& value) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

 private:
  MYSQL* Connect() const;
  void RunWithRetry(bool transactional, const std::function<bool(MYSQL*)>& work, bool& committed) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
};

}  // namespace codebattle
