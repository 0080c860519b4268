/*
 * 설명: MariaDB 연결, 쿼리 헬퍼, 일시 오류 재시도를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "codebattle/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace codebattle {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    try {
      RaiseError(conn, "연결 실패");
    } catch (...) {
      mysql_close(conn);
      throw;
    }
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  bool committed = false;
  RunWithRetry(true, work, committed);
  return committed;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  bool ignored = false;
  RunWithRetry(
      false,
      [&work](MYSQL* conn) {
        work(conn);
        return true;
      },
      ignored);
}

void MariaDbClient::RunWithRetry(bool transactional, const std::function<bool(MYSQL*)>& work,
                                 bool& committed) const {
  for (std::size_t attempt = 1;; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      conn = Connect();
      if (transactional) {
        mysql_autocommit(conn, 0);
      }
      bool commit = work(conn);
      if (transactional) {
        if (commit) {
          if (mysql_commit(conn) != 0) {
            RaiseError(conn, "커밋 실패");
          }
        } else {
          mysql_rollback(conn);
        }
      }
      mysql_close(conn);
      committed = commit;
      return;
    } catch (const DbException& ex) {
      if (conn) {
        if (transactional) {
          mysql_rollback(conn);
        }
        mysql_close(conn);
      }
      if (ex.retryable && attempt < kMaxAttempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    } catch (...) {
      if (conn) {
        if (transactional) {
          mysql_rollback(conn);
        }
        mysql_close(conn);
      }
      throw;
    }
  }
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
    RaiseError(conn, ctx);
  }
}

std::optional<std::string> MariaDbClient::QueryScalar(MYSQL* conn, const std::string& sql,
                                                      const std::string& ctx) const {
  Execute(conn, sql, ctx);
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  std::optional<std::string> value;
  MYSQL_ROW row = mysql_fetch_row(res);
  if (row && row[0]) {
    unsigned long* lengths = mysql_fetch_lengths(res);
    value = std::string(row[0], lengths ? lengths[0] : std::char_traits<char>::length(row[0]));
  }
  mysql_free_result(res);
  return value;
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

}  // namespace codebattle
