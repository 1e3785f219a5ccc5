/*
 * 설명: MariaDB 연결, 트랜잭션 재시도 정책과 조회 보조 함수를 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace ranking {

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

  // work가 false를 반환하면 롤백한다. 반환값은 커밋 여부.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  // 결과 행마다 on_row를 호출한다.
  void QueryRows(MYSQL* conn, const std::string& sql, const std::string& ctx,
                 const std::function<void(MYSQL_ROW)>& on_row) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  [[noreturn]] void RaiseErrorAndClose(MYSQL* conn, const std::string& ctx) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 5;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace ranking
