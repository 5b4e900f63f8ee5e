/*
 * 설명: MariaDB 연결, 쿼리 헬퍼, 일시 오류 재시도 정책을 캡슐화한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "fanout/social_store.hpp"

namespace fanout {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public StoreError {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : StoreError(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

using DbRow = std::vector<std::optional<std::string>>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::vector<DbRow> Select(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::uint64_t LastInsertId(MYSQL* conn) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;
  std::string Quote(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace fanout
