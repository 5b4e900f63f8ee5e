/*
 * 설명: 구조화 로그(JSON 라인)와 접속/전달 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace fanout {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::uint64_t> connection_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t online_users{0};
  std::uint64_t messages_relayed{0};
  std::uint64_t reactions_applied{0};
  std::uint64_t updates_published{0};
  std::uint64_t broadcasts_skipped{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void SetOnlineUsers(std::uint64_t count);
  void IncrementMessagesRelayed();
  void IncrementReactionsApplied();
  void IncrementUpdatesPublished();
  void IncrementBroadcastSkipped();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  void Info(const std::string& name, const std::string& detail) const;
  void Warn(const std::string& name, const std::string& detail) const;
  void Error(const std::string& name, const std::string& detail) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> online_users_{0};
  std::atomic<std::uint64_t> messages_relayed_{0};
  std::atomic<std::uint64_t> reactions_applied_{0};
  std::atomic<std::uint64_t> updates_published_{0};
  std::atomic<std::uint64_t> broadcasts_skipped_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace fanout
