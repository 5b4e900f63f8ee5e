/*
 * 설명: 구조화 로그 출력과 메트릭 카운터를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "fanout/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace fanout {

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::SetOnlineUsers(std::uint64_t count) { online_users_.store(count); }

void Observability::IncrementMessagesRelayed() { messages_relayed_.fetch_add(1); }

void Observability::IncrementReactionsApplied() { reactions_applied_.fetch_add(1); }

void Observability::IncrementUpdatesPublished() { updates_published_.fetch_add(1); }

void Observability::IncrementBroadcastSkipped() { broadcasts_skipped_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.online_users = online_users_.load();
  snapshot.messages_relayed = messages_relayed_.load();
  snapshot.reactions_applied = reactions_applied_.load();
  snapshot.updates_published = updates_published_.load();
  snapshot.broadcasts_skipped = broadcasts_skipped_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["level"] = ToString(ctx.level);
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  // 여러 워커 스레드가 동시에 기록하므로 한 줄 단위로 직렬화한다.
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::Info(const std::string& name, const std::string& detail) const {
  LogContext ctx;
  ctx.name = name;
  ctx.level = LogLevel::kInfo;
  ctx.detail = detail;
  Log(ctx);
}

void Observability::Warn(const std::string& name, const std::string& detail) const {
  LogContext ctx;
  ctx.name = name;
  ctx.level = LogLevel::kWarn;
  ctx.detail = detail;
  Log(ctx);
}

void Observability::Error(const std::string& name, const std::string& detail) const {
  LogContext ctx;
  ctx.name = name;
  ctx.level = LogLevel::kError;
  ctx.detail = detail;
  Log(ctx);
}

}  // namespace fanout
