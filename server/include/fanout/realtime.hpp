/*
 * 설명: 연결된 모든 WebSocket 세션과 사용자별 방(그룹)을 관리하고 서버 이벤트를 팬아웃한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/realtime_coordinator_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "fanout/observability.hpp"

namespace fanout {

using ConnectionId = std::uint64_t;

// 연결 하나의 핸들러 상태. 해당 연결의 strand에서만 변경된다.
struct ConnectionContext {
  ConnectionId id{0};
  std::optional<std::string> user_id;
};

// 서버 이벤트를 받는 연결 측 인터페이스. 어느 스레드에서든 호출될 수 있다.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void SendServerEvent(const std::string& event, const nlohmann::json& payload) = 0;
  virtual void SendServerError(const std::string& code, const std::string& message) = 0;
};

class RealtimeCoordinator {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  ConnectionId Attach(const std::shared_ptr<EventSink>& sink);
  void Detach(ConnectionId id);
  bool JoinGroup(const std::string& group, ConnectionId id);
  std::vector<ConnectionId> GroupMembers(const std::string& group) const;

  // 반환값은 실제로 전달된 연결 수다. 이미 끊긴 연결은 건너뛴다.
  std::size_t SendEvent(ConnectionId id, const std::string& event, const nlohmann::json& payload);
  std::size_t SendEventTo(const std::vector<ConnectionId>& ids, const std::string& event,
                          const nlohmann::json& payload);
  std::size_t Broadcast(const std::string& event, const nlohmann::json& payload);
  void SendError(ConnectionId id, const std::string& code, const std::string& message);

  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<EventSink> sink;
    std::set<std::string> groups;
  };

  std::vector<std::shared_ptr<EventSink>> Collect(const std::vector<ConnectionId>& ids) const;

  std::unordered_map<ConnectionId, Entry> connections_;
  std::unordered_map<std::string, std::set<ConnectionId>> groups_;
  ConnectionId next_id_{1};
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace fanout
