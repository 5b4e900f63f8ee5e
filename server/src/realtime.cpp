/*
 * 설명: 연결 등록/해제, 방 가입, 단일/다중/전체 이벤트 전달을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/realtime_coordinator_test.cpp
 */
#include "fanout/realtime.hpp"

namespace fanout {

ConnectionId RealtimeCoordinator::Attach(const std::shared_ptr<EventSink>& sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  ConnectionId id = next_id_++;
  connections_[id] = Entry{sink, {}};
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
  return id;
}

void RealtimeCoordinator::Detach(ConnectionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    return;
  }
  for (const auto& group : it->second.groups) {
    auto group_it = groups_.find(group);
    if (group_it == groups_.end()) {
      continue;
    }
    group_it->second.erase(id);
    if (group_it->second.empty()) {
      groups_.erase(group_it);
    }
  }
  connections_.erase(it);
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

bool RealtimeCoordinator::JoinGroup(const std::string& group, ConnectionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    return false;
  }
  it->second.groups.insert(group);
  groups_[group].insert(id);
  return true;
}

std::vector<ConnectionId> RealtimeCoordinator::GroupMembers(const std::string& group) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(group);
  if (it == groups_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

std::size_t RealtimeCoordinator::SendEvent(ConnectionId id, const std::string& event, const nlohmann::json& payload) {
  return SendEventTo({id}, event, payload);
}

std::size_t RealtimeCoordinator::SendEventTo(const std::vector<ConnectionId>& ids, const std::string& event,
                                             const nlohmann::json& payload) {
  auto sinks = Collect(ids);
  for (const auto& sink : sinks) {
    sink->SendServerEvent(event, payload);
  }
  return sinks.size();
}

std::size_t RealtimeCoordinator::Broadcast(const std::string& event, const nlohmann::json& payload) {
  std::vector<std::shared_ptr<EventSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks.reserve(connections_.size());
    for (const auto& [id, entry] : connections_) {
      if (auto sink = entry.sink.lock()) {
        sinks.push_back(std::move(sink));
      }
    }
  }
  for (const auto& sink : sinks) {
    sink->SendServerEvent(event, payload);
  }
  return sinks.size();
}

void RealtimeCoordinator::SendError(ConnectionId id, const std::string& code, const std::string& message) {
  for (const auto& sink : Collect({id})) {
    sink->SendServerError(code, message);
  }
}

std::size_t RealtimeCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::vector<std::shared_ptr<EventSink>> RealtimeCoordinator::Collect(const std::vector<ConnectionId>& ids) const {
  std::vector<std::shared_ptr<EventSink>> sinks;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto id : ids) {
    auto it = connections_.find(id);
    if (it == connections_.end()) {
      continue;
    }
    if (auto sink = it->second.sink.lock()) {
      sinks.push_back(std::move(sink));
    }
  }
  return sinks;
}

}  // namespace fanout
