/*
 * 설명: 연결 등록/해제와 접속 사용자 조회를 단일 뮤텍스 아래에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "fanout/connection_registry.hpp"

namespace fanout {

void ConnectionRegistry::Associate(const UserId& user_id, ConnectionId connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto owner_it = connection_owner_.find(connection);
  if (owner_it != connection_owner_.end()) {
    if (owner_it->second == user_id) {
      return;
    }
    // 한 연결은 최대 한 사용자에게만 속한다. 이전 소유자에서 먼저 떼어낸다.
    auto previous = user_connections_.find(owner_it->second);
    if (previous != user_connections_.end()) {
      previous->second.erase(connection);
      if (previous->second.empty()) {
        user_connections_.erase(previous);
      }
    }
  }
  user_connections_[user_id].insert(connection);
  connection_owner_[connection] = user_id;
}

std::optional<UserId> ConnectionRegistry::Disassociate(ConnectionId connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto owner_it = connection_owner_.find(connection);
  if (owner_it == connection_owner_.end()) {
    return std::nullopt;
  }
  UserId owner = owner_it->second;
  connection_owner_.erase(owner_it);
  auto it = user_connections_.find(owner);
  if (it == user_connections_.end()) {
    return std::nullopt;
  }
  it->second.erase(connection);
  if (!it->second.empty()) {
    return std::nullopt;
  }
  user_connections_.erase(it);
  return owner;
}

std::vector<ConnectionId> ConnectionRegistry::DisassociateUser(const UserId& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = user_connections_.find(user_id);
  if (it == user_connections_.end()) {
    return {};
  }
  std::vector<ConnectionId> removed(it->second.begin(), it->second.end());
  for (auto connection : removed) {
    connection_owner_.erase(connection);
  }
  user_connections_.erase(it);
  return removed;
}

bool ConnectionRegistry::IsOnline(const UserId& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return user_connections_.count(user_id) > 0;
}

std::set<UserId> ConnectionRegistry::OnlineUserIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<UserId> ids;
  for (const auto& [user_id, connections] : user_connections_) {
    ids.insert(user_id);
  }
  return ids;
}

std::vector<ConnectionId> ConnectionRegistry::ConnectionsOf(const UserId& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = user_connections_.find(user_id);
  if (it == user_connections_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

std::optional<UserId> ConnectionRegistry::OwnerOf(ConnectionId connection) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connection_owner_.find(connection);
  if (it == connection_owner_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t ConnectionRegistry::OnlineCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return user_connections_.size();
}

}  // namespace fanout
