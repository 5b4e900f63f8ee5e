/*
 * 설명: 사용자 ↔ 연결 양방향 색인으로 다중 연결 접속 상태를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "fanout/realtime.hpp"
#include "fanout/social_types.hpp"

namespace fanout {

// 사용자 항목은 연결이 하나 이상일 때만 존재한다. 마지막 연결이 빠지는 즉시 삭제된다.
class ConnectionRegistry {
 public:
  void Associate(const UserId& user_id, ConnectionId connection);

  // 이 호출로 사용자의 연결 집합이 비었을 때만 소유 사용자를 반환한다.
  std::optional<UserId> Disassociate(ConnectionId connection);

  // 사용자의 모든 연결을 제거하고 제거된 연결 목록을 반환한다.
  std::vector<ConnectionId> DisassociateUser(const UserId& user_id);

  bool IsOnline(const UserId& user_id) const;
  std::set<UserId> OnlineUserIds() const;
  std::vector<ConnectionId> ConnectionsOf(const UserId& user_id) const;
  std::optional<UserId> OwnerOf(ConnectionId connection) const;
  std::size_t OnlineCount() const;

 private:
  std::unordered_map<UserId, std::unordered_set<ConnectionId>> user_connections_;
  std::unordered_map<ConnectionId, UserId> connection_owner_;
  mutable std::mutex mutex_;
};

}  // namespace fanout
