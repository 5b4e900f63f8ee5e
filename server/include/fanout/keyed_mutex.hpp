/*
 * 설명: 문자열 키별 상호 배제를 제공한다. 같은 키는 직렬화되고 다른 키는 서로 막지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/keyed_mutex_test.cpp, server/tests/unit/reaction_aggregator_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fanout {

class KeyedMutex {
 private:
  struct Slot {
    std::mutex mutex;
    std::size_t holders{0};
  };

 public:
  class Guard {
   public:
    Guard(KeyedMutex& owner, std::string key, std::shared_ptr<Slot> slot);
    Guard(Guard&& other) noexcept;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard& operator=(Guard&&) = delete;
    ~Guard();

   private:
    KeyedMutex* owner_;
    std::string key_;
    std::shared_ptr<Slot> slot_;
  };

  Guard Lock(const std::string& key);
  std::size_t ActiveKeys() const;

 private:
  void Release(const std::string& key, const std::shared_ptr<Slot>& slot);

  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
  mutable std::mutex mutex_;
};

}  // namespace fanout
