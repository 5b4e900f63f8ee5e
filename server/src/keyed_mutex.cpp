/*
 * 설명: 참조 카운트 기반 키별 뮤텍스 테이블을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "fanout/keyed_mutex.hpp"

namespace fanout {

KeyedMutex::Guard::Guard(KeyedMutex& owner, std::string key, std::shared_ptr<Slot> slot)
    : owner_(&owner), key_(std::move(key)), slot_(std::move(slot)) {
  slot_->mutex.lock();
}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), slot_(std::move(other.slot_)) {
  other.owner_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
  if (!owner_ || !slot_) {
    return;
  }
  slot_->mutex.unlock();
  owner_->Release(key_, slot_);
}

KeyedMutex::Guard KeyedMutex::Lock(const std::string& key) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = slots_[key];
    if (!entry) {
      entry = std::make_shared<Slot>();
    }
    entry->holders++;
    slot = entry;
  }
  return Guard(*this, key, std::move(slot));
}

std::size_t KeyedMutex::ActiveKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.size();
}

void KeyedMutex::Release(const std::string& key, const std::shared_ptr<Slot>& slot) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (--slot->holders > 0) {
    return;
  }
  auto it = slots_.find(key);
  if (it != slots_.end() && it->second == slot) {
    slots_.erase(it);
  }
}

}  // namespace fanout
