#include "keyed_mutex.hpp"

namespace sandbox::lock {

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key) : owner_(owner), key_(std::move(key)) {
}

KeyedMutex::Guard::Guard(Guard&& other) noexcept : owner_(other.owner_), key_(std::move(other.key_)) {
  other.owner_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
  if (owner_ != nullptr) {
    owner_->Release(key_);
  }
}

KeyedMutex::Guard KeyedMutex::Acquire(const std::string& key) {
  std::unique_lock lock(mutex_);
  auto&            entry  = entries_[key];
  const uint64_t   ticket = entry.next_ticket++;
  ++entry.refs;

  // unordered_map references stay valid across rehash
  cv_.wait(lock, [&] { return entry.now_serving == ticket; });
  return Guard(this, key);
}

void KeyedMutex::Release(const std::string& key) {
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(key);
    if (it == entries_.end()) return;

    ++it->second.now_serving;
    if (--it->second.refs == 0) {
      entries_.erase(it);
    }
  }
  cv_.notify_all();
}

std::size_t KeyedMutex::ActiveKeys() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace sandbox::lock
