#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sandbox::lock {

/*
  Registry of per-key mutexes.

  Waiters on one key are served in arrival order (ticket lock); different
  keys never contend beyond the registry guard. Entries are dropped once
  no holder or waiter references them.
*/
class KeyedMutex {
 public:
  class Guard {
   public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&)       = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

    const std::string& Key() const {
      return key_;
    }

   private:
    friend class KeyedMutex;
    Guard(KeyedMutex* owner, std::string key);

    KeyedMutex* owner_;
    std::string key_;
  };

  KeyedMutex() = default;

  KeyedMutex(const KeyedMutex&)            = delete;
  KeyedMutex& operator=(const KeyedMutex&) = delete;

  // Blocks until the caller holds `key`.
  [[nodiscard]] Guard Acquire(const std::string& key);

  // Number of keys currently held or waited on.
  std::size_t ActiveKeys() const;

 private:
  struct Entry {
    uint64_t    next_ticket = 0;
    uint64_t    now_serving = 0;
    std::size_t refs        = 0;
  };

  void Release(const std::string& key);

  mutable std::mutex                     mutex_;
  std::condition_variable                cv_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace sandbox::lock
