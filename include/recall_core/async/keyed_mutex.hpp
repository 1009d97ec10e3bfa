#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace recall_core::async {

/**
 * A map of mutexes created on demand per key. Holders of different keys never
 * block each other; entries are dropped once no thread holds or waits on them.
 */
class KeyedMutex {
 private:
  struct Entry {
    std::mutex mutex;
    std::size_t users = 0;  // holders plus waiters, guarded by table_mutex_
  };

 public:
  class Guard {
   public:
    Guard(Guard &&other) noexcept;
    Guard &operator=(Guard &&) = delete;
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    ~Guard();

    const std::string &key() const { return key_; }

   private:
    friend class KeyedMutex;
    Guard(KeyedMutex *owner, std::string key, std::shared_ptr<Entry> entry);

    KeyedMutex *owner_;
    std::string key_;
    std::shared_ptr<Entry> entry_;
  };

  KeyedMutex() = default;
  KeyedMutex(const KeyedMutex &) = delete;
  KeyedMutex &operator=(const KeyedMutex &) = delete;

  // Blocks until the key is free
  Guard lock(const std::string &key);

  std::size_t active_keys() const;

 private:
  void release(const std::string &key, const std::shared_ptr<Entry> &entry);

  mutable std::mutex table_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace recall_core::async
