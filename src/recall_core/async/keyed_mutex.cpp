#include "recall_core/async/keyed_mutex.hpp"

namespace recall_core::async {

KeyedMutex::Guard::Guard(KeyedMutex *owner, std::string key, std::shared_ptr<Entry> entry)
    : owner_(owner), key_(std::move(key)), entry_(std::move(entry)) {}

KeyedMutex::Guard::Guard(Guard &&other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), entry_(std::move(other.entry_)) {
  other.owner_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
  if (owner_ && entry_) {
    owner_->release(key_, entry_);
  }
}

KeyedMutex::Guard KeyedMutex::lock(const std::string &key) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> table_lock(table_mutex_);
    auto &slot = entries_[key];
    if (!slot) {
      slot = std::make_shared<Entry>();
    }
    ++slot->users;
    entry = slot;
  }

  entry->mutex.lock();
  return Guard(this, key, std::move(entry));
}

void KeyedMutex::release(const std::string &key, const std::shared_ptr<Entry> &entry) {
  entry->mutex.unlock();

  std::lock_guard<std::mutex> table_lock(table_mutex_);
  if (--entry->users == 0) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second == entry) {
      entries_.erase(it);
    }
  }
}

std::size_t KeyedMutex::active_keys() const {
  std::lock_guard<std::mutex> table_lock(table_mutex_);
  return entries_.size();
}

}  // namespace recall_core::async
