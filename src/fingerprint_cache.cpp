#include "fingerprint_cache.hpp"

namespace counterfit {

std::optional<Output> FingerprintCache::get(const FingerprintKey &key) const {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) { return std::nullopt; }
  return it->second;
}

void FingerprintCache::put(const FingerprintKey &key, const Output &output) {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  entries_[key] = output;
}

size_t FingerprintCache::size() const {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  return entries_.size();
}

}
