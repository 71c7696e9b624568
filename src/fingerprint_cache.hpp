#ifndef COUNTERFIT_FINGERPRINT_CACHE_HPP
#define COUNTERFIT_FINGERPRINT_CACHE_HPP

#include "sample.hpp"

namespace counterfit {

// Memo of model outputs keyed by the exact bytes of the input. Entries are never evicted.
// All public methods are thread-safe.
struct FingerprintCache {
  std::optional<Output> get(const FingerprintKey &key) const;

  // Overwriting an existing key is allowed; the model is deterministic so the value is the same.
  void put(const FingerprintKey &key, const Output &output);

  size_t size() const;

  inline std::optional<Output> get(const Sample &sample) const { return get(sample.fingerprint()); }

 private:
  mutable std::mutex mutex_{};
  std::unordered_map<FingerprintKey, Output> entries_{};
};

}

#endif //COUNTERFIT_FINGERPRINT_CACHE_HPP
