#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace collab::rt {

// Striped per-key mutex: keys hashing to the same stripe share a mutex.
// Hold at most one stripe at a time to stay deadlock-free.
class KeyedMutex {
public:
  explicit KeyedMutex(std::size_t stripes = 64)
    : n_(stripes ? stripes : 1), stripes_(std::make_unique<std::mutex[]>(n_)) {}

  std::mutex& forKey(const std::string& key) {
    return stripes_[std::hash<std::string>{}(key) % n_];
  }

  std::size_t stripes() const noexcept { return n_; }

private:
  std::size_t n_;
  std::unique_ptr<std::mutex[]> stripes_;
};

} // namespace collab::rt
