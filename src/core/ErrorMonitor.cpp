/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// ferry headers
#include "core/ErrorMonitor.hpp"

using namespace ferry::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

std::size_t ErrorMonitor::uniqueFailures() const {
  std::lock_guard lock(mtx_);
  return seen_.size();
}

void ErrorMonitor::forwardIfNew(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard lock(mtx_);
    if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
      return;
    seen_.push_back(message);
    cb = escalation_;
  }
  // callback runs unlocked so it may call back into the monitor
  if (cb)
    cb(message);
}
