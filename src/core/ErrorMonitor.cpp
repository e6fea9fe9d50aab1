/* @file ErrorMonitor.cpp
 * @brief de-duplicating failure sink
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace keel {
  namespace core {

    void ErrorMonitor::registerEscalation(Escalation cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message, const std::string& hint) {
      forwardIfNew(Failure{ message, hint });
    }

    std::vector<Failure> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    bool ErrorMonitor::empty() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.empty();
    }

    void ErrorMonitor::forwardIfNew(const Failure& failure) {
      Escalation cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        auto dup = std::find_if(seen_.begin(), seen_.end(), [&](const Failure& f) {
          return f.message == failure.message;
        });
        if (dup != seen_.end())
          return;
        seen_.push_back(failure);
        cb = escalation_;
      }
      // call outside the lock, the callback may log
      if (cb)
        cb(failure);
    }

  } // namespace core
} // namespace keel
