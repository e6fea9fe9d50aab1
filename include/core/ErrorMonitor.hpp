#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central failure aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace keel::core {

  /// One reported failure and what the operator should do about it.
  struct Failure {
    std::string message;
    std::string hint;
  };

  /**
 * @class ErrorMonitor
 * @brief Stages call `notifyFailure()`; we call the registered escalation
 *        callback exactly once per unique failure.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the summary lists each hint once.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const Failure&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a failure (typically to the Logger).
    void registerEscalation(Escalation cb);

    /// Called on fault; forwards to the escalation callback if new.
    virtual void notifyFailure(const std::string& message, const std::string& hint = {});

    /// Snapshot of unique failures in report order.
    std::vector<Failure> failures() const;

    bool empty() const;

  private:
    void forwardIfNew(const Failure& failure);

    Escalation escalation_{};
    std::vector<Failure> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace keel::core
