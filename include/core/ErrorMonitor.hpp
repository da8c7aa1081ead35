#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace labsim::core {

  /**
 * @class ErrorMonitor
 * @brief The dispatcher calls `notifyFailure()` for every fatal simulation
 *        error; we call the registered escalation callback exactly once per
 *        unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures: re-simulating the same broken protocol
 *   reproduces the same message and is reported once.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fatal fault to the host application.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called on fault; forwards to the escalation callback if not seen before.
    virtual void notifyFailure(const std::string& message);

    /// Number of distinct failures seen so far.
    std::size_t uniqueFailures() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace labsim::core
