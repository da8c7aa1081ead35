#pragma once
/** @file  SpanTracer.hpp
 *  @brief Turns command lifecycle events + intercepted logs into a nested RunLog.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "core/EventBus.hpp"
#include "core/LogInterceptor.hpp"
#include "core/Logger.hpp"
#include "core/RunLog.hpp"

namespace labsim::core {

  /**
 * @class SpanTracer
 * @brief One instance per simulation run.
 *
 *  * Subscribes once to \p topic; traffic on any other topic is never seen.
 *  * Before → append Span{level = depth}, depth++.
 *  * After  → drain intercepted logs into the last span, depth-- (clamped at 0).
 *  * A null \p filter ("none") registers no log sink at all; only span
 *    structure is tracked.
 *  * `release()` detaches from bus and logger exactly once; later calls are
 *    no-ops. Records still buffered at release are discarded.
 */
  class SpanTracer {
  public:
    SpanTracer(EventBus& bus, std::string topic, Logger& logger,
               std::optional<Severity> filter);
    ~SpanTracer();

    //---public API------------------------------------------------------
    /// Live view during the run, frozen view after release().
    const RunLog& runLog() const noexcept { return runLog_; }

    std::size_t depth() const noexcept { return depth_; }
    bool attached() const noexcept { return subscription_.active(); }
    bool interceptsLogs() const noexcept { return interceptor_ != nullptr; }

    void release();

    /// release() and hand the RunLog over to the caller.
    RunLog takeRunLog();

    SpanTracer(const SpanTracer&) = delete;
    SpanTracer& operator=(const SpanTracer&) = delete;

  private:
    void onCommand(const Value& message);
    void onBefore(Value payload);
    void onAfter();

    Logger& logger_;
    std::shared_ptr<LogInterceptor> interceptor_;
    std::optional<Logger::SinkId> sinkId_;
    RunLog runLog_;
    std::size_t depth_{ 0 };
    Subscription subscription_; ///< last member: torn down first
  };

} // namespace labsim::core
