#pragma once
/** @file  LogInterceptor.hpp
 *  @brief Buffering LogSink whose queue is drained by the SpanTracer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "core/Logger.hpp"

namespace labsim::core {

  /**
 * @class LogInterceptor
 * @brief Enqueues records as they arrive; never formats, never blocks on a consumer.
 *
 *  * Any number of emitters (including nested emission from inside a command)
 *    vs. a single draining consumer.
 */
  class LogInterceptor final : public LogSink {
  public:
    LogInterceptor() = default;
    ~LogInterceptor() override = default;

    void receive(const LogRecord& record) override;

    /// Move out everything buffered since the previous drain, in emission order.
    std::vector<LogRecord> drain();

    /// Drop buffered records without handing them to anyone.
    void discard();

    std::size_t pending() const;

  private:
    mutable std::mutex mtx_;
    std::deque<LogRecord> queue_;
  };

} // namespace labsim::core
