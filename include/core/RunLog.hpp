#pragma once
/** @file  RunLog.hpp
 *  @brief Span / RunLog data contracts produced by the SpanTracer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <vector>

#include "core/LogRecord.hpp"
#include "core/Value.hpp"

namespace labsim::core {

  /**
 * @struct Span
 * @brief One traced command: nesting depth at its Before, the command payload,
 *        and the log records emitted until its matching After.
 */
  struct Span {
    std::size_t level{ 0 };
    Value payload = Value::object();
    std::vector<LogRecord> logs;
  };

  using RunLog = std::vector<Span>;

} // namespace labsim::core
