/* @file LogInterceptor.cpp
 * @brief mutex-guarded record queue between the Logger and the SpanTracer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <iterator>

#include "core/LogInterceptor.hpp"

using namespace labsim::core;

void LogInterceptor::receive(const LogRecord& record) {
  std::lock_guard<std::mutex> lock(mtx_);
  queue_.push_back(record);
}

std::vector<LogRecord> LogInterceptor::drain() {
  std::deque<LogRecord> taken;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    taken.swap(queue_);
  }
  return std::vector<LogRecord>(std::make_move_iterator(taken.begin()),
                                std::make_move_iterator(taken.end()));
}

void LogInterceptor::discard() {
  std::lock_guard<std::mutex> lock(mtx_);
  queue_.clear();
}

std::size_t LogInterceptor::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}
