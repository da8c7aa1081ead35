/* @file Logger.cpp
 * @brief record fan-out to sinks, optional forwarding into spdlog
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// spdlog / fmt headers
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// labsim headers
#include "core/Logger.hpp"

using namespace labsim::core;

namespace {

  spdlog::level::level_enum toSpdlog(Severity s) {
    switch (s) {
    case Severity::Debug:
      return spdlog::level::debug;
    case Severity::Info:
      return spdlog::level::info;
    case Severity::Warning:
      return spdlog::level::warn;
    case Severity::Error:
      return spdlog::level::err;
    case Severity::Critical:
      return spdlog::level::critical;
    }
    return spdlog::level::info;
  }

} // namespace

std::shared_ptr<spdlog::logger> labsim::core::diagnostics() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get("labsim"))
      return existing;
    return spdlog::stderr_color_mt("labsim");
  }();
  return logger;
}

void Logger::setLevel(Severity level) {
  std::lock_guard<std::mutex> lock(mtx_);
  level_ = level;
}

Severity Logger::level() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return level_;
}

void Logger::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mtx_);
  propagate_ = propagate;
}

bool Logger::propagate() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return propagate_;
}

Logger::SinkId Logger::addSink(std::shared_ptr<LogSink> sink, Severity minimum) {
  if (!sink)
    throw std::invalid_argument("[Logger] cannot register a null sink");

  std::lock_guard<std::mutex> lock(mtx_);
  const SinkId id = nextId_++;
  sinks_.push_back(Registration{ id, minimum, std::move(sink) });
  return id;
}

bool Logger::removeSink(SinkId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = std::find_if(sinks_.begin(), sinks_.end(),
                         [id](const Registration& r) { return r.id == id; });
  if (it == sinks_.end())
    return false;
  sinks_.erase(it);
  return true;
}

std::size_t Logger::sinkCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return sinks_.size();
}

void Logger::log(LogRecord record) {
  std::vector<Registration> targets;
  bool propagate = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (record.severity < level_)
      return;
    targets = sinks_; // snapshot: sinks may (un)register or log while we deliver
    propagate = propagate_;
  }

  for (const auto& target : targets) {
    if (record.severity >= target.minimum)
      target.sink->receive(record);
  }

  if (propagate)
    forward(record);
}

void Logger::forward(const LogRecord& record) const {
  std::string text;
  try {
    text = renderMessage(record);
  } catch (const fmt::format_error& e) {
    diagnostics()->warn("[Logger] cannot apply args to '{}' from {}: {}", record.message,
                        record.moduleName, e.what());
    text = record.message;
  }
  diagnostics()->log(toSpdlog(record.severity), "({}) {}", record.moduleName, text);
}
