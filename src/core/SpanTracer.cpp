/* @file SpanTracer.cpp
 * @brief span nesting over the command topic, log attachment at After
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iterator>
#include <utility>

// spdlog headers
#include <spdlog/spdlog.h>

// labsim headers
#include "core/LifecycleEvent.hpp"
#include "core/SpanTracer.hpp"

using namespace labsim::core;

SpanTracer::SpanTracer(EventBus& bus, std::string topic, Logger& logger,
                       std::optional<Severity> filter)
    : logger_(logger) {
  if (filter) {
    interceptor_ = std::make_shared<LogInterceptor>();
    sinkId_ = logger_.addSink(interceptor_, *filter);
  }
  subscription_ =
      bus.subscribe(std::move(topic), [this](const Value& message) { onCommand(message); });
}

SpanTracer::~SpanTracer() { release(); }

void SpanTracer::release() {
  subscription_.release();
  if (sinkId_) {
    logger_.removeSink(*sinkId_);
    sinkId_.reset();
  }
  if (interceptor_)
    interceptor_->discard();
}

RunLog SpanTracer::takeRunLog() {
  release();
  RunLog out = std::move(runLog_);
  runLog_.clear();
  return out;
}

void SpanTracer::onCommand(const Value& message) {
  auto event = LifecycleEvent::fromMessage(message);
  if (!event) {
    diagnostics()->warn("[SpanTracer] ignoring malformed command message: {}", message.dump());
    return;
  }

  if (event->phase == Phase::Before)
    onBefore(std::move(event->payload));
  else
    onAfter();
}

void SpanTracer::onBefore(Value payload) {
  runLog_.push_back(Span{ depth_, std::move(payload), {} });
  ++depth_;
}

void SpanTracer::onAfter() {
  if (interceptor_) {
    auto records = interceptor_->drain();
    // an After with nothing traced yet has nowhere to put its logs
    if (!runLog_.empty()) {
      auto& logs = runLog_.back().logs;
      logs.insert(logs.end(), std::make_move_iterator(records.begin()),
                  std::make_move_iterator(records.end()));
    }
  }
  if (depth_ > 0)
    --depth_;
}
