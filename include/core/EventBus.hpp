#pragma once
/** @file  EventBus.hpp
 *  @brief Synchronous topic-based publish/subscribe of JSON messages.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Value.hpp"

namespace labsim::core {

  /// Topic on which command lifecycle (before/after) messages are published.
  inline constexpr const char* kCommandTopic = "command";

  class EventBus;

  /**
 * @class Subscription
 * @brief Move-only handle for one bus subscription; released on destruction.
 *
 *  * `release()` is idempotent; releasing after the bus is gone is a no-op.
 */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription() { release(); }

    void release();
    bool active() const noexcept;

    //---non-copyable, move-enabled---------------------------------------
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

  private:
    friend class EventBus;
    struct Slot;
    struct State;

    Subscription(std::weak_ptr<State> bus, std::shared_ptr<Slot> slot);

    std::weak_ptr<State> bus_;
    std::shared_ptr<Slot> slot_;
  };

  /**
 * @class EventBus
 * @brief A publish call invokes every current subscriber of that topic, in
 *        registration order, before returning.
 *
 *  * Subscribers may publish, subscribe or release from inside a callback.
 *  * Traffic on other topics never reaches a subscriber.
 */
  class EventBus {
  public:
    using Callback = std::function<void(const Value& message)>;

    EventBus();
    ~EventBus() = default;

    [[nodiscard]] Subscription subscribe(std::string topic, Callback cb);
    void publish(const std::string& topic, const Value& message);
    std::size_t subscriberCount(const std::string& topic) const;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

  private:
    std::shared_ptr<Subscription::State> state_;
  };

} // namespace labsim::core
