/* @file EventBus.cpp
 * @brief synchronous pub/sub with snapshot delivery and idempotent unsubscribe
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <utility>

// labsim headers
#include "core/EventBus.hpp"

using namespace labsim::core;

struct Subscription::Slot {
  std::uint64_t id;
  std::string topic;
  EventBus::Callback cb;
  std::atomic<bool> active{ true };
};

struct Subscription::State {
  mutable std::mutex mtx;
  std::vector<std::shared_ptr<Slot>> slots; ///< registration order
  std::uint64_t nextId{ 1 };
};

//---Subscription--------------------------------------------------------

Subscription::Subscription(std::weak_ptr<State> bus, std::shared_ptr<Slot> slot)
    : bus_(std::move(bus)), slot_(std::move(slot)) {}

Subscription::Subscription(Subscription&& other) noexcept
    : bus_(std::move(other.bus_)), slot_(std::move(other.slot_)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    release();
    bus_ = std::move(other.bus_);
    slot_ = std::move(other.slot_);
  }
  return *this;
}

bool Subscription::active() const noexcept { return slot_ && slot_->active.load(); }

void Subscription::release() {
  if (!slot_)
    return;

  slot_->active.store(false);
  if (auto state = bus_.lock()) {
    std::lock_guard<std::mutex> lock(state->mtx);
    auto& slots = state->slots;
    slots.erase(std::remove(slots.begin(), slots.end(), slot_), slots.end());
  }
  slot_.reset();
  bus_.reset();
}

//---EventBus------------------------------------------------------------

EventBus::EventBus() : state_(std::make_shared<Subscription::State>()) {}

Subscription EventBus::subscribe(std::string topic, Callback cb) {
  if (!cb)
    throw std::invalid_argument("[EventBus] cannot subscribe an empty callback");

  auto slot = std::make_shared<Subscription::Slot>();
  slot->topic = std::move(topic);
  slot->cb = std::move(cb);
  {
    std::lock_guard<std::mutex> lock(state_->mtx);
    slot->id = state_->nextId++;
    state_->slots.push_back(slot);
  }
  return Subscription(state_, std::move(slot));
}

void EventBus::publish(const std::string& topic, const Value& message) {
  std::vector<std::shared_ptr<Subscription::Slot>> targets;
  {
    std::lock_guard<std::mutex> lock(state_->mtx);
    for (const auto& slot : state_->slots) {
      if (slot->topic == topic)
        targets.push_back(slot);
    }
  }

  for (const auto& slot : targets) {
    // a subscriber released earlier in this same publish must not fire
    if (slot->active.load())
      slot->cb(message);
  }
}

std::size_t EventBus::subscriberCount(const std::string& topic) const {
  std::lock_guard<std::mutex> lock(state_->mtx);
  return static_cast<std::size_t>(
      std::count_if(state_->slots.begin(), state_->slots.end(),
                    [&topic](const auto& slot) { return slot->topic == topic; }));
}
