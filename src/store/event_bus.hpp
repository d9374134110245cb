#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace tether::store {

/**
 * EventKey<T> - Names an event and fixes its payload type.
 *
 *   inline constexpr EventKey<AccountSelected> kAccountSelected{"account.selected"};
 */
template<typename T>
struct EventKey {
    std::string_view name;
};

class EventBus;

/**
 * Subscription - Handle returned by EventBus::subscribe. Dropping it
 * unsubscribes. Safe to outlive the bus.
 */
class Subscription {
public:
    Subscription() = default;
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();
    [[nodiscard]] bool active() const;

private:
    friend class EventBus;
    struct Registry;
    Subscription(std::weak_ptr<Registry> registry, std::string name, uint64_t id)
        : registry_(std::move(registry)), name_(std::move(name)), id_(id) {}

    std::weak_ptr<Registry> registry_;
    std::string name_;
    uint64_t id_ = 0;
};

/**
 * EventBus - Synchronous publish/subscribe keyed by event name.
 *
 * publish() calls every handler subscribed at the moment of the call, in
 * subscription order, before returning. Nothing is queued or replayed.
 * Handlers may publish, subscribe or unsubscribe; a handler removed during
 * a delivery is not called afterwards, and a handler added during a
 * delivery first sees the next publish.
 */
class EventBus {
public:
    EventBus();
    ~EventBus();
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename T>
    [[nodiscard]] Subscription subscribe(EventKey<T> key,
                                         std::type_identity_t<std::function<void(const T&)>> handler) {
        return subscribe_erased(key.name, [handler = std::move(handler)](const std::any& payload) {
            if (const auto* typed = std::any_cast<T>(&payload)) {
                handler(*typed);
            }
        });
    }

    template<typename T>
    void publish(EventKey<T> key, const T& payload) {
        publish_erased(key.name, std::any(payload));
    }

    [[nodiscard]] size_t subscriber_count(std::string_view name) const;

private:
    using Handler = std::function<void(const std::any&)>;

    Subscription subscribe_erased(std::string_view name, Handler handler);
    void publish_erased(std::string_view name, const std::any& payload);

    std::shared_ptr<Subscription::Registry> registry_;
};

} // namespace tether::store
