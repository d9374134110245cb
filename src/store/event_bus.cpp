#include "store/event_bus.hpp"

#include "app/logging.hpp"

namespace tether::store {

struct Subscription::Registry {
    struct Entry {
        uint64_t id;
        std::function<void(const std::any&)> handler;
        bool live = true;
    };

    std::unordered_map<std::string, std::vector<std::shared_ptr<Entry>>> handlers;
    uint64_t next_id = 1;

    void remove(const std::string& name, uint64_t id) {
        auto it = handlers.find(name);
        if (it == handlers.end()) return;
        auto& entries = it->second;
        for (auto e = entries.begin(); e != entries.end(); ++e) {
            if ((*e)->id == id) {
                (*e)->live = false;
                entries.erase(e);
                break;
            }
        }
        if (entries.empty()) handlers.erase(it);
    }
};

Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)),
      name_(std::move(other.name_)),
      id_(other.id_) {
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        registry_ = std::move(other.registry_);
        name_ = std::move(other.name_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void Subscription::reset() {
    if (id_ == 0) return;
    if (auto registry = registry_.lock()) {
        registry->remove(name_, id_);
    }
    registry_.reset();
    id_ = 0;
}

bool Subscription::active() const {
    return id_ != 0 && !registry_.expired();
}

EventBus::EventBus() : registry_(std::make_shared<Subscription::Registry>()) {}

EventBus::~EventBus() = default;

Subscription EventBus::subscribe_erased(std::string_view name, Handler handler) {
    auto id = registry_->next_id++;
    std::string key(name);
    registry_->handlers[key].push_back(
        std::make_shared<Subscription::Registry::Entry>(
            Subscription::Registry::Entry{id, std::move(handler), true}));
    qCDebug(tetherBusLog) << "subscribe" << QString::fromStdString(key) << "id" << id;
    return Subscription(registry_, std::move(key), id);
}

void EventBus::publish_erased(std::string_view name, const std::any& payload) {
    auto it = registry_->handlers.find(std::string(name));
    if (it == registry_->handlers.end()) {
        qCDebug(tetherBusLog) << "publish" << QLatin1String(name.data(), static_cast<qsizetype>(name.size()))
                              << "without subscribers";
        return;
    }

    // Deliver to a snapshot so handlers can (un)subscribe while we iterate.
    auto snapshot = it->second;
    qCDebug(tetherBusLog) << "publish" << QLatin1String(name.data(), static_cast<qsizetype>(name.size()))
                          << "to" << snapshot.size() << "subscribers";
    for (const auto& entry : snapshot) {
        if (entry->live) {
            entry->handler(payload);
        }
    }
}

size_t EventBus::subscriber_count(std::string_view name) const {
    auto it = registry_->handlers.find(std::string(name));
    return it == registry_->handlers.end() ? 0 : it->second.size();
}

} // namespace tether::store
