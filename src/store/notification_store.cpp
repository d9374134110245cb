#include "store/notification_store.hpp"

#include "app/logging.hpp"

#include <algorithm>

namespace tether::store {

namespace {

std::vector<Notification> newest_first(std::vector<Notification> items) {
    std::sort(items.begin(), items.end(), [](const Notification& a, const Notification& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id < b.id;
    });
    return items;
}

} // namespace

NotificationStore::NotificationStore(app::AppContext& app, ContextStore& context, QObject* parent)
    : ScopeStoreBase(context, parent),
      notifications_(app.repositories.notifications, app.config.mutation_policy) {
    track(notifications_);
    attach();
}

std::optional<ScopeKey> NotificationStore::scopeFor(const Context& context) const {
    if (!context.has_principal()) return std::nullopt;
    return ScopeKey{ScopeField::Recipient, context.principal_id};
}

void NotificationStore::issueLoad(const ScopeKey& key) {
    notifications_.load(key);
}

std::vector<Notification> NotificationStore::notifications() const {
    return newest_first(notifications_.filter([](const Notification& n) { return !n.archived; }));
}

std::vector<Notification> NotificationStore::unread() const {
    return newest_first(notifications_.filter(
        [](const Notification& n) { return !n.archived && !n.read; }));
}

int NotificationStore::unreadCount() const {
    return static_cast<int>(unread().size());
}

std::vector<Notification> NotificationStore::ofType(NotificationType type) const {
    return newest_first(notifications_.filter(
        [type](const Notification& n) { return !n.archived && n.type == type; }));
}

std::vector<Notification> NotificationStore::forWorkspace(const EntityId& workspace_id) const {
    return newest_first(notifications_.filter(
        [&](const Notification& n) { return !n.archived && n.workspace_id == workspace_id; }));
}

std::vector<Notification> NotificationStore::archived() const {
    return newest_first(notifications_.filter([](const Notification& n) { return n.archived; }));
}

Result<void> NotificationStore::markRead(const EntityId& id, Completion<void> done) {
    const auto* current = notifications_.get(id);
    if (!current) return Result<void>::err(Error::not_found("notification " + id + " not cached"));
    NotificationPatch patch;
    patch.read = true;
    return notifications_.update(id, patch, std::move(done));
}

int NotificationStore::markAllRead() {
    int dispatched = 0;
    for (const auto& n : unread()) {
        if (notifications_.in_flight(n.id)) continue;
        NotificationPatch patch;
        patch.read = true;
        auto result = notifications_.update(n.id, patch);
        if (result.is_ok()) {
            ++dispatched;
        } else {
            qCWarning(tetherStoreLog) << "mark read failed for" << QString::fromStdString(n.id)
                                      << QString::fromStdString(result.unwrap_err().to_string());
        }
    }
    return dispatched;
}

Result<void> NotificationStore::archive(const EntityId& id, Completion<void> done) {
    NotificationPatch patch;
    patch.archived = true;
    return notifications_.update(id, patch, std::move(done));
}

Result<void> NotificationStore::remove(const EntityId& id, Completion<void> done) {
    return notifications_.remove(id, std::move(done));
}

} // namespace tether::store
