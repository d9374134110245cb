#pragma once

#include "app/app_context.hpp"
#include "core/notification.hpp"
#include "store/scope_store_base.hpp"
#include <optional>
#include <vector>

namespace tether::store {

/**
 * NotificationStore - Notifications addressed to the signed-in principal,
 * independent of the active scope.
 */
class NotificationStore : public ScopeStoreBase {
    Q_OBJECT
    Q_PROPERTY(int unreadCount READ unreadCount NOTIFY changed)

public:
    NotificationStore(app::AppContext& app, ContextStore& context, QObject* parent = nullptr);

    // Views

    /**
     * Non-archived notifications, newest first.
     */
    [[nodiscard]] std::vector<Notification> notifications() const;
    [[nodiscard]] std::vector<Notification> unread() const;
    [[nodiscard]] int unreadCount() const;
    [[nodiscard]] std::vector<Notification> ofType(NotificationType type) const;
    [[nodiscard]] std::vector<Notification> forWorkspace(const EntityId& workspace_id) const;
    [[nodiscard]] std::vector<Notification> archived() const;

    // Mutations
    Result<void> markRead(const EntityId& id, Completion<void> done = {});

    /**
     * Mark every unread notification read. Returns how many updates were
     * dispatched; notifications with a mutation in flight are skipped.
     */
    int markAllRead();
    Result<void> archive(const EntityId& id, Completion<void> done = {});
    Result<void> remove(const EntityId& id, Completion<void> done = {});

protected:
    [[nodiscard]] std::optional<ScopeKey> scopeFor(const Context& context) const override;
    void issueLoad(const ScopeKey& key) override;

private:
    EntityStore<Notification> notifications_;
};

} // namespace tether::store
