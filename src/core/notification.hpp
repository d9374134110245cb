#pragma once

#include "core/entity.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether {

enum class NotificationType {
    System,
    WorkspaceInvitation,
    WorkspaceUpdated,
    WorkspaceMemberAdded,
    WorkspaceMemberRemoved,
    TaskAssigned,
    TaskCompleted,
    TaskUpdated,
    TaskComment,
    TaskDueSoon,
    TaskOverdue,
    DocumentShared,
    DocumentUpdated,
    DocumentComment,
    MemberMention,
    MemberRoleChanged,
    AuditAlert
};

enum class NotificationPriority {
    Low,
    Normal,
    High,
    Urgent
};

struct Notification {
    EntityId id;
    EntityId recipient_id;
    std::optional<EntityId> workspace_id;
    NotificationType type{NotificationType::System};
    NotificationPriority priority{NotificationPriority::Normal};
    std::string title;
    std::string message;
    EntityId sender_id;
    bool read{false};
    std::optional<Timestamp> read_at;
    bool archived{false};
    Timestamp created_at;

    bool operator==(const Notification&) const = default;
};

struct NotificationPatch {
    std::optional<bool> read;
    std::optional<bool> archived;
};

[[nodiscard]] inline Notification apply_patch(Notification n, const NotificationPatch& patch) {
    if (patch.read) {
        n.read = *patch.read;
        n.read_at = n.read ? std::optional<Timestamp>(Timestamp::now()) : std::nullopt;
    }
    if (patch.archived) n.archived = *patch.archived;
    return n;
}

template<>
struct EntityTraits<Notification> {
    using Patch = NotificationPatch;
    static constexpr std::string_view name = "notification";

    static const EntityId& id(const Notification& n) { return n.id; }
    static void assign_id(Notification& n, EntityId id) { n.id = std::move(id); }
    static void stamp(Notification& n, Timestamp now, bool created) {
        if (created) n.created_at = now;
    }
    static Notification apply(Notification n, const NotificationPatch& p) {
        return apply_patch(std::move(n), p);
    }
    static bool in_scope(const Notification& n, const ScopeKey& key) {
        switch (key.field) {
            case ScopeField::Recipient: return n.recipient_id == key.value;
            case ScopeField::Workspace: return n.workspace_id == key.value;
            default: return false;
        }
    }
};

} // namespace tether
