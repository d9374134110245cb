#pragma once

#include "core/entity.hpp"
#include "core/identity.hpp"
#include "core/permissions.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

enum class MembershipStatus {
    Invited,
    Active,
    Suspended,
    Archived
};

[[nodiscard]] constexpr std::string_view status_name(MembershipStatus status) {
    switch (status) {
        case MembershipStatus::Invited: return "invited";
        case MembershipStatus::Active: return "active";
        case MembershipStatus::Suspended: return "suspended";
        case MembershipStatus::Archived: return "archived";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<MembershipStatus> parse_membership_status(std::string_view name) {
    if (name == "invited") return MembershipStatus::Invited;
    if (name == "active") return MembershipStatus::Active;
    if (name == "suspended") return MembershipStatus::Suspended;
    if (name == "archived") return MembershipStatus::Archived;
    return std::nullopt;
}

/**
 * Status transitions move forward only (invited -> active -> suspended ->
 * archived, skipping allowed), except that a suspended membership may be
 * reactivated. Staying in the same status is not a transition.
 */
[[nodiscard]] constexpr bool can_transition(MembershipStatus from, MembershipStatus to) {
    if (from == to) return false;
    if (from == MembershipStatus::Suspended && to == MembershipStatus::Active) return true;
    return static_cast<int>(to) > static_cast<int>(from);
}

/**
 * Membership - Links an identity to a workspace with a role.
 *
 * At most one membership exists per (account, workspace) pair.
 */
struct Membership {
    EntityId id;
    EntityId workspace_id;
    EntityId account_id;
    IdentityKind account_kind{IdentityKind::User};

    std::string display_name;
    std::string email;

    Role role{Role::Guest};
    std::vector<std::string> custom_permissions;
    MembershipStatus status{MembershipStatus::Invited};

    EntityId invited_by;
    Timestamp joined_at;
    std::optional<Timestamp> last_active_at;

    [[nodiscard]] Grant grant() const { return Grant{role, custom_permissions}; }

    bool operator==(const Membership&) const = default;
};

struct MembershipPatch {
    std::optional<Role> role;
    std::optional<std::vector<std::string>> custom_permissions;
    std::optional<MembershipStatus> status;
    std::optional<std::string> display_name;
    std::optional<Timestamp> last_active_at;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Membership create_invitation(EntityId workspace_id,
                                                  EntityId account_id,
                                                  IdentityKind account_kind,
                                                  Role role,
                                                  EntityId invited_by) {
    return Membership{
        .id = {},
        .workspace_id = std::move(workspace_id),
        .account_id = std::move(account_id),
        .account_kind = account_kind,
        .display_name = {},
        .email = {},
        .role = role,
        .custom_permissions = {},
        .status = MembershipStatus::Invited,
        .invited_by = std::move(invited_by),
        .joined_at = Timestamp::now(),
        .last_active_at = std::nullopt
    };
}

[[nodiscard]] inline Membership apply_patch(Membership m, const MembershipPatch& patch) {
    if (patch.role) m.role = *patch.role;
    if (patch.custom_permissions) m.custom_permissions = *patch.custom_permissions;
    if (patch.status) m.status = *patch.status;
    if (patch.display_name) m.display_name = *patch.display_name;
    if (patch.last_active_at) m.last_active_at = *patch.last_active_at;
    return m;
}

template<>
struct EntityTraits<Membership> {
    using Patch = MembershipPatch;
    static constexpr std::string_view name = "membership";

    static const EntityId& id(const Membership& m) { return m.id; }
    static void assign_id(Membership& m, EntityId id) { m.id = std::move(id); }
    static void stamp(Membership& m, Timestamp now, bool created) {
        if (created) m.joined_at = now;
    }
    static Membership apply(Membership m, const MembershipPatch& p) {
        return apply_patch(std::move(m), p);
    }
    static bool in_scope(const Membership& m, const ScopeKey& key) {
        switch (key.field) {
            case ScopeField::Workspace: return m.workspace_id == key.value;
            case ScopeField::Member: return m.account_id == key.value;
            default: return false;
        }
    }
};

} // namespace tether
