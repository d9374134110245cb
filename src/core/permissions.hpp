#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

/**
 * Role - Membership role within a workspace.
 *
 * Default capability sets nest: Guest ⊂ Member ⊂ Admin ⊂ Owner.
 */
enum class Role {
    Owner,
    Admin,
    Member,
    Guest
};

/**
 * Capability - A single permission atom, named "<area>.<action>".
 */
enum class Capability {
    WorkspaceView,
    WorkspaceEdit,
    WorkspaceDelete,
    WorkspaceAdmin,

    MembersView,
    MembersInvite,
    MembersRemove,
    MembersManageRoles,

    DocumentsView,
    DocumentsCreate,
    DocumentsEdit,
    DocumentsDelete,
    DocumentsShare,

    TasksView,
    TasksCreate,
    TasksEdit,
    TasksDelete,
    TasksAssign,

    SettingsView,
    SettingsEdit,

    PermissionsView,
    PermissionsEdit,

    AuditView,
    AuditExport
};

using CapabilitySet = std::set<Capability>;

[[nodiscard]] std::string_view capability_name(Capability capability);
[[nodiscard]] std::optional<Capability> parse_capability(std::string_view name);

[[nodiscard]] std::string_view role_name(Role role);
[[nodiscard]] std::optional<Role> parse_role(std::string_view name);

/**
 * Every capability, in declaration order.
 */
[[nodiscard]] const std::vector<Capability>& all_capabilities();

/**
 * Default capabilities of a role, without any custom grants.
 */
[[nodiscard]] CapabilitySet role_capabilities(Role role);

/**
 * Resolve a role plus custom grants into the effective capability set.
 *
 * Custom permissions are additive: they can only add to the role's
 * defaults, never revoke. Unknown names are ignored.
 */
[[nodiscard]] CapabilitySet resolve(Role role,
                                    const std::vector<std::string>& custom_permissions = {});

[[nodiscard]] bool has_permission(Role role,
                                  Capability capability,
                                  const std::vector<std::string>& custom_permissions = {});

/**
 * Grant - The principal's resolved access to one workspace.
 */
struct Grant {
    Role role{Role::Guest};
    std::vector<std::string> custom_permissions;

    [[nodiscard]] bool allows(Capability capability) const {
        return has_permission(role, capability, custom_permissions);
    }

    bool operator==(const Grant&) const = default;
};

} // namespace tether
