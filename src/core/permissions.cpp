#include "core/permissions.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace tether {
namespace {

constexpr std::array<std::pair<Capability, std::string_view>, 24> kCapabilityNames{{
    {Capability::WorkspaceView, "workspace.view"},
    {Capability::WorkspaceEdit, "workspace.edit"},
    {Capability::WorkspaceDelete, "workspace.delete"},
    {Capability::WorkspaceAdmin, "workspace.admin"},
    {Capability::MembersView, "members.view"},
    {Capability::MembersInvite, "members.invite"},
    {Capability::MembersRemove, "members.remove"},
    {Capability::MembersManageRoles, "members.manage_roles"},
    {Capability::DocumentsView, "documents.view"},
    {Capability::DocumentsCreate, "documents.create"},
    {Capability::DocumentsEdit, "documents.edit"},
    {Capability::DocumentsDelete, "documents.delete"},
    {Capability::DocumentsShare, "documents.share"},
    {Capability::TasksView, "tasks.view"},
    {Capability::TasksCreate, "tasks.create"},
    {Capability::TasksEdit, "tasks.edit"},
    {Capability::TasksDelete, "tasks.delete"},
    {Capability::TasksAssign, "tasks.assign"},
    {Capability::SettingsView, "settings.view"},
    {Capability::SettingsEdit, "settings.edit"},
    {Capability::PermissionsView, "permissions.view"},
    {Capability::PermissionsEdit, "permissions.edit"},
    {Capability::AuditView, "audit.view"},
    {Capability::AuditExport, "audit.export"},
}};

const CapabilitySet& guest_defaults() {
    static const CapabilitySet caps{
        Capability::WorkspaceView,
        Capability::MembersView,
        Capability::DocumentsView,
        Capability::TasksView,
        Capability::SettingsView,
    };
    return caps;
}

const CapabilitySet& member_defaults() {
    static const CapabilitySet caps = [] {
        auto c = guest_defaults();
        c.insert({
            Capability::DocumentsCreate,
            Capability::DocumentsEdit,
            Capability::DocumentsShare,
            Capability::TasksCreate,
            Capability::TasksEdit,
            Capability::TasksAssign,
        });
        return c;
    }();
    return caps;
}

// Admin holds everything except deleting the workspace itself.
const CapabilitySet& admin_defaults() {
    static const CapabilitySet caps = [] {
        CapabilitySet c(all_capabilities().begin(), all_capabilities().end());
        c.erase(Capability::WorkspaceDelete);
        return c;
    }();
    return caps;
}

const CapabilitySet& owner_defaults() {
    static const CapabilitySet caps(all_capabilities().begin(), all_capabilities().end());
    return caps;
}

const CapabilitySet& defaults_for(Role role) {
    switch (role) {
        case Role::Owner: return owner_defaults();
        case Role::Admin: return admin_defaults();
        case Role::Member: return member_defaults();
        case Role::Guest: return guest_defaults();
    }
    return guest_defaults();
}

} // namespace

std::string_view capability_name(Capability capability) {
    for (const auto& [cap, name] : kCapabilityNames) {
        if (cap == capability) return name;
    }
    return "unknown";
}

std::optional<Capability> parse_capability(std::string_view name) {
    for (const auto& [cap, cap_name] : kCapabilityNames) {
        if (cap_name == name) return cap;
    }
    return std::nullopt;
}

std::string_view role_name(Role role) {
    switch (role) {
        case Role::Owner: return "owner";
        case Role::Admin: return "admin";
        case Role::Member: return "member";
        case Role::Guest: return "guest";
    }
    return "unknown";
}

std::optional<Role> parse_role(std::string_view name) {
    if (name == "owner") return Role::Owner;
    if (name == "admin") return Role::Admin;
    if (name == "member") return Role::Member;
    if (name == "guest") return Role::Guest;
    return std::nullopt;
}

const std::vector<Capability>& all_capabilities() {
    static const std::vector<Capability> caps = [] {
        std::vector<Capability> v;
        v.reserve(kCapabilityNames.size());
        for (const auto& entry : kCapabilityNames) {
            v.push_back(entry.first);
        }
        return v;
    }();
    return caps;
}

CapabilitySet role_capabilities(Role role) {
    return defaults_for(role);
}

CapabilitySet resolve(Role role, const std::vector<std::string>& custom_permissions) {
    auto caps = defaults_for(role);
    for (const auto& name : custom_permissions) {
        if (auto cap = parse_capability(name)) {
            caps.insert(*cap);
        }
    }
    return caps;
}

bool has_permission(Role role,
                    Capability capability,
                    const std::vector<std::string>& custom_permissions) {
    if (defaults_for(role).count(capability) > 0) {
        return true;
    }
    return std::any_of(custom_permissions.begin(), custom_permissions.end(),
        [capability](const std::string& name) {
            return parse_capability(name) == capability;
        });
}

} // namespace tether
