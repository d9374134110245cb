#pragma once

#include "core/entity.hpp"
#include "core/identity.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

/**
 * OwnerType - Only users and organizations own workspaces, so the owner
 * reference cannot name any other identity kind.
 */
enum class OwnerType {
    User,
    Organization
};

[[nodiscard]] constexpr std::optional<OwnerType> owner_type_for(IdentityKind kind) {
    switch (kind) {
        case IdentityKind::User: return OwnerType::User;
        case IdentityKind::Organization: return OwnerType::Organization;
        case IdentityKind::Bot:
        case IdentityKind::Team:
        case IdentityKind::Partner:
            return std::nullopt;
    }
    return std::nullopt;
}

struct WorkspaceOwner {
    OwnerType type{OwnerType::User};
    EntityId id;

    bool operator==(const WorkspaceOwner&) const = default;
};

enum class WorkspaceStatus {
    Active,
    Archived,
    PendingDeletion
};

enum class WorkspaceVisibility {
    Private,
    Internal,
    Public
};

/**
 * ModuleType - Feature areas that can be toggled per workspace.
 */
enum class ModuleType {
    Overview,
    Documents,
    Tasks,
    Members,
    Permissions,
    Audit,
    Settings,
    Journal
};

[[nodiscard]] constexpr std::string_view module_name(ModuleType type) {
    switch (type) {
        case ModuleType::Overview: return "overview";
        case ModuleType::Documents: return "documents";
        case ModuleType::Tasks: return "tasks";
        case ModuleType::Members: return "members";
        case ModuleType::Permissions: return "permissions";
        case ModuleType::Audit: return "audit";
        case ModuleType::Settings: return "settings";
        case ModuleType::Journal: return "journal";
    }
    return "unknown";
}

struct ModuleToggle {
    ModuleType type;
    bool enabled;
    int order;

    bool operator==(const ModuleToggle&) const = default;
};

/**
 * Workspace - An owned container of feature modules.
 */
struct Workspace {
    EntityId id;
    std::string name;
    std::string description;
    WorkspaceOwner owner;
    WorkspaceVisibility visibility{WorkspaceVisibility::Private};
    WorkspaceStatus status{WorkspaceStatus::Active};
    std::vector<ModuleToggle> modules;
    EntityId created_by;
    Timestamp created_at;
    Timestamp updated_at;
    std::optional<Timestamp> last_accessed_at;
    std::optional<Timestamp> archived_at;

    bool operator==(const Workspace&) const = default;
};

struct WorkspacePatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<WorkspaceVisibility> visibility;
    std::optional<WorkspaceStatus> status;
    std::optional<std::vector<ModuleToggle>> modules;
    std::optional<Timestamp> last_accessed_at;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline std::vector<ModuleToggle> default_modules() {
    return {
        {ModuleType::Overview, true, 0},
        {ModuleType::Documents, true, 1},
        {ModuleType::Tasks, true, 2},
        {ModuleType::Members, true, 3},
        {ModuleType::Permissions, true, 4},
        {ModuleType::Audit, false, 5},
        {ModuleType::Settings, true, 6},
        {ModuleType::Journal, false, 7},
    };
}

/**
 * Create a new workspace draft. The id is assigned by the backend.
 */
[[nodiscard]] inline Workspace create_workspace(WorkspaceOwner owner,
                                                std::string name,
                                                EntityId created_by) {
    auto now = Timestamp::now();
    return Workspace{
        .id = {},
        .name = std::move(name),
        .description = {},
        .owner = std::move(owner),
        .visibility = WorkspaceVisibility::Private,
        .status = WorkspaceStatus::Active,
        .modules = default_modules(),
        .created_by = std::move(created_by),
        .created_at = now,
        .updated_at = now,
        .last_accessed_at = std::nullopt,
        .archived_at = std::nullopt
    };
}

/**
 * Active <-> Archived; either may move to PendingDeletion, which is final.
 */
[[nodiscard]] constexpr bool can_transition(WorkspaceStatus from, WorkspaceStatus to) {
    if (from == to) return false;
    switch (from) {
        case WorkspaceStatus::Active:
        case WorkspaceStatus::Archived:
            return true;
        case WorkspaceStatus::PendingDeletion:
            return false;
    }
    return false;
}

[[nodiscard]] inline Result<void> validate_workspace_name(std::string_view name) {
    if (name.empty()) {
        return Result<void>::err(Error::validation("workspace name must not be empty"));
    }
    if (name.size() > 100) {
        return Result<void>::err(Error::validation("workspace name is longer than 100 characters"));
    }
    return Result<void>::ok();
}

[[nodiscard]] inline std::vector<ModuleToggle> with_module_enabled(std::vector<ModuleToggle> modules,
                                                                   ModuleType type,
                                                                   bool enabled) {
    auto it = std::find_if(modules.begin(), modules.end(),
        [type](const ModuleToggle& m) { return m.type == type; });
    if (it != modules.end()) {
        it->enabled = enabled;
    } else {
        modules.push_back(ModuleToggle{type, enabled, static_cast<int>(modules.size())});
    }
    return modules;
}

[[nodiscard]] inline bool is_module_enabled(const Workspace& ws, ModuleType type) {
    return std::any_of(ws.modules.begin(), ws.modules.end(),
        [type](const ModuleToggle& m) { return m.type == type && m.enabled; });
}

/**
 * Enabled modules in display order.
 */
[[nodiscard]] inline std::vector<ModuleToggle> enabled_modules(const Workspace& ws) {
    std::vector<ModuleToggle> enabled;
    for (const auto& m : ws.modules) {
        if (m.enabled) enabled.push_back(m);
    }
    std::sort(enabled.begin(), enabled.end(),
        [](const ModuleToggle& a, const ModuleToggle& b) { return a.order < b.order; });
    return enabled;
}

[[nodiscard]] inline Workspace apply_patch(Workspace ws, const WorkspacePatch& patch) {
    if (patch.name) ws.name = *patch.name;
    if (patch.description) ws.description = *patch.description;
    if (patch.visibility) ws.visibility = *patch.visibility;
    if (patch.status) {
        ws.status = *patch.status;
        if (ws.status == WorkspaceStatus::Archived) {
            ws.archived_at = Timestamp::now();
        } else if (ws.status == WorkspaceStatus::Active) {
            ws.archived_at = std::nullopt;
        }
    }
    if (patch.modules) ws.modules = *patch.modules;
    if (patch.last_accessed_at) {
        ws.last_accessed_at = *patch.last_accessed_at;
    } else {
        ws.updated_at = Timestamp::now();
    }
    return ws;
}

/**
 * Most recently accessed first. Never-accessed workspaces sort last, by
 * most recent update.
 */
[[nodiscard]] inline std::vector<Workspace> sort_by_recency(std::vector<Workspace> workspaces) {
    std::sort(workspaces.begin(), workspaces.end(),
        [](const Workspace& a, const Workspace& b) {
            auto a_access = a.last_accessed_at.value_or(Timestamp{});
            auto b_access = b.last_accessed_at.value_or(Timestamp{});
            if (a_access != b_access) return a_access > b_access;
            if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
            return a.id < b.id;
        });
    return workspaces;
}

[[nodiscard]] inline std::optional<Workspace> most_recently_accessed(
    const std::vector<Workspace>& workspaces
) {
    if (workspaces.empty()) return std::nullopt;
    return sort_by_recency(workspaces).front();
}

template<>
struct EntityTraits<Workspace> {
    using Patch = WorkspacePatch;
    static constexpr std::string_view name = "workspace";

    static const EntityId& id(const Workspace& w) { return w.id; }
    static void assign_id(Workspace& w, EntityId id) { w.id = std::move(id); }
    static void stamp(Workspace& w, Timestamp now, bool created) {
        if (created) w.created_at = now;
        w.updated_at = now;
    }
    static Workspace apply(Workspace w, const WorkspacePatch& p) { return apply_patch(std::move(w), p); }
    static bool in_scope(const Workspace& w, const ScopeKey& key) {
        return key.field == ScopeField::Owner && w.owner.id == key.value;
    }
};

} // namespace tether
