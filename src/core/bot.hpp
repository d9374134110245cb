#pragma once

#include "core/entity.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

/**
 * BotScope - API scopes a bot may be granted.
 */
enum class BotScope {
    ReadWorkspace,
    WriteWorkspace,
    DeleteWorkspace,
    ReadTask,
    WriteTask,
    DeleteTask,
    ReadDocument,
    WriteDocument,
    DeleteDocument,
    ManageIntegrations,
    ExecuteWorkflow
};

enum class BotStatus {
    Active,
    Suspended,
    Revoked
};

/**
 * Bot - A service identity. Bots never own workspaces; they are granted
 * access to a list of them.
 */
struct Bot {
    EntityId id;
    std::string name;
    std::string description;
    EntityId created_by;
    std::optional<EntityId> organization_id;
    std::vector<BotScope> scopes;
    std::vector<EntityId> workspace_ids;
    BotStatus status{BotStatus::Active};
    std::string suspension_reason;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Bot&) const = default;
};

struct BotPatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::vector<BotScope>> scopes;
    std::optional<std::vector<EntityId>> workspace_ids;
    std::optional<BotStatus> status;
    std::optional<std::string> suspension_reason;
};

[[nodiscard]] inline Bot create_bot(std::string name,
                                    EntityId created_by,
                                    std::optional<EntityId> organization_id = std::nullopt) {
    auto now = Timestamp::now();
    Bot bot;
    bot.name = std::move(name);
    bot.created_by = std::move(created_by);
    bot.organization_id = std::move(organization_id);
    bot.scopes = {BotScope::ReadWorkspace};
    bot.created_at = now;
    bot.updated_at = now;
    return bot;
}

[[nodiscard]] inline Bot apply_patch(Bot bot, const BotPatch& patch) {
    if (patch.name) bot.name = *patch.name;
    if (patch.description) bot.description = *patch.description;
    if (patch.scopes) bot.scopes = *patch.scopes;
    if (patch.workspace_ids) bot.workspace_ids = *patch.workspace_ids;
    if (patch.status) bot.status = *patch.status;
    if (patch.suspension_reason) bot.suspension_reason = *patch.suspension_reason;
    bot.updated_at = Timestamp::now();
    return bot;
}

/**
 * Revocation is final.
 */
[[nodiscard]] constexpr bool can_transition(BotStatus from, BotStatus to) {
    if (from == to) return false;
    return from != BotStatus::Revoked;
}

template<>
struct EntityTraits<Bot> {
    using Patch = BotPatch;
    static constexpr std::string_view name = "bot";

    static const EntityId& id(const Bot& b) { return b.id; }
    static void assign_id(Bot& b, EntityId id) { b.id = std::move(id); }
    static void stamp(Bot& b, Timestamp now, bool created) {
        if (created) b.created_at = now;
        b.updated_at = now;
    }
    static Bot apply(Bot b, const BotPatch& p) { return apply_patch(std::move(b), p); }
    static bool in_scope(const Bot& b, const ScopeKey& key) {
        switch (key.field) {
            case ScopeField::Creator: return b.created_by == key.value;
            case ScopeField::Organization: return b.organization_id == key.value;
            case ScopeField::Workspace:
                return std::find(b.workspace_ids.begin(), b.workspace_ids.end(), key.value)
                    != b.workspace_ids.end();
            default: return false;
        }
    }
};

} // namespace tether
