#pragma once

#include "core/entity.hpp"
#include "core/identity.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace tether {

/**
 * Team - A group of accounts inside an organization.
 */
struct Team {
    EntityId id;
    EntityId organization_id;
    std::string name;
    std::string description;
    std::vector<EntityId> member_ids;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Team&) const = default;
};

struct TeamPatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::vector<EntityId>> member_ids;
};

/**
 * Partner - An external party granted access through an organization.
 */
struct Partner {
    EntityId id;
    EntityId organization_id;
    std::string name;
    PartnerAccess access{PartnerAccess::ReadOnly};
    std::vector<EntityId> member_ids;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Partner&) const = default;
};

struct PartnerPatch {
    std::optional<std::string> name;
    std::optional<PartnerAccess> access;
    std::optional<std::vector<EntityId>> member_ids;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Team create_team(EntityId organization_id, std::string name) {
    auto now = Timestamp::now();
    return Team{
        .id = {},
        .organization_id = std::move(organization_id),
        .name = std::move(name),
        .description = {},
        .member_ids = {},
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline Partner create_partner(EntityId organization_id,
                                            std::string name,
                                            PartnerAccess access) {
    auto now = Timestamp::now();
    return Partner{
        .id = {},
        .organization_id = std::move(organization_id),
        .name = std::move(name),
        .access = access,
        .member_ids = {},
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline Team apply_patch(Team team, const TeamPatch& patch) {
    if (patch.name) team.name = *patch.name;
    if (patch.description) team.description = *patch.description;
    if (patch.member_ids) team.member_ids = *patch.member_ids;
    team.updated_at = Timestamp::now();
    return team;
}

[[nodiscard]] inline Partner apply_patch(Partner partner, const PartnerPatch& patch) {
    if (patch.name) partner.name = *patch.name;
    if (patch.access) partner.access = *patch.access;
    if (patch.member_ids) partner.member_ids = *patch.member_ids;
    partner.updated_at = Timestamp::now();
    return partner;
}

[[nodiscard]] inline bool has_member(const std::vector<EntityId>& member_ids,
                                     const EntityId& account_id) {
    return std::find(member_ids.begin(), member_ids.end(), account_id) != member_ids.end();
}

template<>
struct EntityTraits<Team> {
    using Patch = TeamPatch;
    static constexpr std::string_view name = "team";

    static const EntityId& id(const Team& t) { return t.id; }
    static void assign_id(Team& t, EntityId id) { t.id = std::move(id); }
    static void stamp(Team& t, Timestamp now, bool created) {
        if (created) t.created_at = now;
        t.updated_at = now;
    }
    static Team apply(Team t, const TeamPatch& p) { return apply_patch(std::move(t), p); }
    static bool in_scope(const Team& t, const ScopeKey& key) {
        switch (key.field) {
            case ScopeField::Organization: return t.organization_id == key.value;
            case ScopeField::Member: return has_member(t.member_ids, key.value);
            default: return false;
        }
    }
};

template<>
struct EntityTraits<Partner> {
    using Patch = PartnerPatch;
    static constexpr std::string_view name = "partner";

    static const EntityId& id(const Partner& p) { return p.id; }
    static void assign_id(Partner& p, EntityId id) { p.id = std::move(id); }
    static void stamp(Partner& p, Timestamp now, bool created) {
        if (created) p.created_at = now;
        p.updated_at = now;
    }
    static Partner apply(Partner p, const PartnerPatch& patch) { return apply_patch(std::move(p), patch); }
    static bool in_scope(const Partner& p, const ScopeKey& key) {
        switch (key.field) {
            case ScopeField::Organization: return p.organization_id == key.value;
            case ScopeField::Member: return has_member(p.member_ids, key.value);
            default: return false;
        }
    }
};

} // namespace tether
