#pragma once

#include "core/entity.hpp"
#include "core/overloaded.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tether {

/**
 * Identity alternatives. Only users and organizations may own a workspace;
 * teams and partners are membership-only units of an organization.
 */

struct UserIdentity {
    std::string email;

    bool operator==(const UserIdentity&) const = default;
};

struct OrganizationIdentity {
    std::string slug;

    bool operator==(const OrganizationIdentity&) const = default;
};

struct BotIdentity {
    EntityId created_by;

    bool operator==(const BotIdentity&) const = default;
};

struct TeamIdentity {
    EntityId organization_id;

    bool operator==(const TeamIdentity&) const = default;
};

enum class PartnerAccess {
    ReadOnly,
    Collaborator
};

struct PartnerIdentity {
    EntityId organization_id;
    PartnerAccess access{PartnerAccess::ReadOnly};

    bool operator==(const PartnerIdentity&) const = default;
};

/**
 * Identity - Closed sum over the identity kinds.
 */
using Identity = std::variant<
    UserIdentity,
    OrganizationIdentity,
    BotIdentity,
    TeamIdentity,
    PartnerIdentity
>;

enum class IdentityKind {
    User,
    Organization,
    Bot,
    Team,
    Partner
};

[[nodiscard]] inline IdentityKind kind_of(const Identity& identity) {
    return std::visit(overloaded{
        [](const UserIdentity&) { return IdentityKind::User; },
        [](const OrganizationIdentity&) { return IdentityKind::Organization; },
        [](const BotIdentity&) { return IdentityKind::Bot; },
        [](const TeamIdentity&) { return IdentityKind::Team; },
        [](const PartnerIdentity&) { return IdentityKind::Partner; },
    }, identity);
}

[[nodiscard]] constexpr std::string_view kind_name(IdentityKind kind) {
    switch (kind) {
        case IdentityKind::User: return "user";
        case IdentityKind::Organization: return "organization";
        case IdentityKind::Bot: return "bot";
        case IdentityKind::Team: return "team";
        case IdentityKind::Partner: return "partner";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<IdentityKind> parse_identity_kind(std::string_view name) {
    if (name == "user") return IdentityKind::User;
    if (name == "organization") return IdentityKind::Organization;
    if (name == "bot") return IdentityKind::Bot;
    if (name == "team") return IdentityKind::Team;
    if (name == "partner") return IdentityKind::Partner;
    return std::nullopt;
}

/**
 * Workspace ownership is a pure function of the identity kind.
 */
[[nodiscard]] constexpr bool can_own_workspace(IdentityKind kind) {
    switch (kind) {
        case IdentityKind::User:
        case IdentityKind::Organization:
            return true;
        case IdentityKind::Bot:
        case IdentityKind::Team:
        case IdentityKind::Partner:
            return false;
    }
    return false;
}

[[nodiscard]] inline bool can_own_workspace(const Identity& identity) {
    return can_own_workspace(kind_of(identity));
}

/**
 * Organization a team or partner belongs to; empty for other kinds.
 */
[[nodiscard]] inline std::optional<EntityId> parent_organization(const Identity& identity) {
    return std::visit(overloaded{
        [](const UserIdentity&) -> std::optional<EntityId> { return std::nullopt; },
        [](const OrganizationIdentity&) -> std::optional<EntityId> { return std::nullopt; },
        [](const BotIdentity&) -> std::optional<EntityId> { return std::nullopt; },
        [](const TeamIdentity& t) -> std::optional<EntityId> { return t.organization_id; },
        [](const PartnerIdentity& p) -> std::optional<EntityId> { return p.organization_id; },
    }, identity);
}

/**
 * Account - An identity record as held by the account store.
 *
 * The identity alternative (and so the kind) is fixed at creation;
 * AccountPatch deliberately has no field that could change it.
 */
struct Account {
    EntityId id;
    std::string display_name;
    std::string photo_url;
    Identity identity;
    // Account ids of the members; meaningful for organizations, teams and partners.
    std::vector<EntityId> member_ids;
    Timestamp created_at;
    Timestamp updated_at;

    [[nodiscard]] IdentityKind kind() const { return kind_of(identity); }

    bool operator==(const Account&) const = default;
};

struct AccountPatch {
    std::optional<std::string> display_name;
    std::optional<std::string> photo_url;
    std::optional<std::vector<EntityId>> member_ids;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Account create_user_account(EntityId id,
                                                 std::string display_name,
                                                 std::string email) {
    auto now = Timestamp::now();
    return Account{
        .id = std::move(id),
        .display_name = std::move(display_name),
        .photo_url = {},
        .identity = UserIdentity{std::move(email)},
        .member_ids = {},
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline Account create_account(EntityId id,
                                            std::string display_name,
                                            Identity identity,
                                            std::vector<EntityId> member_ids = {}) {
    auto now = Timestamp::now();
    return Account{
        .id = std::move(id),
        .display_name = std::move(display_name),
        .photo_url = {},
        .identity = std::move(identity),
        .member_ids = std::move(member_ids),
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline Account apply_patch(Account account, const AccountPatch& patch) {
    if (patch.display_name) account.display_name = *patch.display_name;
    if (patch.photo_url) account.photo_url = *patch.photo_url;
    if (patch.member_ids) account.member_ids = *patch.member_ids;
    account.updated_at = Timestamp::now();
    return account;
}

template<>
struct EntityTraits<Account> {
    using Patch = AccountPatch;
    static constexpr std::string_view name = "account";

    static const EntityId& id(const Account& a) { return a.id; }
    static void assign_id(Account& a, EntityId id) { a.id = std::move(id); }
    static void stamp(Account& a, Timestamp now, bool created) {
        if (created) a.created_at = now;
        a.updated_at = now;
    }
    static Account apply(Account a, const AccountPatch& p) { return apply_patch(std::move(a), p); }

    // Member scope: the identity itself plus every unit listing it as a member.
    static bool in_scope(const Account& a, const ScopeKey& key) {
        if (key.field != ScopeField::Member) return false;
        if (a.id == key.value) return true;
        for (const auto& member : a.member_ids) {
            if (member == key.value) return true;
        }
        return false;
    }
};

} // namespace tether
