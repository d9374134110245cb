#pragma once

#include "core/identity.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tether {

/**
 * ScopeKind - Identity kinds that can be the active scope of a session.
 * Bots are service identities and never become a scope.
 */
enum class ScopeKind {
    User,
    Organization,
    Team,
    Partner
};

[[nodiscard]] constexpr std::string_view scope_kind_name(ScopeKind kind) {
    switch (kind) {
        case ScopeKind::User: return "user";
        case ScopeKind::Organization: return "organization";
        case ScopeKind::Team: return "team";
        case ScopeKind::Partner: return "partner";
    }
    return "unknown";
}

/**
 * Scope - Descriptor of the active identity scope.
 *
 * Two scopes are the same scope when kind and id match; the display name
 * is informational.
 */
struct Scope {
    ScopeKind kind{ScopeKind::User};
    EntityId id;
    std::string name;
    // Parent organization of a team or partner scope.
    std::optional<EntityId> organization_id;

    [[nodiscard]] static Scope user(EntityId id, std::string name = {}) {
        return Scope{ScopeKind::User, std::move(id), std::move(name), std::nullopt};
    }
    [[nodiscard]] static Scope organization(EntityId id, std::string name = {}) {
        return Scope{ScopeKind::Organization, std::move(id), std::move(name), std::nullopt};
    }
    [[nodiscard]] static Scope team(EntityId id, EntityId organization_id, std::string name = {}) {
        return Scope{ScopeKind::Team, std::move(id), std::move(name), std::move(organization_id)};
    }
    [[nodiscard]] static Scope partner(EntityId id, EntityId organization_id, std::string name = {}) {
        return Scope{ScopeKind::Partner, std::move(id), std::move(name), std::move(organization_id)};
    }

    /**
     * The organization this scope belongs to: itself for an organization,
     * the parent for a team or partner, nothing for a user.
     */
    [[nodiscard]] std::optional<EntityId> organization() const {
        switch (kind) {
            case ScopeKind::Organization: return id;
            case ScopeKind::Team:
            case ScopeKind::Partner: return organization_id;
            case ScopeKind::User: return std::nullopt;
        }
        return std::nullopt;
    }

    /**
     * Owner id of the workspaces visible in this scope. Teams and partners
     * see their organization's workspaces.
     */
    [[nodiscard]] std::optional<EntityId> workspace_owner() const {
        if (kind == ScopeKind::User) return id;
        return organization();
    }

    bool operator==(const Scope& other) const {
        return kind == other.kind && id == other.id;
    }
};

/**
 * Scope an account would activate; bots have none.
 */
[[nodiscard]] inline std::optional<Scope> scope_for_account(const Account& account) {
    return std::visit(overloaded{
        [&](const UserIdentity&) -> std::optional<Scope> {
            return Scope::user(account.id, account.display_name);
        },
        [&](const OrganizationIdentity&) -> std::optional<Scope> {
            return Scope::organization(account.id, account.display_name);
        },
        [](const BotIdentity&) -> std::optional<Scope> { return std::nullopt; },
        [&](const TeamIdentity& t) -> std::optional<Scope> {
            return Scope::team(account.id, t.organization_id, account.display_name);
        },
        [&](const PartnerIdentity& p) -> std::optional<Scope> {
            return Scope::partner(account.id, p.organization_id, account.display_name);
        },
    }, account.identity);
}

enum class ContextState {
    Uninitialized,
    IdentityActive,
    WorkspaceActive
};

/**
 * Context - The active (identity scope, optional workspace) pair plus the
 * signed-in principal.
 *
 * A workspace is only ever set while a scope is set.
 */
struct Context {
    EntityId principal_id;
    std::optional<Scope> scope;
    std::optional<EntityId> workspace_id;

    [[nodiscard]] ContextState state() const {
        if (!scope) return ContextState::Uninitialized;
        return workspace_id ? ContextState::WorkspaceActive : ContextState::IdentityActive;
    }

    [[nodiscard]] bool has_principal() const { return !principal_id.empty(); }

    bool operator==(const Context&) const = default;
};

/**
 * ContextChange - Payload of ContextStore::contextChanged.
 */
struct ContextChange {
    Context previous;
    Context current;
    bool identity_changed{false};
    bool workspace_changed{false};
};

enum class SwitchOutcome {
    Switched,
    AlreadyActive
};

} // namespace tether
