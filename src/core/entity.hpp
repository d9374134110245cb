#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace tether {

/**
 * ScopeField - The attribute a scoped query filters on.
 */
enum class ScopeField {
    Owner,         // workspaces owned by a user or organization
    Workspace,     // documents, memberships, bots with access to a workspace
    Member,        // accounts the principal belongs to
    Creator,       // bots created by a user
    Organization,  // teams, partners and bots of an organization
    Recipient      // notifications addressed to an identity
};

[[nodiscard]] constexpr std::string_view field_name(ScopeField field) {
    switch (field) {
        case ScopeField::Owner: return "owner";
        case ScopeField::Workspace: return "workspace";
        case ScopeField::Member: return "member";
        case ScopeField::Creator: return "creator";
        case ScopeField::Organization: return "organization";
        case ScopeField::Recipient: return "recipient";
    }
    return "unknown";
}

/**
 * ScopeKey - Argument of Repository::list_by_scope, e.g. {Workspace, "w1"}.
 */
struct ScopeKey {
    ScopeField field;
    EntityId value;

    [[nodiscard]] std::string to_string() const {
        return std::string(field_name(field)) + ":" + value;
    }

    bool operator==(const ScopeKey&) const = default;
};

/**
 * EntityTraits<E> - Per-entity glue used by the generic entity store and
 * the in-memory port adapter. Each entity header specializes it with:
 *
 *   using Patch = ...;                                   // partial update
 *   static constexpr std::string_view name;
 *   static const EntityId& id(const E&);
 *   static void assign_id(E&, EntityId);
 *   static void stamp(E&, Timestamp now, bool created);  // server timestamps
 *   static E apply(E, const Patch&);
 *   static bool in_scope(const E&, const ScopeKey&);
 */
template<typename E>
struct EntityTraits;

} // namespace tether
