#pragma once

#include "app/app_context.hpp"
#include "core/membership.hpp"
#include "store/capability_gate.hpp"
#include "store/scope_store_base.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether::store {

/**
 * MemberStore - Memberships of the current workspace, and the capability
 * gate for every workspace-scoped mutation.
 *
 * The acting identity is the signed-in principal plus the active scope
 * identity; their ACTIVE memberships in the workspace supply the grant.
 */
class MemberStore : public ScopeStoreBase, public CapabilityGate {
    Q_OBJECT

public:
    MemberStore(app::AppContext& app, ContextStore& context, QObject* parent = nullptr);

    // Views
    [[nodiscard]] std::vector<Membership> memberships() const { return members_.values(); }
    [[nodiscard]] std::vector<Membership> withStatus(MembershipStatus status) const;
    [[nodiscard]] std::vector<Membership> active() const { return withStatus(MembershipStatus::Active); }
    [[nodiscard]] std::vector<Membership> invited() const { return withStatus(MembershipStatus::Invited); }
    [[nodiscard]] std::vector<Membership> suspended() const { return withStatus(MembershipStatus::Suspended); }
    [[nodiscard]] std::vector<Membership> archived() const { return withStatus(MembershipStatus::Archived); }
    [[nodiscard]] std::vector<Membership> withRole(Role role) const;
    [[nodiscard]] std::optional<Membership> membership(const EntityId& id) const;
    [[nodiscard]] std::optional<Membership> membershipFor(const EntityId& account_id) const;

    /**
     * Union of the acting identities' active grants in the current
     * workspace; empty when there is none.
     */
    [[nodiscard]] std::optional<CapabilitySet> currentCapabilities() const;
    [[nodiscard]] bool can(Capability capability) const;

    [[nodiscard]] Result<void> check(Capability capability,
                                     const EntityId& workspace_id) const override;

    // Mutations

    Result<EntityId> invite(const EntityId& account_id,
                            IdentityKind account_kind,
                            Role role,
                            const std::string& email = {},
                            Completion<Membership> done = {});
    Result<void> changeRole(const EntityId& id, Role role, Completion<void> done = {});
    Result<void> changeStatus(const EntityId& id, MembershipStatus status, Completion<void> done = {});
    Result<void> setCustomPermissions(const EntityId& id,
                                      std::vector<std::string> permissions,
                                      Completion<void> done = {});
    Result<void> remove(const EntityId& id, Completion<void> done = {});

protected:
    [[nodiscard]] std::optional<ScopeKey> scopeFor(const Context& context) const override;
    void issueLoad(const ScopeKey& key) override;

private:
    [[nodiscard]] Result<void> gate(Capability capability) const;
    [[nodiscard]] std::vector<EntityId> actingIdentities() const;

    EntityStore<Membership> members_;
};

} // namespace tether::store
