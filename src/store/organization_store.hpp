#pragma once

#include "app/app_context.hpp"
#include "core/organization.hpp"
#include "store/capability_gate.hpp"
#include "store/scope_store_base.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether::store {

/**
 * OrganizationStore - Teams and partners of the organization behind the
 * active scope (an organization, or the parent of a team or partner).
 * Empty in a user scope.
 *
 * Mutations need workspace.admin in the current workspace.
 */
class OrganizationStore : public ScopeStoreBase {
    Q_OBJECT

public:
    OrganizationStore(app::AppContext& app,
                      ContextStore& context,
                      const CapabilityGate& gate,
                      QObject* parent = nullptr);

    // Views
    [[nodiscard]] std::vector<Team> teams() const { return teams_.values(); }
    [[nodiscard]] std::vector<Partner> partners() const { return partners_.values(); }
    [[nodiscard]] std::optional<Team> team(const EntityId& id) const;
    [[nodiscard]] std::optional<Partner> partner(const EntityId& id) const;
    [[nodiscard]] std::vector<Team> teamsOf(const EntityId& account_id) const;
    [[nodiscard]] std::vector<Partner> partnersOf(const EntityId& account_id) const;

    // Mutations
    Result<EntityId> createTeam(const std::string& name,
                                const std::string& description = {},
                                Completion<Team> done = {});
    Result<void> updateTeam(const EntityId& id, const TeamPatch& patch, Completion<void> done = {});
    Result<void> addTeamMember(const EntityId& id, const EntityId& account_id, Completion<void> done = {});
    Result<void> removeTeamMember(const EntityId& id, const EntityId& account_id, Completion<void> done = {});
    Result<void> removeTeam(const EntityId& id, Completion<void> done = {});

    Result<EntityId> createPartner(const std::string& name,
                                   PartnerAccess access,
                                   Completion<Partner> done = {});
    Result<void> updatePartner(const EntityId& id, const PartnerPatch& patch, Completion<void> done = {});
    Result<void> removePartner(const EntityId& id, Completion<void> done = {});

protected:
    [[nodiscard]] std::optional<ScopeKey> scopeFor(const Context& context) const override;
    void issueLoad(const ScopeKey& key) override;

private:
    [[nodiscard]] Result<void> gate() const;
    [[nodiscard]] std::optional<EntityId> organizationId() const;

    const CapabilityGate& gate_;
    EntityStore<Team> teams_;
    EntityStore<Partner> partners_;
};

} // namespace tether::store
