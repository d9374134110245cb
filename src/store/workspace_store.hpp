#pragma once

#include "app/app_context.hpp"
#include "core/workspace.hpp"
#include "store/capability_gate.hpp"
#include "store/scope_store_base.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether::store {

/**
 * WorkspaceStore - Workspaces owned by the active scope: the user itself,
 * an organization, or the organization a team or partner belongs to.
 */
class WorkspaceStore : public ScopeStoreBase {
    Q_OBJECT

public:
    WorkspaceStore(app::AppContext& app,
                   ContextStore& context,
                   const CapabilityGate& gate,
                   QObject* parent = nullptr);

    // Views

    /**
     * All workspaces, most recently accessed first.
     */
    [[nodiscard]] std::vector<Workspace> workspaces() const;
    [[nodiscard]] std::vector<Workspace> active() const;
    [[nodiscard]] std::vector<Workspace> archived() const;
    [[nodiscard]] std::vector<Workspace> recent() const;
    [[nodiscard]] std::optional<Workspace> workspace(const EntityId& id) const;

    /**
     * The selected workspace when it is cached, otherwise the most recently
     * accessed active one, otherwise nothing.
     */
    [[nodiscard]] std::optional<Workspace> currentWorkspace() const;

    // Mutations

    /**
     * Create a workspace owned by the active scope. Teams and partners
     * cannot own workspaces.
     */
    Result<EntityId> create(const std::string& name,
                            const std::string& description = {},
                            Completion<Workspace> done = {});

    /**
     * Create a workspace owned by `owner`, which must be a user or an
     * organization.
     */
    Result<EntityId> createFor(const Account& owner,
                               const std::string& name,
                               Completion<Workspace> done = {});

    Result<void> rename(const EntityId& id, const std::string& name, Completion<void> done = {});
    Result<void> update(const EntityId& id, const WorkspacePatch& patch, Completion<void> done = {});
    Result<void> archive(const EntityId& id, Completion<void> done = {});
    Result<void> restore(const EntityId& id, Completion<void> done = {});
    Result<void> remove(const EntityId& id, Completion<void> done = {});
    Result<void> setModuleEnabled(const EntityId& id, ModuleType module, bool enabled,
                                  Completion<void> done = {});

    /**
     * Stamp last_accessed_at on a workspace of the active scope. Not gated
     * on a capability: it runs from select(), before the member grant for
     * the newly selected workspace has loaded, and the workspace being in
     * this store's owner-scoped cache already establishes that the scope
     * can see it. Workspaces outside the cache give NotFound.
     */
    Result<void> recordAccess(const EntityId& id, Completion<void> done = {});

    /**
     * Make a cached workspace the context's workspace and record the access.
     */
    Result<SwitchOutcome> select(const EntityId& id);

protected:
    [[nodiscard]] std::optional<ScopeKey> scopeFor(const Context& context) const override;
    void issueLoad(const ScopeKey& key) override;

private:
    Result<EntityId> createOwned(WorkspaceOwner owner, const std::string& name,
                                 const std::string& description, Completion<Workspace> done);
    Result<void> transition(const EntityId& id, WorkspaceStatus status, Capability capability,
                            Completion<void> done);

    const app::StoreConfig& config_;
    const CapabilityGate& gate_;
    EntityStore<Workspace> workspaces_;
};

} // namespace tether::store
