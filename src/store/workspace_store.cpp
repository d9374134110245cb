#include "store/workspace_store.hpp"

#include "app/logging.hpp"

namespace tether::store {

WorkspaceStore::WorkspaceStore(app::AppContext& app,
                               ContextStore& context,
                               const CapabilityGate& gate,
                               QObject* parent)
    : ScopeStoreBase(context, parent),
      config_(app.config),
      gate_(gate),
      workspaces_(app.repositories.workspaces, app.config.mutation_policy) {
    track(workspaces_);
    attach();
}

std::optional<ScopeKey> WorkspaceStore::scopeFor(const Context& context) const {
    if (!context.scope) return std::nullopt;
    auto owner = context.scope->workspace_owner();
    if (!owner) return std::nullopt;
    return ScopeKey{ScopeField::Owner, *owner};
}

void WorkspaceStore::issueLoad(const ScopeKey& key) {
    workspaces_.load(key);
}

std::vector<Workspace> WorkspaceStore::workspaces() const {
    return sort_by_recency(workspaces_.values());
}

std::vector<Workspace> WorkspaceStore::active() const {
    return sort_by_recency(workspaces_.filter(
        [](const Workspace& w) { return w.status == WorkspaceStatus::Active; }));
}

std::vector<Workspace> WorkspaceStore::archived() const {
    return sort_by_recency(workspaces_.filter(
        [](const Workspace& w) { return w.status == WorkspaceStatus::Archived; }));
}

std::vector<Workspace> WorkspaceStore::recent() const {
    auto all = workspaces_.filter(
        [](const Workspace& w) { return w.last_accessed_at.has_value(); });
    all = sort_by_recency(std::move(all));
    const auto limit = static_cast<size_t>(config_.recent_workspaces_limit);
    if (all.size() > limit) all.resize(limit);
    return all;
}

std::optional<Workspace> WorkspaceStore::workspace(const EntityId& id) const {
    if (const auto* w = workspaces_.get(id)) return *w;
    return std::nullopt;
}

std::optional<Workspace> WorkspaceStore::currentWorkspace() const {
    const auto& selected = currentContext().workspace_id;
    if (selected) {
        if (const auto* w = workspaces_.get(*selected)) return *w;
    }
    return most_recently_accessed(active());
}

Result<EntityId> WorkspaceStore::create(const std::string& name,
                                        const std::string& description,
                                        Completion<Workspace> done) {
    const auto& ctx = currentContext();
    if (!ctx.scope) {
        return Result<EntityId>::err(Error::validation("no active scope to own the workspace"));
    }
    switch (ctx.scope->kind) {
        case ScopeKind::User:
            return createOwned(WorkspaceOwner{OwnerType::User, ctx.scope->id}, name, description,
                               std::move(done));
        case ScopeKind::Organization:
            return createOwned(WorkspaceOwner{OwnerType::Organization, ctx.scope->id}, name,
                               description, std::move(done));
        case ScopeKind::Team:
        case ScopeKind::Partner:
            return Result<EntityId>::err(Error::validation(
                std::string(scope_kind_name(ctx.scope->kind)) + " scopes cannot own workspaces"));
    }
    return Result<EntityId>::err(Error::validation("unknown scope kind"));
}

Result<EntityId> WorkspaceStore::createFor(const Account& owner,
                                           const std::string& name,
                                           Completion<Workspace> done) {
    auto type = owner_type_for(owner.kind());
    if (!type) {
        return Result<EntityId>::err(Error::validation(
            std::string(kind_name(owner.kind())) + " accounts cannot own workspaces"));
    }
    return createOwned(WorkspaceOwner{*type, owner.id}, name, {}, std::move(done));
}

Result<EntityId> WorkspaceStore::createOwned(WorkspaceOwner owner,
                                             const std::string& name,
                                             const std::string& description,
                                             Completion<Workspace> done) {
    if (auto valid = validate_workspace_name(name); valid.is_err()) {
        return Result<EntityId>::err(valid.unwrap_err());
    }
    auto draft = create_workspace(std::move(owner), name, currentContext().principal_id);
    draft.description = description;
    return workspaces_.create(draft, std::move(done));
}

Result<void> WorkspaceStore::rename(const EntityId& id, const std::string& name, Completion<void> done) {
    if (auto valid = validate_workspace_name(name); valid.is_err()) return valid;
    WorkspacePatch patch;
    patch.name = name;
    return update(id, patch, std::move(done));
}

Result<void> WorkspaceStore::update(const EntityId& id, const WorkspacePatch& patch, Completion<void> done) {
    if (patch.status) {
        return Result<void>::err(Error::validation("use archive/restore to change workspace status"));
    }
    if (auto allowed = gate_.check(Capability::WorkspaceEdit, id); allowed.is_err()) {
        qCWarning(tetherStoreLog) << "workspace update denied:"
                                  << QString::fromStdString(allowed.unwrap_err().message);
        return allowed;
    }
    return workspaces_.update(id, patch, std::move(done));
}

Result<void> WorkspaceStore::transition(const EntityId& id,
                                        WorkspaceStatus status,
                                        Capability capability,
                                        Completion<void> done) {
    if (auto allowed = gate_.check(capability, id); allowed.is_err()) {
        qCWarning(tetherStoreLog) << "workspace status change denied:"
                                  << QString::fromStdString(allowed.unwrap_err().message);
        return allowed;
    }
    return workspaces_.update_with(id, [status](const Workspace& current) {
        if (!can_transition(current.status, status)) {
            return Result<WorkspacePatch>::err(Error::validation("workspace status transition not allowed"));
        }
        WorkspacePatch patch;
        patch.status = status;
        return Result<WorkspacePatch>::ok(std::move(patch));
    }, std::move(done));
}

Result<void> WorkspaceStore::archive(const EntityId& id, Completion<void> done) {
    return transition(id, WorkspaceStatus::Archived, Capability::WorkspaceAdmin, std::move(done));
}

Result<void> WorkspaceStore::restore(const EntityId& id, Completion<void> done) {
    return transition(id, WorkspaceStatus::Active, Capability::WorkspaceAdmin, std::move(done));
}

Result<void> WorkspaceStore::remove(const EntityId& id, Completion<void> done) {
    if (auto allowed = gate_.check(Capability::WorkspaceDelete, id); allowed.is_err()) {
        qCWarning(tetherStoreLog) << "workspace delete denied:"
                                  << QString::fromStdString(allowed.unwrap_err().message);
        return allowed;
    }
    return workspaces_.remove(id, [this, id, done = std::move(done)](Result<void> result) {
        if (result.is_ok() && currentContext().workspace_id == id) {
            auto cleared = context_.clearWorkspace();
            if (cleared.is_err()) {
                qCWarning(tetherStoreLog) << "could not clear deleted workspace selection";
            }
        }
        if (done) done(std::move(result));
    });
}

Result<void> WorkspaceStore::setModuleEnabled(const EntityId& id,
                                              ModuleType module,
                                              bool enabled,
                                              Completion<void> done) {
    if (auto allowed = gate_.check(Capability::SettingsEdit, id); allowed.is_err()) {
        qCWarning(tetherStoreLog) << "module toggle denied:"
                                  << QString::fromStdString(allowed.unwrap_err().message);
        return allowed;
    }
    return workspaces_.update_with(id, [module, enabled](const Workspace& current) {
        WorkspacePatch patch;
        patch.modules = with_module_enabled(current.modules, module, enabled);
        return Result<WorkspacePatch>::ok(std::move(patch));
    }, std::move(done));
}

Result<void> WorkspaceStore::recordAccess(const EntityId& id, Completion<void> done) {
    if (!workspaces_.contains(id)) {
        return Result<void>::err(Error::not_found("workspace " + id + " is not visible in the active scope"));
    }
    WorkspacePatch patch;
    patch.last_accessed_at = Timestamp::now();
    return workspaces_.update(id, patch, std::move(done));
}

Result<SwitchOutcome> WorkspaceStore::select(const EntityId& id) {
    if (!workspaces_.contains(id)) {
        return Result<SwitchOutcome>::err(Error::not_found("workspace " + id + " not cached"));
    }
    auto switched = context_.switchWorkspace(id);
    if (switched.is_ok() && !workspaces_.in_flight(id)) {
        auto recorded = recordAccess(id);
        if (recorded.is_err()) {
            qCDebug(tetherStoreLog) << "access not recorded:"
                                    << QString::fromStdString(recorded.unwrap_err().message);
        }
    }
    return switched;
}

} // namespace tether::store
