#include "store/bot_store.hpp"

#include "app/logging.hpp"

#include <algorithm>

namespace tether::store {

BotStore::BotStore(app::AppContext& app, ContextStore& context, QObject* parent)
    : ScopeStoreBase(context, parent),
      bots_(app.repositories.bots, app.config.mutation_policy) {
    track(bots_);
    attach();
}

std::optional<ScopeKey> BotStore::scopeFor(const Context& context) const {
    if (!context.scope) return std::nullopt;
    if (context.scope->kind == ScopeKind::User) {
        return ScopeKey{ScopeField::Creator, context.principal_id};
    }
    auto organization = context.scope->organization();
    if (!organization) return std::nullopt;
    return ScopeKey{ScopeField::Organization, *organization};
}

void BotStore::issueLoad(const ScopeKey& key) {
    bots_.load(key);
}

void BotStore::loadByWorkspace(const EntityId& workspace_id, Completion<void> done) {
    bots_.load(ScopeKey{ScopeField::Workspace, workspace_id}, std::move(done));
}

void BotStore::loadByCreator(const EntityId& creator_id, Completion<void> done) {
    bots_.load(ScopeKey{ScopeField::Creator, creator_id}, std::move(done));
}

void BotStore::loadByOrganization(const EntityId& organization_id, Completion<void> done) {
    bots_.load(ScopeKey{ScopeField::Organization, organization_id}, std::move(done));
}

std::optional<Bot> BotStore::bot(const EntityId& id) const {
    if (const auto* b = bots_.get(id)) return *b;
    return std::nullopt;
}

std::vector<Bot> BotStore::withStatus(BotStatus status) const {
    return bots_.filter([status](const Bot& b) { return b.status == status; });
}

std::vector<Bot> BotStore::withAccessTo(const EntityId& workspace_id) const {
    return bots_.filter([&](const Bot& b) {
        return std::find(b.workspace_ids.begin(), b.workspace_ids.end(), workspace_id)
            != b.workspace_ids.end();
    });
}

Result<EntityId> BotStore::create(const std::string& name,
                                  const std::string& description,
                                  std::vector<BotScope> scopes,
                                  Completion<Bot> done) {
    const auto& ctx = currentContext();
    if (!ctx.scope) {
        return Result<EntityId>::err(Error::validation("no active scope"));
    }
    if (name.empty()) {
        return Result<EntityId>::err(Error::validation("bot name must not be empty"));
    }
    auto draft = create_bot(name, ctx.principal_id, ctx.scope->organization());
    draft.description = description;
    draft.scopes = std::move(scopes);
    return bots_.create(draft, std::move(done));
}

Result<void> BotStore::update(const EntityId& id, const BotPatch& patch, Completion<void> done) {
    if (patch.status) {
        return Result<void>::err(Error::validation("use suspend/reactivate/revoke to change bot status"));
    }
    if (patch.name && patch.name->empty()) {
        return Result<void>::err(Error::validation("bot name must not be empty"));
    }
    return bots_.update(id, patch, std::move(done));
}

Result<void> BotStore::grantWorkspace(const EntityId& id, const EntityId& workspace_id, Completion<void> done) {
    return bots_.update_with(id, [workspace_id](const Bot& current) {
        if (std::find(current.workspace_ids.begin(), current.workspace_ids.end(), workspace_id)
            != current.workspace_ids.end()) {
            return Result<BotPatch>::err(Error::conflict(
                "bot " + current.id + " already has access to " + workspace_id));
        }
        BotPatch patch;
        patch.workspace_ids = current.workspace_ids;
        patch.workspace_ids->push_back(workspace_id);
        return Result<BotPatch>::ok(std::move(patch));
    }, std::move(done));
}

Result<void> BotStore::changeStatus(const EntityId& id,
                                    BotStatus status,
                                    std::string reason,
                                    Completion<void> done) {
    return bots_.update_with(id, [status, reason = std::move(reason)](const Bot& current) {
        if (!can_transition(current.status, status)) {
            qCWarning(tetherStoreLog) << "bot" << QString::fromStdString(current.id) << "status change refused";
            return Result<BotPatch>::err(Error::validation("bot status transition not allowed"));
        }
        BotPatch patch;
        patch.status = status;
        patch.suspension_reason = reason;
        return Result<BotPatch>::ok(std::move(patch));
    }, std::move(done));
}

Result<void> BotStore::suspend(const EntityId& id, const std::string& reason, Completion<void> done) {
    return changeStatus(id, BotStatus::Suspended, reason, std::move(done));
}

Result<void> BotStore::reactivate(const EntityId& id, Completion<void> done) {
    return changeStatus(id, BotStatus::Active, {}, std::move(done));
}

Result<void> BotStore::revoke(const EntityId& id, Completion<void> done) {
    return changeStatus(id, BotStatus::Revoked, {}, std::move(done));
}

Result<void> BotStore::remove(const EntityId& id, Completion<void> done) {
    return bots_.remove(id, std::move(done));
}

} // namespace tether::store
