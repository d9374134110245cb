#pragma once

#include "app/app_context.hpp"
#include "core/bot.hpp"
#include "store/scope_store_base.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether::store {

/**
 * BotStore - Bots created by the principal (user scope) or belonging to
 * the active organization.
 *
 * The explicit loadBy* calls replace the cache with another slice until
 * the next scope change or reload().
 */
class BotStore : public ScopeStoreBase {
    Q_OBJECT

public:
    BotStore(app::AppContext& app, ContextStore& context, QObject* parent = nullptr);

    // Views
    [[nodiscard]] std::vector<Bot> bots() const { return bots_.values(); }
    [[nodiscard]] std::optional<Bot> bot(const EntityId& id) const;
    [[nodiscard]] std::vector<Bot> withStatus(BotStatus status) const;
    [[nodiscard]] std::vector<Bot> active() const { return withStatus(BotStatus::Active); }
    [[nodiscard]] std::vector<Bot> suspended() const { return withStatus(BotStatus::Suspended); }
    [[nodiscard]] std::vector<Bot> revoked() const { return withStatus(BotStatus::Revoked); }
    [[nodiscard]] std::vector<Bot> withAccessTo(const EntityId& workspace_id) const;

    void loadByWorkspace(const EntityId& workspace_id, Completion<void> done = {});
    void loadByCreator(const EntityId& creator_id, Completion<void> done = {});
    void loadByOrganization(const EntityId& organization_id, Completion<void> done = {});

    // Mutations
    Result<EntityId> create(const std::string& name,
                            const std::string& description = {},
                            std::vector<BotScope> scopes = {BotScope::ReadWorkspace},
                            Completion<Bot> done = {});
    Result<void> update(const EntityId& id, const BotPatch& patch, Completion<void> done = {});
    Result<void> grantWorkspace(const EntityId& id, const EntityId& workspace_id, Completion<void> done = {});
    Result<void> suspend(const EntityId& id, const std::string& reason, Completion<void> done = {});
    Result<void> reactivate(const EntityId& id, Completion<void> done = {});
    Result<void> revoke(const EntityId& id, Completion<void> done = {});
    Result<void> remove(const EntityId& id, Completion<void> done = {});

protected:
    [[nodiscard]] std::optional<ScopeKey> scopeFor(const Context& context) const override;
    void issueLoad(const ScopeKey& key) override;

private:
    Result<void> changeStatus(const EntityId& id, BotStatus status, std::string reason,
                              Completion<void> done);

    EntityStore<Bot> bots_;
};

} // namespace tether::store
