#pragma once

#include "app/app_context.hpp"
#include "core/identity.hpp"
#include "store/event_bus.hpp"
#include "store/scope_store_base.hpp"
#include <optional>
#include <vector>

namespace tether::store {

/**
 * AccountStore - The principal's own account and every account it is a
 * member of. Publishes the scopes they offer on the event bus whenever the
 * cache changes.
 */
class AccountStore : public ScopeStoreBase {
    Q_OBJECT

public:
    AccountStore(app::AppContext& app, ContextStore& context, QObject* parent = nullptr);

    // Views
    [[nodiscard]] std::vector<Account> accounts() const { return accounts_.values(); }
    [[nodiscard]] std::optional<Account> account(const EntityId& id) const;
    [[nodiscard]] std::optional<Account> personal() const;
    [[nodiscard]] std::vector<Account> ofKind(IdentityKind kind) const;
    [[nodiscard]] std::vector<Account> organizations() const { return ofKind(IdentityKind::Organization); }
    [[nodiscard]] std::vector<Account> teams() const { return ofKind(IdentityKind::Team); }
    [[nodiscard]] std::vector<Account> partners() const { return ofKind(IdentityKind::Partner); }
    [[nodiscard]] std::vector<Account> bots() const { return ofKind(IdentityKind::Bot); }

    // Mutations

    /**
     * Create an account. The principal is added to its members so it
     * appears in this store's scope.
     */
    Result<EntityId> create(Account draft, Completion<Account> done = {});
    Result<void> update(const EntityId& id, const AccountPatch& patch, Completion<void> done = {});
    Result<void> remove(const EntityId& id, Completion<void> done = {});

    /**
     * Ask the context to switch to a cached account's scope. Bots are not
     * selectable.
     */
    Result<void> selectAccount(const EntityId& id);

protected:
    [[nodiscard]] std::optional<ScopeKey> scopeFor(const Context& context) const override;
    void issueLoad(const ScopeKey& key) override;

private:
    void publishAvailability();

    EventBus& bus_;
    EntityStore<Account> accounts_;
};

} // namespace tether::store
