#include "store/account_store.hpp"

#include "app/logging.hpp"
#include "store/events.hpp"

#include <algorithm>

namespace tether::store {

AccountStore::AccountStore(app::AppContext& app, ContextStore& context, QObject* parent)
    : ScopeStoreBase(context, parent),
      bus_(app.bus),
      accounts_(app.repositories.accounts, app.config.mutation_policy) {
    track(accounts_);
    connect(this, &ScopeStoreBase::changed, this, &AccountStore::publishAvailability);
    attach();
}

std::optional<ScopeKey> AccountStore::scopeFor(const Context& context) const {
    if (!context.has_principal()) return std::nullopt;
    return ScopeKey{ScopeField::Member, context.principal_id};
}

void AccountStore::issueLoad(const ScopeKey& key) {
    accounts_.load(key);
}

std::optional<Account> AccountStore::account(const EntityId& id) const {
    if (const auto* a = accounts_.get(id)) return *a;
    return std::nullopt;
}

std::optional<Account> AccountStore::personal() const {
    const auto& principal = currentContext().principal_id;
    if (principal.empty()) return std::nullopt;
    return account(principal);
}

std::vector<Account> AccountStore::ofKind(IdentityKind kind) const {
    return accounts_.filter([kind](const Account& a) { return a.kind() == kind; });
}

Result<EntityId> AccountStore::create(Account draft, Completion<Account> done) {
    const auto& principal = currentContext().principal_id;
    if (principal.empty()) {
        return Result<EntityId>::err(Error::validation("no signed-in principal"));
    }
    if (draft.display_name.empty()) {
        return Result<EntityId>::err(Error::validation("account display name must not be empty"));
    }
    if (draft.kind() == IdentityKind::User) {
        return Result<EntityId>::err(Error::validation("user accounts are created by sign-up, not here"));
    }
    if (std::find(draft.member_ids.begin(), draft.member_ids.end(), principal) == draft.member_ids.end()) {
        draft.member_ids.push_back(principal);
    }
    return accounts_.create(draft, std::move(done));
}

Result<void> AccountStore::update(const EntityId& id, const AccountPatch& patch, Completion<void> done) {
    if (patch.display_name && patch.display_name->empty()) {
        return Result<void>::err(Error::validation("account display name must not be empty"));
    }
    return accounts_.update(id, patch, std::move(done));
}

Result<void> AccountStore::remove(const EntityId& id, Completion<void> done) {
    if (id == currentContext().principal_id) {
        return Result<void>::err(Error::validation("the signed-in account cannot be removed"));
    }
    return accounts_.remove(id, std::move(done));
}

Result<void> AccountStore::selectAccount(const EntityId& id) {
    const auto* selected = accounts_.get(id);
    if (!selected) {
        return Result<void>::err(Error::not_found("account " + id + " not cached"));
    }
    if (!scope_for_account(*selected)) {
        return Result<void>::err(Error::validation(
            std::string(kind_name(selected->kind())) + " accounts cannot be an active scope"));
    }
    qCDebug(tetherStoreLog) << "account selected" << QString::fromStdString(id);
    bus_.publish(kAccountSelected, AccountSelected{*selected});
    return Result<void>::ok();
}

void AccountStore::publishAvailability() {
    AccountsLoaded event;
    for (const auto& account : accounts_.values()) {
        if (EntityStore<Account>::is_provisional(account.id)) continue;
        auto scope = scope_for_account(account);
        if (!scope) continue;
        switch (scope->kind) {
            case ScopeKind::Organization: event.organizations.push_back(*scope); break;
            case ScopeKind::Team: event.teams.push_back(*scope); break;
            case ScopeKind::Partner: event.partners.push_back(*scope); break;
            case ScopeKind::User: break;
        }
    }
    bus_.publish(kAccountsLoaded, event);
}

} // namespace tether::store
