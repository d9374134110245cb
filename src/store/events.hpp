#pragma once

#include "core/context.hpp"
#include "core/identity.hpp"
#include "store/event_bus.hpp"
#include <vector>

namespace tether::store {

/**
 * Published by AccountStore::selectAccount; the context store switches to
 * the account's scope.
 */
struct AccountSelected {
    Account account;
};

/**
 * Published whenever the account store's cache changes; the context store
 * derives the scopes it offers from it.
 */
struct AccountsLoaded {
    std::vector<Scope> organizations;
    std::vector<Scope> teams;
    std::vector<Scope> partners;
};

inline constexpr EventKey<AccountSelected> kAccountSelected{"account.selected"};
inline constexpr EventKey<AccountsLoaded> kAccountsLoaded{"accounts.loaded"};

} // namespace tether::store
