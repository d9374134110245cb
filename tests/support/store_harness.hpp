#pragma once

#include "app/app_context.hpp"
#include "app/auth_session.hpp"
#include "app/config.hpp"
#include "store/event_bus.hpp"

namespace tether::testing {

/**
 * StoreHarness<Repo> - One repository of kind Repo per aggregate plus the
 * bus, config and auth session a store graph is built from. Adjust
 * `config` before constructing stores from `app`.
 */
template<template<typename> class Repo>
struct StoreHarness {
    Repo<Account> accounts;
    Repo<Workspace> workspaces;
    Repo<Membership> members;
    Repo<Document> documents;
    Repo<Notification> notifications;
    Repo<Bot> bots;
    Repo<Team> teams;
    Repo<Partner> partners;

    store::EventBus bus;
    app::StoreConfig config;
    app::AuthSession auth;

    app::AppContext app{
        bus,
        config,
        storage::Repositories{accounts, workspaces, members, documents,
                              notifications, bots, teams, partners},
        &auth
    };
};

} // namespace tether::testing
