#pragma once

#include "core/bot.hpp"
#include "core/document.hpp"
#include "core/entity.hpp"
#include "core/identity.hpp"
#include "core/membership.hpp"
#include "core/notification.hpp"
#include "core/organization.hpp"
#include "core/result.hpp"
#include "core/workspace.hpp"
#include <vector>

namespace tether::storage {

/**
 * Repository<E> - Asynchronous port to the remote backend for one aggregate.
 *
 * Every call returns immediately; the completion runs exactly once, later,
 * on the caller's event loop. Failures are reported as Transport errors
 * (retryable or not) or NotFound for get_by_id.
 */
template<typename E>
class Repository {
public:
    using Entity = E;
    using Patch = typename EntityTraits<E>::Patch;

    virtual ~Repository() = default;

    virtual void get_by_id(const EntityId& id, Completion<E> done) = 0;
    virtual void list_by_scope(const ScopeKey& scope, Completion<std::vector<E>> done) = 0;

    /**
     * The backend assigns the id and timestamps; the completion carries the
     * stored entity.
     */
    virtual void create(const E& draft, Completion<E> done) = 0;
    virtual void update(const EntityId& id, const Patch& patch, Completion<void> done) = 0;
    virtual void remove(const EntityId& id, Completion<void> done) = 0;
};

using AccountRepository = Repository<Account>;
using WorkspaceRepository = Repository<Workspace>;
using MemberRepository = Repository<Membership>;
using DocumentRepository = Repository<Document>;
using NotificationRepository = Repository<Notification>;
using BotRepository = Repository<Bot>;
using TeamRepository = Repository<Team>;
using PartnerRepository = Repository<Partner>;

/**
 * Repositories - The full set of ports the stores are wired against.
 */
struct Repositories {
    AccountRepository& accounts;
    WorkspaceRepository& workspaces;
    MemberRepository& members;
    DocumentRepository& documents;
    NotificationRepository& notifications;
    BotRepository& bots;
    TeamRepository& teams;
    PartnerRepository& partners;
};

} // namespace tether::storage
