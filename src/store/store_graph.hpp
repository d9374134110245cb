#pragma once

#include "app/app_context.hpp"
#include "store/account_store.hpp"
#include "store/bot_store.hpp"
#include "store/context_store.hpp"
#include "store/document_store.hpp"
#include "store/member_store.hpp"
#include "store/notification_store.hpp"
#include "store/organization_store.hpp"
#include "store/workspace_store.hpp"
#include <QObject>

namespace tether::store {

/**
 * StoreGraph - Builds the stores of one client session in dependency order
 * and tears them down in reverse. The member store is the capability gate
 * of the workspace, document and organization stores.
 *
 * Usage:
 *   app::AppContext app{bus, config, repositories, &auth};
 *   StoreGraph graph(app);
 *   graph.context().signIn("u1");
 */
class StoreGraph : public QObject {
    Q_OBJECT

public:
    explicit StoreGraph(app::AppContext& app, QObject* parent = nullptr);
    ~StoreGraph() override;

    [[nodiscard]] ContextStore& context() { return context_; }
    [[nodiscard]] AccountStore& accounts() { return accounts_; }
    [[nodiscard]] MemberStore& members() { return members_; }
    [[nodiscard]] WorkspaceStore& workspaces() { return workspaces_; }
    [[nodiscard]] DocumentStore& documents() { return documents_; }
    [[nodiscard]] OrganizationStore& organizations() { return organizations_; }
    [[nodiscard]] BotStore& bots() { return bots_; }
    [[nodiscard]] NotificationStore& notifications() { return notifications_; }

private:
    // Declaration order is construction order.
    ContextStore context_;
    AccountStore accounts_;
    MemberStore members_;
    WorkspaceStore workspaces_;
    DocumentStore documents_;
    OrganizationStore organizations_;
    BotStore bots_;
    NotificationStore notifications_;
};

} // namespace tether::store
