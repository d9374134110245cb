#pragma once

#include "app/app_context.hpp"
#include "core/context.hpp"
#include "core/result.hpp"
#include "store/event_bus.hpp"
#include "store/events.hpp"
#include <QMetaType>
#include <QObject>
#include <QString>
#include <deque>
#include <optional>
#include <vector>

namespace tether::store {

/**
 * ContextStore - Single source of truth for the active scope and workspace.
 *
 * States: Uninitialized (no scope), IdentityActive(scope) and
 * IdentityActive(scope) + WorkspaceActive(id). Every transition is
 * synchronous and emits contextChanged before returning; the scope stores
 * react to that signal. Switching the identity scope clears the workspace.
 * Sign-out (teardown) returns to Uninitialized.
 */
class ContextStore : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool hasWorkspace READ hasWorkspace NOTIFY contextChanged)
    Q_PROPERTY(bool canSwitchContext READ canSwitchContext NOTIFY availableContextsChanged)
    Q_PROPERTY(QString scopeName READ scopeName NOTIFY contextChanged)

public:
    explicit ContextStore(app::AppContext& app, QObject* parent = nullptr);
    ~ContextStore() override;

    [[nodiscard]] const Context& context() const { return context_; }
    [[nodiscard]] ContextState state() const { return context_.state(); }

    /**
     * Sign the principal in and activate its own user scope.
     */
    Result<SwitchOutcome> signIn(const EntityId& principal_id, const std::string& display_name = {});

    /**
     * Activate `target`, optionally with a workspace. Returns AlreadyActive
     * without emitting when the resulting context equals the current one.
     * ValidationError when nobody is signed in or the scope is malformed.
     */
    Result<SwitchOutcome> switchContext(const Scope& target,
                                        std::optional<EntityId> workspace_id = std::nullopt);

    /**
     * Select a workspace inside the active scope. ValidationError without
     * an active scope.
     */
    Result<SwitchOutcome> switchWorkspace(const EntityId& workspace_id);
    Result<SwitchOutcome> clearWorkspace();

    /**
     * Back to the principal's own user scope.
     */
    Result<SwitchOutcome> resetToPrincipal();

    /**
     * Sign-out: forget principal, scope, workspace and history.
     */
    void teardown();

    // Derived views

    [[nodiscard]] std::optional<ScopeKind> scopeKind() const;
    [[nodiscard]] std::optional<EntityId> scopeId() const;
    [[nodiscard]] QString scopeName() const;
    [[nodiscard]] bool hasWorkspace() const { return context_.workspace_id.has_value(); }
    [[nodiscard]] const EntityId& principalId() const { return context_.principal_id; }

    [[nodiscard]] const std::vector<Scope>& availableOrganizations() const { return available_.organizations; }
    [[nodiscard]] const std::vector<Scope>& availableTeams() const { return available_.teams; }
    [[nodiscard]] const std::vector<Scope>& availablePartners() const { return available_.partners; }

    /**
     * True when some scope other than the active one can be switched to.
     */
    [[nodiscard]] bool canSwitchContext() const;

    /**
     * Previous contexts, most recent last, bounded by context/history_limit.
     */
    [[nodiscard]] const std::deque<Context>& history() const { return history_; }

signals:
    void contextChanged(const tether::ContextChange& change);
    void availableContextsChanged();

private:
    void apply(Context next);
    void onAuthUserChanged();
    void onAccountSelected(const AccountSelected& event);
    void onAccountsLoaded(const AccountsLoaded& event);

    app::AppContext& app_;
    Context context_;
    std::string principal_name_;
    std::deque<Context> history_;
    AccountsLoaded available_;

    Subscription account_selected_;
    Subscription accounts_loaded_;
    QMetaObject::Connection auth_connection_;
};

} // namespace tether::store

Q_DECLARE_METATYPE(tether::ContextChange)
