#include "store/context_store.hpp"

#include "app/logging.hpp"

namespace tether::store {

namespace {

QString describe(const Context& context) {
    if (!context.scope) return QStringLiteral("<none>");
    auto text = QStringLiteral("%1:%2")
                    .arg(QLatin1String(scope_kind_name(context.scope->kind).data()),
                         QString::fromStdString(context.scope->id));
    if (context.workspace_id) {
        text += QStringLiteral(" / workspace:") + QString::fromStdString(*context.workspace_id);
    }
    return text;
}

Result<SwitchOutcome> invalid(std::string message) {
    qCWarning(tetherContextLog) << "switch rejected:" << QString::fromStdString(message);
    return Result<SwitchOutcome>::err(Error::validation(std::move(message)));
}

} // namespace

ContextStore::ContextStore(app::AppContext& app, QObject* parent)
    : QObject(parent),
      app_(app) {
    account_selected_ = app_.bus.subscribe(kAccountSelected,
        [this](const AccountSelected& event) { onAccountSelected(event); });
    accounts_loaded_ = app_.bus.subscribe(kAccountsLoaded,
        [this](const AccountsLoaded& event) { onAccountsLoaded(event); });

    if (app_.auth) {
        auth_connection_ = connect(app_.auth, &app::AuthSession::userChanged,
                                   this, &ContextStore::onAuthUserChanged);
        if (app_.auth->signedIn()) {
            onAuthUserChanged();
        }
    }
}

ContextStore::~ContextStore() {
    disconnect(auth_connection_);
}

Result<SwitchOutcome> ContextStore::signIn(const EntityId& principal_id, const std::string& display_name) {
    if (principal_id.empty()) {
        return invalid("principal id must not be empty");
    }
    principal_name_ = display_name;
    Context next;
    next.principal_id = principal_id;
    next.scope = Scope::user(principal_id, display_name);
    if (next == context_) {
        return Result<SwitchOutcome>::ok(SwitchOutcome::AlreadyActive);
    }
    if (context_.has_principal() && context_.principal_id != principal_id) {
        // A different principal inherits nothing from the previous session.
        history_.clear();
        available_ = AccountsLoaded{};
        emit availableContextsChanged();
    }
    qCInfo(tetherContextLog) << "signed in" << QString::fromStdString(principal_id);
    apply(std::move(next));
    return Result<SwitchOutcome>::ok(SwitchOutcome::Switched);
}

Result<SwitchOutcome> ContextStore::switchContext(const Scope& target,
                                                  std::optional<EntityId> workspace_id) {
    if (!context_.has_principal()) {
        return invalid("cannot switch context without a signed-in principal");
    }
    if (target.id.empty()) {
        return invalid("scope id must not be empty");
    }
    if ((target.kind == ScopeKind::Team || target.kind == ScopeKind::Partner)
        && (!target.organization_id || target.organization_id->empty())) {
        return invalid("team and partner scopes need their organization id");
    }
    if (target.kind == ScopeKind::User && target.id != context_.principal_id) {
        return invalid("a user scope can only be the signed-in principal");
    }
    if (workspace_id && workspace_id->empty()) {
        return invalid("workspace id must not be empty");
    }

    Context next;
    next.principal_id = context_.principal_id;
    next.scope = target;
    next.workspace_id = std::move(workspace_id);

    if (next == context_) {
        qCDebug(tetherContextLog) << "already active:" << describe(context_);
        return Result<SwitchOutcome>::ok(SwitchOutcome::AlreadyActive);
    }
    apply(std::move(next));
    return Result<SwitchOutcome>::ok(SwitchOutcome::Switched);
}

Result<SwitchOutcome> ContextStore::switchWorkspace(const EntityId& workspace_id) {
    if (!context_.scope) {
        return invalid("cannot select a workspace without an active scope");
    }
    if (workspace_id.empty()) {
        return invalid("workspace id must not be empty");
    }
    if (context_.workspace_id == workspace_id) {
        return Result<SwitchOutcome>::ok(SwitchOutcome::AlreadyActive);
    }
    auto next = context_;
    next.workspace_id = workspace_id;
    apply(std::move(next));
    return Result<SwitchOutcome>::ok(SwitchOutcome::Switched);
}

Result<SwitchOutcome> ContextStore::clearWorkspace() {
    if (!context_.workspace_id) {
        return Result<SwitchOutcome>::ok(SwitchOutcome::AlreadyActive);
    }
    auto next = context_;
    next.workspace_id.reset();
    apply(std::move(next));
    return Result<SwitchOutcome>::ok(SwitchOutcome::Switched);
}

Result<SwitchOutcome> ContextStore::resetToPrincipal() {
    if (!context_.has_principal()) {
        return invalid("nobody is signed in");
    }
    return switchContext(Scope::user(context_.principal_id, principal_name_));
}

void ContextStore::teardown() {
    if (!available_.organizations.empty() || !available_.teams.empty()
        || !available_.partners.empty()) {
        available_ = AccountsLoaded{};
        emit availableContextsChanged();
    }
    principal_name_.clear();
    if (context_ != Context{}) {
        qCInfo(tetherContextLog) << "teardown from" << describe(context_);
        apply(Context{});
    }
    history_.clear();
}

std::optional<ScopeKind> ContextStore::scopeKind() const {
    if (!context_.scope) return std::nullopt;
    return context_.scope->kind;
}

std::optional<EntityId> ContextStore::scopeId() const {
    if (!context_.scope) return std::nullopt;
    return context_.scope->id;
}

QString ContextStore::scopeName() const {
    if (!context_.scope) return QString{};
    return QString::fromStdString(context_.scope->name);
}

bool ContextStore::canSwitchContext() const {
    if (!context_.has_principal()) return false;
    const auto& current = context_.scope;
    if (current && current->kind != ScopeKind::User) return true;
    return !available_.organizations.empty() || !available_.teams.empty()
        || !available_.partners.empty();
}

void ContextStore::apply(Context next) {
    ContextChange change;
    change.previous = context_;
    change.current = next;
    change.identity_changed = change.previous.scope != change.current.scope
        || change.previous.principal_id != change.current.principal_id;
    change.workspace_changed = change.previous.workspace_id != change.current.workspace_id;

    if (change.previous.scope && app_.config.history_limit > 0) {
        history_.push_back(change.previous);
        while (history_.size() > static_cast<size_t>(app_.config.history_limit)) {
            history_.pop_front();
        }
    }

    context_ = std::move(next);
    qCDebug(tetherContextLog) << "context" << describe(change.previous) << "->" << describe(context_);
    emit contextChanged(change);
}

void ContextStore::onAuthUserChanged() {
    const auto& user = app_.auth->currentUser();
    if (!user) {
        teardown();
        return;
    }
    auto result = signIn(user->id, user->display_name);
    if (result.is_err()) {
        qCWarning(tetherContextLog) << "sign-in from auth session failed:"
                                    << QString::fromStdString(result.unwrap_err().to_string());
    }
}

void ContextStore::onAccountSelected(const AccountSelected& event) {
    auto scope = scope_for_account(event.account);
    if (!scope) {
        qCWarning(tetherContextLog) << "account" << QString::fromStdString(event.account.id)
                                    << "of kind" << QLatin1String(kind_name(event.account.kind()).data())
                                    << "cannot be an active scope";
        return;
    }
    auto result = switchContext(*scope);
    if (result.is_err()) {
        qCWarning(tetherContextLog) << "account selection ignored:"
                                    << QString::fromStdString(result.unwrap_err().to_string());
    }
}

void ContextStore::onAccountsLoaded(const AccountsLoaded& event) {
    available_ = event;
    qCDebug(tetherContextLog) << "available scopes:" << available_.organizations.size() << "organizations,"
                              << available_.teams.size() << "teams," << available_.partners.size()
                              << "partners";
    emit availableContextsChanged();
}

} // namespace tether::store
