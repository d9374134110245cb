#include "store/member_store.hpp"

#include "app/logging.hpp"

#include <algorithm>

namespace tether::store {

MemberStore::MemberStore(app::AppContext& app, ContextStore& context, QObject* parent)
    : ScopeStoreBase(context, parent),
      members_(app.repositories.members, app.config.mutation_policy) {
    track(members_);
    attach();
}

std::optional<ScopeKey> MemberStore::scopeFor(const Context& context) const {
    if (!context.scope || !context.workspace_id) return std::nullopt;
    return ScopeKey{ScopeField::Workspace, *context.workspace_id};
}

void MemberStore::issueLoad(const ScopeKey& key) {
    members_.load(key);
}

std::vector<Membership> MemberStore::withStatus(MembershipStatus status) const {
    return members_.filter([status](const Membership& m) { return m.status == status; });
}

std::vector<Membership> MemberStore::withRole(Role role) const {
    return members_.filter([role](const Membership& m) { return m.role == role; });
}

std::optional<Membership> MemberStore::membership(const EntityId& id) const {
    if (const auto* m = members_.get(id)) return *m;
    return std::nullopt;
}

std::optional<Membership> MemberStore::membershipFor(const EntityId& account_id) const {
    auto found = members_.filter([&](const Membership& m) { return m.account_id == account_id; });
    if (found.empty()) return std::nullopt;
    return found.front();
}

std::vector<EntityId> MemberStore::actingIdentities() const {
    const auto& ctx = currentContext();
    std::vector<EntityId> ids;
    if (ctx.has_principal()) ids.push_back(ctx.principal_id);
    if (ctx.scope && ctx.scope->id != ctx.principal_id) ids.push_back(ctx.scope->id);
    return ids;
}

std::optional<CapabilitySet> MemberStore::currentCapabilities() const {
    const auto& ctx = currentContext();
    if (!ctx.workspace_id) return std::nullopt;

    const auto acting = actingIdentities();
    std::optional<CapabilitySet> caps;
    for (const auto& m : members_.values()) {
        if (m.workspace_id != *ctx.workspace_id || m.status != MembershipStatus::Active) continue;
        if (std::find(acting.begin(), acting.end(), m.account_id) == acting.end()) continue;
        auto granted = resolve(m.role, m.custom_permissions);
        if (!caps) caps = CapabilitySet{};
        caps->insert(granted.begin(), granted.end());
    }
    return caps;
}

bool MemberStore::can(Capability capability) const {
    auto caps = currentCapabilities();
    return caps && caps->count(capability) > 0;
}

Result<void> MemberStore::check(Capability capability, const EntityId& workspace_id) const {
    const auto& ctx = currentContext();
    const auto name = std::string(capability_name(capability));
    if (!ctx.workspace_id || *ctx.workspace_id != workspace_id) {
        return Result<void>::err(Error::permission_denied(
            name + " requires workspace " + workspace_id + " to be the active workspace"));
    }
    auto caps = currentCapabilities();
    if (!caps) {
        return Result<void>::err(Error::permission_denied(
            "no active membership in workspace " + workspace_id));
    }
    if (caps->count(capability) == 0) {
        return Result<void>::err(Error::permission_denied(name + " not granted in workspace " + workspace_id));
    }
    return Result<void>::ok();
}

Result<void> MemberStore::gate(Capability capability) const {
    const auto& ctx = currentContext();
    if (!ctx.workspace_id) {
        return Result<void>::err(Error::permission_denied("no active workspace"));
    }
    auto allowed = check(capability, *ctx.workspace_id);
    if (allowed.is_err()) {
        qCWarning(tetherStoreLog) << "membership mutation denied:"
                                  << QString::fromStdString(allowed.unwrap_err().message);
    }
    return allowed;
}

Result<EntityId> MemberStore::invite(const EntityId& account_id,
                                     IdentityKind account_kind,
                                     Role role,
                                     const std::string& email,
                                     Completion<Membership> done) {
    if (account_id.empty()) {
        return Result<EntityId>::err(Error::validation("account id must not be empty"));
    }
    if (auto allowed = gate(Capability::MembersInvite); allowed.is_err()) {
        return Result<EntityId>::err(allowed.unwrap_err());
    }
    if (membershipFor(account_id)) {
        return Result<EntityId>::err(Error::conflict(
            "account " + account_id + " already has a membership in this workspace"));
    }
    auto draft = create_invitation(*currentContext().workspace_id, account_id, account_kind, role,
                                   currentContext().principal_id);
    draft.email = email;
    return members_.create(draft, std::move(done));
}

Result<void> MemberStore::changeRole(const EntityId& id, Role role, Completion<void> done) {
    if (auto allowed = gate(Capability::MembersManageRoles); allowed.is_err()) return allowed;
    MembershipPatch patch;
    patch.role = role;
    return members_.update(id, patch, std::move(done));
}

Result<void> MemberStore::changeStatus(const EntityId& id, MembershipStatus status, Completion<void> done) {
    if (auto allowed = gate(Capability::MembersManageRoles); allowed.is_err()) return allowed;
    const auto* current = members_.get(id);
    if (!current) {
        return Result<void>::err(Error::not_found("membership " + id + " not cached"));
    }
    if (!can_transition(current->status, status)) {
        return Result<void>::err(Error::validation(
            std::string("membership cannot move from ") + std::string(status_name(current->status))
            + " to " + std::string(status_name(status))));
    }
    MembershipPatch patch;
    patch.status = status;
    return members_.update(id, patch, std::move(done));
}

Result<void> MemberStore::setCustomPermissions(const EntityId& id,
                                               std::vector<std::string> permissions,
                                               Completion<void> done) {
    if (auto allowed = gate(Capability::PermissionsEdit); allowed.is_err()) return allowed;
    MembershipPatch patch;
    patch.custom_permissions = std::move(permissions);
    return members_.update(id, patch, std::move(done));
}

Result<void> MemberStore::remove(const EntityId& id, Completion<void> done) {
    if (auto allowed = gate(Capability::MembersRemove); allowed.is_err()) return allowed;
    return members_.remove(id, std::move(done));
}

} // namespace tether::store
