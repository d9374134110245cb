#include "store/organization_store.hpp"

#include "app/logging.hpp"

#include <algorithm>

namespace tether::store {

OrganizationStore::OrganizationStore(app::AppContext& app,
                                     ContextStore& context,
                                     const CapabilityGate& gate,
                                     QObject* parent)
    : ScopeStoreBase(context, parent),
      gate_(gate),
      teams_(app.repositories.teams, app.config.mutation_policy),
      partners_(app.repositories.partners, app.config.mutation_policy) {
    track(teams_);
    track(partners_);
    attach();
}

std::optional<ScopeKey> OrganizationStore::scopeFor(const Context& context) const {
    if (!context.scope) return std::nullopt;
    auto organization = context.scope->organization();
    if (!organization) return std::nullopt;
    return ScopeKey{ScopeField::Organization, *organization};
}

void OrganizationStore::issueLoad(const ScopeKey& key) {
    teams_.load(key);
    partners_.load(key);
}

std::optional<EntityId> OrganizationStore::organizationId() const {
    const auto& ctx = currentContext();
    if (!ctx.scope) return std::nullopt;
    return ctx.scope->organization();
}

std::optional<Team> OrganizationStore::team(const EntityId& id) const {
    if (const auto* t = teams_.get(id)) return *t;
    return std::nullopt;
}

std::optional<Partner> OrganizationStore::partner(const EntityId& id) const {
    if (const auto* p = partners_.get(id)) return *p;
    return std::nullopt;
}

std::vector<Team> OrganizationStore::teamsOf(const EntityId& account_id) const {
    return teams_.filter([&](const Team& t) { return has_member(t.member_ids, account_id); });
}

std::vector<Partner> OrganizationStore::partnersOf(const EntityId& account_id) const {
    return partners_.filter([&](const Partner& p) { return has_member(p.member_ids, account_id); });
}

Result<void> OrganizationStore::gate() const {
    const auto& ctx = currentContext();
    if (!ctx.workspace_id) {
        return Result<void>::err(Error::permission_denied("organization changes need an active workspace"));
    }
    auto allowed = gate_.check(Capability::WorkspaceAdmin, *ctx.workspace_id);
    if (allowed.is_err()) {
        qCWarning(tetherStoreLog) << "organization mutation denied:"
                                  << QString::fromStdString(allowed.unwrap_err().message);
    }
    return allowed;
}

Result<EntityId> OrganizationStore::createTeam(const std::string& name,
                                               const std::string& description,
                                               Completion<Team> done) {
    auto organization = organizationId();
    if (!organization) {
        return Result<EntityId>::err(Error::validation("no organization in the active scope"));
    }
    if (name.empty()) {
        return Result<EntityId>::err(Error::validation("team name must not be empty"));
    }
    if (auto allowed = gate(); allowed.is_err()) return Result<EntityId>::err(allowed.unwrap_err());
    auto draft = create_team(*organization, name);
    draft.description = description;
    return teams_.create(draft, std::move(done));
}

Result<void> OrganizationStore::updateTeam(const EntityId& id, const TeamPatch& patch, Completion<void> done) {
    if (patch.name && patch.name->empty()) {
        return Result<void>::err(Error::validation("team name must not be empty"));
    }
    if (auto allowed = gate(); allowed.is_err()) return allowed;
    return teams_.update(id, patch, std::move(done));
}

Result<void> OrganizationStore::addTeamMember(const EntityId& id,
                                              const EntityId& account_id,
                                              Completion<void> done) {
    if (auto allowed = gate(); allowed.is_err()) return allowed;
    return teams_.update_with(id, [account_id](const Team& current) {
        if (has_member(current.member_ids, account_id)) {
            return Result<TeamPatch>::err(Error::conflict(
                "account " + account_id + " is already in team " + current.id));
        }
        TeamPatch patch;
        patch.member_ids = current.member_ids;
        patch.member_ids->push_back(account_id);
        return Result<TeamPatch>::ok(std::move(patch));
    }, std::move(done));
}

Result<void> OrganizationStore::removeTeamMember(const EntityId& id,
                                                 const EntityId& account_id,
                                                 Completion<void> done) {
    if (auto allowed = gate(); allowed.is_err()) return allowed;
    return teams_.update_with(id, [account_id](const Team& current) {
        if (!has_member(current.member_ids, account_id)) {
            return Result<TeamPatch>::err(Error::not_found(
                "account " + account_id + " is not in team " + current.id));
        }
        TeamPatch patch;
        patch.member_ids = current.member_ids;
        auto& ids = *patch.member_ids;
        ids.erase(std::remove(ids.begin(), ids.end(), account_id), ids.end());
        return Result<TeamPatch>::ok(std::move(patch));
    }, std::move(done));
}

Result<void> OrganizationStore::removeTeam(const EntityId& id, Completion<void> done) {
    if (auto allowed = gate(); allowed.is_err()) return allowed;
    return teams_.remove(id, std::move(done));
}

Result<EntityId> OrganizationStore::createPartner(const std::string& name,
                                                  PartnerAccess access,
                                                  Completion<Partner> done) {
    auto organization = organizationId();
    if (!organization) {
        return Result<EntityId>::err(Error::validation("no organization in the active scope"));
    }
    if (name.empty()) {
        return Result<EntityId>::err(Error::validation("partner name must not be empty"));
    }
    if (auto allowed = gate(); allowed.is_err()) return Result<EntityId>::err(allowed.unwrap_err());
    return partners_.create(create_partner(*organization, name, access), std::move(done));
}

Result<void> OrganizationStore::updatePartner(const EntityId& id,
                                              const PartnerPatch& patch,
                                              Completion<void> done) {
    if (patch.name && patch.name->empty()) {
        return Result<void>::err(Error::validation("partner name must not be empty"));
    }
    if (auto allowed = gate(); allowed.is_err()) return allowed;
    return partners_.update(id, patch, std::move(done));
}

Result<void> OrganizationStore::removePartner(const EntityId& id, Completion<void> done) {
    if (auto allowed = gate(); allowed.is_err()) return allowed;
    return partners_.remove(id, std::move(done));
}

} // namespace tether::store
