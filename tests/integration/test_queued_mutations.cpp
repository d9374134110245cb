#include <catch2/catch_test_macros.hpp>

#include "store/store_graph.hpp"
#include "support/scripted_repository.hpp"
#include "support/store_harness.hpp"

#include <algorithm>
#include <memory>

using namespace tether;
using namespace tether::store;
using Harness = tether::testing::StoreHarness<tether::testing::ScriptedRepository>;

namespace {

Membership active_member(EntityId account, Role role) {
    auto m = create_invitation("w1", account, IdentityKind::User, role, "u1");
    m.id = "m-" + account;
    m.status = MembershipStatus::Active;
    return m;
}

Workspace workspace(EntityId id, EntityId owner) {
    auto ws = create_workspace(WorkspaceOwner{OwnerType::User, owner}, "ws " + id, owner);
    ws.id = std::move(id);
    return ws;
}

Bot bot(EntityId id) {
    auto b = create_bot("bot " + id, "u1", std::nullopt);
    b.id = std::move(id);
    return b;
}

Team team(EntityId id) {
    auto t = create_team("o1", "team " + id);
    t.id = std::move(id);
    return t;
}

bool module_on(const std::vector<ModuleToggle>& modules, ModuleType type) {
    return std::any_of(modules.begin(), modules.end(),
        [type](const ModuleToggle& m) { return m.type == type && m.enabled; });
}

/**
 * A graph whose stores queue mutations on busy ids, signed in as an admin
 * of w1.
 */
struct QueueFixture {
    Harness h;
    std::unique_ptr<StoreGraph> graph;

    explicit QueueFixture(std::optional<Scope> scope = std::nullopt) {
        h.config.mutation_policy = MutationPolicy::Queue;
        graph = std::make_unique<StoreGraph>(h.app);
        REQUIRE(graph->context().signIn("u1").is_ok());
        if (scope) {
            REQUIRE(graph->context().switchContext(*scope, EntityId("w1")).is_ok());
        } else {
            REQUIRE(graph->context().switchWorkspace("w1").is_ok());
        }
        h.members.resolve_list(0, {active_member("u1", Role::Admin)});
    }
};

} // namespace

TEST_CASE("Queued mutations: module toggles rebuild after a rollback", "[queue]") {
    QueueFixture f;
    f.h.workspaces.resolve_list(f.h.workspaces.lists.size() - 1, {workspace("w1", "u1")});
    auto& workspaces = f.graph->workspaces();

    REQUIRE(workspaces.setModuleEnabled("w1", ModuleType::Audit, true).is_ok());
    REQUIRE(workspaces.setModuleEnabled("w1", ModuleType::Journal, true).is_ok());
    REQUIRE(f.h.workspaces.updates.size() == 1);
    REQUIRE(is_module_enabled(*workspaces.workspace("w1"), ModuleType::Audit));

    f.h.workspaces.fail_update(0, Error::transport("offline", true));

    REQUIRE(f.h.workspaces.updates.size() == 2);
    const auto& sent = *f.h.workspaces.updates[1].patch.modules;
    REQUIRE_FALSE(module_on(sent, ModuleType::Audit));
    REQUIRE(module_on(sent, ModuleType::Journal));

    f.h.workspaces.resolve_update(1);
    auto current = workspaces.workspace("w1");
    REQUIRE_FALSE(is_module_enabled(*current, ModuleType::Audit));
    REQUIRE(is_module_enabled(*current, ModuleType::Journal));
    REQUIRE_FALSE(workspaces.persisting());
}

TEST_CASE("Queued mutations: bot grants rebuild after a rollback", "[queue]") {
    QueueFixture f;
    f.h.bots.resolve_list(f.h.bots.lists.size() - 1, {bot("b1")});
    auto& bots = f.graph->bots();

    REQUIRE(bots.grantWorkspace("b1", "w1").is_ok());
    std::optional<Result<void>> second;
    REQUIRE(bots.grantWorkspace("b1", "w2", [&](Result<void> r) { second = std::move(r); }).is_ok());

    SECTION("first grant fails") {
        f.h.bots.fail_update(0, Error::transport("offline", true));
        REQUIRE(f.h.bots.updates.size() == 2);
        REQUIRE(*f.h.bots.updates[1].patch.workspace_ids == std::vector<EntityId>{"w2"});
        f.h.bots.resolve_update(1);
        REQUIRE(second->is_ok());
        REQUIRE(bots.bot("b1")->workspace_ids == std::vector<EntityId>{"w2"});
    }

    SECTION("first grant succeeds") {
        f.h.bots.resolve_update(0);
        REQUIRE(*f.h.bots.updates[1].patch.workspace_ids == std::vector<EntityId>{"w1", "w2"});
    }
}

TEST_CASE("Queued mutations: a duplicate grant is refused once it runs", "[queue]") {
    QueueFixture f;
    f.h.bots.resolve_list(f.h.bots.lists.size() - 1, {bot("b1")});
    auto& bots = f.graph->bots();

    REQUIRE(bots.grantWorkspace("b1", "w1").is_ok());
    std::optional<Result<void>> again;
    REQUIRE(bots.grantWorkspace("b1", "w1", [&](Result<void> r) { again = std::move(r); }).is_ok());

    f.h.bots.resolve_update(0);
    REQUIRE(again->unwrap_err().kind == ErrorKind::Conflict);
    REQUIRE(f.h.bots.updates.size() == 1);
}

TEST_CASE("Queued mutations: team membership rebuilds after a rollback", "[queue]") {
    QueueFixture f(Scope::organization("o1", "Acme"));
    f.h.teams.resolve_list(0, {team("t1")});
    auto& org = f.graph->organizations();

    REQUIRE(org.addTeamMember("t1", "u2").is_ok());
    REQUIRE(org.addTeamMember("t1", "u3").is_ok());
    REQUIRE(org.team("t1")->member_ids == std::vector<EntityId>{"u2"});

    f.h.teams.fail_update(0, Error::transport("offline", true));
    REQUIRE(f.h.teams.updates.size() == 2);
    REQUIRE(*f.h.teams.updates[1].patch.member_ids == std::vector<EntityId>{"u3"});
    REQUIRE(org.team("t1")->member_ids == std::vector<EntityId>{"u3"});
}
