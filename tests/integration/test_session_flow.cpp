#include <catch2/catch_test_macros.hpp>

#include <QSignalSpy>
#include <QTest>

#include "storage/memory_repository.hpp"
#include "store/store_graph.hpp"
#include "support/store_harness.hpp"

using namespace tether;
using namespace tether::store;
using tether::storage::MemoryRepository;
using tether::storage::RepositoryOp;
using Harness = tether::testing::StoreHarness<MemoryRepository>;

namespace {

Workspace workspace(EntityId id, EntityId owner, OwnerType type = OwnerType::User) {
    auto ws = create_workspace(WorkspaceOwner{type, owner}, "ws " + id, owner);
    ws.id = std::move(id);
    return ws;
}

Membership active_member(EntityId id, EntityId workspace_id, EntityId account, Role role) {
    auto m = create_invitation(std::move(workspace_id), std::move(account), IdentityKind::User, role, "u1");
    m.id = std::move(id);
    m.status = MembershipStatus::Active;
    return m;
}

bool settle(ScopeStoreBase& store) {
    return QTest::qWaitFor([&] { return !store.loading() && !store.persisting(); }, 2000);
}

} // namespace

TEST_CASE("Session flow: sign-in surfaces the user's workspace", "[flow]") {
    Harness h;
    auto w1 = workspace("w1", "u1");
    w1.last_accessed_at = Timestamp::now();
    h.workspaces.seed(w1);
    h.workspaces.seed(workspace("w-other", "u2"));

    StoreGraph graph(h.app);
    REQUIRE(graph.context().signIn("u1", "Ada").is_ok());

    // Port completions arrive on a later turn of the event loop.
    REQUIRE(graph.workspaces().loading());
    REQUIRE(graph.workspaces().workspaces().empty());

    REQUIRE(settle(graph.workspaces()));
    REQUIRE(graph.workspaces().workspaces().size() == 1);
    REQUIRE(graph.workspaces().currentWorkspace()->id == "w1");
    REQUIRE(graph.workspaces().recent().size() == 1);
}

TEST_CASE("Session flow: no workspaces means no current workspace", "[flow]") {
    Harness h;
    StoreGraph graph(h.app);
    REQUIRE(graph.context().signIn("u1").is_ok());
    REQUIRE(settle(graph.workspaces()));
    REQUIRE_FALSE(graph.workspaces().currentWorkspace().has_value());
    REQUIRE(graph.workspaces().errorMessage().isEmpty());
}

TEST_CASE("Session flow: selecting a workspace loads its members and documents", "[flow]") {
    Harness h;
    h.workspaces.seed(workspace("w1", "u1"));
    h.members.seed(active_member("m1", "w1", "u1", Role::Owner));
    auto readme = create_document("w1", "README", DocumentType::File, "u1");
    readme.id = "d1";
    h.documents.seed(readme);

    StoreGraph graph(h.app);
    REQUIRE(graph.context().signIn("u1").is_ok());
    REQUIRE(settle(graph.workspaces()));

    REQUIRE(graph.workspaces().select("w1").unwrap() == SwitchOutcome::Switched);
    REQUIRE(graph.context().state() == ContextState::WorkspaceActive);
    REQUIRE(settle(graph.members()));
    REQUIRE(settle(graph.documents()));
    REQUIRE(settle(graph.workspaces()));

    REQUIRE(graph.members().active().size() == 1);
    REQUIRE(graph.documents().documents().size() == 1);
    REQUIRE(h.workspaces.find("w1")->last_accessed_at.has_value());

    SECTION("created documents reach the backend") {
        auto pending = graph.documents().create("Plan", DocumentType::File);
        REQUIRE(pending.is_ok());
        REQUIRE(graph.documents().document(pending.unwrap()).has_value());
        REQUIRE(settle(graph.documents()));

        REQUIRE(h.documents.size() == 2);
        REQUIRE_FALSE(graph.documents().document(pending.unwrap()).has_value());
        REQUIRE(graph.documents().search("plan").size() == 1);
    }

    SECTION("a failed rename rolls back") {
        h.documents.fail_next(RepositoryOp::Update, Error::transport("offline", true));
        QSignalSpy errors(&graph.documents(), &ScopeStoreBase::errorChanged);

        REQUIRE(graph.documents().rename("d1", "Renamed").is_ok());
        REQUIRE(graph.documents().document("d1")->name == "Renamed");
        REQUIRE(settle(graph.documents()));

        REQUIRE(graph.documents().document("d1")->name == "README");
        REQUIRE(h.documents.find("d1")->name == "README");
        REQUIRE(errors.count() == 1);
        REQUIRE_FALSE(graph.documents().errorMessage().isEmpty());

        graph.documents().clearError();
        REQUIRE(graph.documents().errorMessage().isEmpty());
    }

    SECTION("starred documents follow removal") {
        REQUIRE(graph.documents().star("d1"));
        REQUIRE(graph.documents().starred().size() == 1);
        REQUIRE(graph.documents().remove("d1").is_ok());
        REQUIRE(graph.documents().starred().empty());
        REQUIRE(settle(graph.documents()));
        REQUIRE(h.documents.size() == 0);
        REQUIRE_FALSE(graph.documents().isStarred("d1"));
    }

    SECTION("deleting the selected workspace clears the selection") {
        REQUIRE(graph.workspaces().remove("w1").is_ok());
        REQUIRE(settle(graph.workspaces()));
        REQUIRE_FALSE(graph.context().hasWorkspace());
        REQUIRE(graph.documents().documents().empty());
    }
}

TEST_CASE("Session flow: account selection switches the scope", "[flow]") {
    Harness h;
    h.accounts.seed(create_user_account("u1", "Ada", "ada@example.com"));
    h.accounts.seed(create_account("o1", "Acme", OrganizationIdentity{"acme"}, {"u1"}));
    h.accounts.seed(create_account("t1", "Core", TeamIdentity{"o1"}, {"u1"}));
    h.accounts.seed(create_account("b1", "Helper", BotIdentity{"u1"}, {"u1"}));
    h.workspaces.seed(workspace("w1", "u1"));
    h.workspaces.seed(workspace("w9", "o1", OwnerType::Organization));

    StoreGraph graph(h.app);
    QSignalSpy available(&graph.context(), &ContextStore::availableContextsChanged);
    REQUIRE(graph.context().signIn("u1").is_ok());
    REQUIRE(settle(graph.accounts()));

    REQUIRE(available.count() >= 1);
    REQUIRE(graph.context().availableOrganizations().size() == 1);
    REQUIRE(graph.context().availableTeams().size() == 1);
    REQUIRE(graph.context().canSwitchContext());
    REQUIRE(graph.accounts().personal()->display_name == "Ada");

    REQUIRE(graph.accounts().selectAccount("b1").unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(graph.accounts().selectAccount("nope").unwrap_err().kind == ErrorKind::NotFound);

    REQUIRE(graph.accounts().selectAccount("t1").is_ok());
    REQUIRE(graph.context().scopeKind() == ScopeKind::Team);
    REQUIRE(settle(graph.workspaces()));

    // Teams see their organization's workspaces.
    auto visible = graph.workspaces().workspaces();
    REQUIRE(visible.size() == 1);
    REQUIRE(visible[0].id == "w9");
    REQUIRE(graph.workspaces().create("Team space").unwrap_err().kind == ErrorKind::Validation);
}

TEST_CASE("Session flow: notifications for the principal", "[flow]") {
    Harness h;
    for (int i = 0; i < 3; ++i) {
        Notification n;
        n.id = "n" + std::to_string(i);
        n.recipient_id = "u1";
        n.title = "hello";
        n.created_at = Timestamp(1000 + i);
        h.notifications.seed(n);
    }

    StoreGraph graph(h.app);
    REQUIRE(graph.context().signIn("u1").is_ok());
    REQUIRE(settle(graph.notifications()));
    REQUIRE(graph.notifications().unreadCount() == 3);
    REQUIRE(graph.notifications().notifications().front().id == "n2");

    REQUIRE(graph.notifications().markRead("n0").is_ok());
    REQUIRE(graph.notifications().unreadCount() == 2);
    REQUIRE(settle(graph.notifications()));

    REQUIRE(graph.notifications().markAllRead() == 2);
    REQUIRE(graph.notifications().unreadCount() == 0);
    REQUIRE(settle(graph.notifications()));
    REQUIRE(h.notifications.find("n2")->read);
}
