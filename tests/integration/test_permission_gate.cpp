#include <catch2/catch_test_macros.hpp>

#include "store/store_graph.hpp"
#include "support/scripted_repository.hpp"
#include "support/store_harness.hpp"

using namespace tether;
using namespace tether::store;
using Harness = tether::testing::StoreHarness<tether::testing::ScriptedRepository>;

namespace {

Membership membership(EntityId id, EntityId account, Role role,
                      MembershipStatus status = MembershipStatus::Active,
                      std::vector<std::string> custom = {}) {
    auto m = create_invitation("w1", std::move(account), IdentityKind::User, role, "u0");
    m.id = std::move(id);
    m.status = status;
    m.custom_permissions = std::move(custom);
    return m;
}

Document document(EntityId id) {
    auto d = create_document("w1", "doc " + id, DocumentType::File, "u1");
    d.id = std::move(id);
    return d;
}

struct GateFixture {
    Harness h;
    StoreGraph graph{h.app};

    explicit GateFixture(std::vector<Membership> members) {
        REQUIRE(graph.context().signIn("u1").is_ok());
        REQUIRE(graph.context().switchWorkspace("w1").is_ok());
        h.members.resolve_list(0, std::move(members));
        h.documents.resolve_list(0, {document("d1")});
    }
};

} // namespace

TEST_CASE("Permission gate: a guest cannot delete documents", "[permissions]") {
    GateFixture f({membership("m1", "u1", Role::Guest)});

    auto removed = f.graph.documents().remove("d1");
    REQUIRE(removed.unwrap_err().kind == ErrorKind::PermissionDenied);
    REQUIRE(f.h.documents.removes.empty());
    REQUIRE(f.h.documents.mutation_count() == 0);
    REQUIRE(f.graph.documents().document("d1").has_value());
    REQUIRE(f.graph.documents().errorMessage().isEmpty());
}

TEST_CASE("Permission gate: guests may still view", "[permissions]") {
    GateFixture f({membership("m1", "u1", Role::Guest)});
    REQUIRE(f.graph.members().can(Capability::DocumentsView));
    REQUIRE(f.graph.documents().recordAccess("d1").is_ok());
    REQUIRE(f.h.documents.updates.size() == 1);
}

TEST_CASE("Permission gate: custom permissions add to the role", "[permissions]") {
    GateFixture f({membership("m1", "u1", Role::Member, MembershipStatus::Active, {"tasks.delete"})});
    auto& members = f.graph.members();

    REQUIRE(members.check(Capability::TasksDelete, "w1").is_ok());
    REQUIRE(members.check(Capability::DocumentsEdit, "w1").is_ok());
    REQUIRE(members.check(Capability::WorkspaceDelete, "w1").unwrap_err().kind == ErrorKind::PermissionDenied);
}

TEST_CASE("Permission gate: a reloaded grant applies to the next check", "[permissions]") {
    GateFixture f({membership("m1", "u1", Role::Guest)});
    REQUIRE(f.graph.documents().remove("d1").is_err());

    f.graph.members().reload();
    f.h.members.resolve_list(1, {membership("m1", "u1", Role::Guest, MembershipStatus::Active,
                                            {"documents.delete"})});

    REQUIRE(f.graph.documents().remove("d1").is_ok());
    REQUIRE(f.h.documents.removes.size() == 1);
    REQUIRE(f.h.documents.removes[0].id == "d1");
}

TEST_CASE("Permission gate: only active memberships grant", "[permissions]") {
    GateFixture f({membership("m1", "u1", Role::Admin, MembershipStatus::Invited)});
    REQUIRE_FALSE(f.graph.members().currentCapabilities().has_value());
    REQUIRE(f.graph.members().check(Capability::DocumentsView, "w1").is_err());
    REQUIRE(f.graph.documents().create("notes", DocumentType::File).unwrap_err().kind
            == ErrorKind::PermissionDenied);
    REQUIRE(f.h.documents.creates.empty());
}

TEST_CASE("Permission gate: other workspaces are denied", "[permissions]") {
    GateFixture f({membership("m1", "u1", Role::Owner)});
    REQUIRE(f.graph.members().check(Capability::WorkspaceView, "w1").is_ok());
    REQUIRE(f.graph.members().check(Capability::WorkspaceView, "w2").unwrap_err().kind
            == ErrorKind::PermissionDenied);
    REQUIRE(f.graph.workspaces().rename("w2", "Elsewhere").is_err());
    REQUIRE(f.h.workspaces.updates.empty());
}

TEST_CASE("Permission gate: principal and scope grants combine", "[permissions]") {
    Harness h;
    StoreGraph graph(h.app);
    REQUIRE(graph.context().signIn("u1").is_ok());
    REQUIRE(graph.context().switchContext(Scope::organization("o1"), EntityId("w1")).is_ok());
    h.members.resolve_list(0, {membership("m1", "u1", Role::Guest), membership("m2", "o1", Role::Admin)});

    REQUIRE(graph.members().can(Capability::MembersManageRoles));
    REQUIRE_FALSE(graph.members().can(Capability::WorkspaceDelete));

    REQUIRE(graph.members().changeRole("m1", Role::Member).is_ok());
    REQUIRE(h.members.updates.size() == 1);
}

TEST_CASE("Permission gate: membership mutations validate their input", "[permissions]") {
    GateFixture f({membership("m1", "u1", Role::Owner),
                   membership("m2", "u2", Role::Member, MembershipStatus::Archived),
                   membership("m3", "u3", Role::Member)});
    auto& members = f.graph.members();

    REQUIRE(members.invite("u2", IdentityKind::User, Role::Guest).unwrap_err().kind == ErrorKind::Conflict);
    REQUIRE(members.invite("", IdentityKind::User, Role::Guest).unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(members.changeStatus("m2", MembershipStatus::Active).unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(members.changeStatus("m3", MembershipStatus::Suspended).is_ok());
    REQUIRE(members.suspended().size() == 1);

    auto invited = members.invite("u4", IdentityKind::User, Role::Member, "u4@example.com");
    REQUIRE(invited.is_ok());
    REQUIRE(f.h.members.creates.size() == 1);
    REQUIRE(f.h.members.creates[0].draft.invited_by == "u1");
    REQUIRE(f.h.members.creates[0].draft.email == "u4@example.com");
    REQUIRE(members.invited().size() == 1);
}

TEST_CASE("Permission gate: selecting a workspace records access before its grant loads", "[permissions]") {
    Harness h;
    StoreGraph graph(h.app);
    REQUIRE(graph.context().signIn("u1").is_ok());
    auto w1 = create_workspace(WorkspaceOwner{OwnerType::User, "u1"}, "Home", "u1");
    w1.id = "w1";
    h.workspaces.resolve_list(0, {w1});

    REQUIRE(graph.workspaces().select("w1").is_ok());
    REQUIRE(graph.members().loading());
    REQUIRE(graph.members().check(Capability::WorkspaceView, "w1").is_err());

    REQUIRE(h.workspaces.updates.size() == 1);
    REQUIRE(h.workspaces.updates[0].id == "w1");
    REQUIRE(h.workspaces.updates[0].patch.last_accessed_at.has_value());

    // Only workspaces the active scope can see.
    REQUIRE(graph.workspaces().recordAccess("w-elsewhere").unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(h.workspaces.updates.size() == 1);
}
