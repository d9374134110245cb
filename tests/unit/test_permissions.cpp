#include <catch2/catch_test_macros.hpp>
#include "core/permissions.hpp"

#include <algorithm>

using namespace tether;

namespace {

bool is_subset(const CapabilitySet& a, const CapabilitySet& b) {
    return std::includes(b.begin(), b.end(), a.begin(), a.end());
}

} // namespace

TEST_CASE("Role defaults are nested", "[permissions]") {
    auto guest = role_capabilities(Role::Guest);
    auto member = role_capabilities(Role::Member);
    auto admin = role_capabilities(Role::Admin);
    auto owner = role_capabilities(Role::Owner);

    REQUIRE(is_subset(guest, member));
    REQUIRE(is_subset(member, admin));
    REQUIRE(is_subset(admin, owner));
    REQUIRE(guest.size() < member.size());
    REQUIRE(member.size() < admin.size());
    REQUIRE(admin.size() < owner.size());
    REQUIRE(owner.size() == all_capabilities().size());
}

TEST_CASE("Role tables grant the expected capabilities", "[permissions]") {
    REQUIRE(has_permission(Role::Guest, Capability::DocumentsView));
    REQUIRE_FALSE(has_permission(Role::Guest, Capability::DocumentsDelete));
    REQUIRE(has_permission(Role::Member, Capability::DocumentsEdit));
    REQUIRE_FALSE(has_permission(Role::Member, Capability::TasksDelete));
    REQUIRE(has_permission(Role::Admin, Capability::MembersManageRoles));
    REQUIRE_FALSE(has_permission(Role::Admin, Capability::WorkspaceDelete));
    REQUIRE(has_permission(Role::Owner, Capability::WorkspaceDelete));
}

TEST_CASE("Custom permissions only add capabilities", "[permissions]") {
    REQUIRE_FALSE(has_permission(Role::Member, Capability::TasksDelete));
    REQUIRE(has_permission(Role::Member, Capability::TasksDelete, {"tasks.delete"}));

    // Dropping the custom grant drops the capability again.
    REQUIRE_FALSE(has_permission(Role::Member, Capability::TasksDelete, {}));

    // Role defaults are unaffected either way.
    auto resolved = resolve(Role::Member, {"tasks.delete"});
    REQUIRE(is_subset(role_capabilities(Role::Member), resolved));
    REQUIRE(resolved.size() == role_capabilities(Role::Member).size() + 1);
}

TEST_CASE("Unknown custom permission names are ignored", "[permissions]") {
    auto resolved = resolve(Role::Guest, {"tasks.fly", "", "documents.delete"});
    REQUIRE(resolved.count(Capability::DocumentsDelete) == 1);
    REQUIRE(resolved.size() == role_capabilities(Role::Guest).size() + 1);
}

TEST_CASE("Resolution is deterministic", "[permissions]") {
    std::vector<std::string> custom{"audit.export", "tasks.delete"};
    REQUIRE(resolve(Role::Member, custom) == resolve(Role::Member, custom));
}

TEST_CASE("Capability and role names round-trip", "[permissions]") {
    for (auto capability : all_capabilities()) {
        auto parsed = parse_capability(capability_name(capability));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == capability);
    }
    REQUIRE(capability_name(Capability::MembersManageRoles) == "members.manage_roles");
    REQUIRE_FALSE(parse_capability("documents.burn").has_value());

    for (auto role : {Role::Owner, Role::Admin, Role::Member, Role::Guest}) {
        REQUIRE(parse_role(role_name(role)) == role);
    }
    REQUIRE_FALSE(parse_role("superuser").has_value());
}

TEST_CASE("Grant::allows applies role and custom permissions", "[permissions]") {
    Grant grant{Role::Guest, {"documents.edit"}};
    REQUIRE(grant.allows(Capability::DocumentsView));
    REQUIRE(grant.allows(Capability::DocumentsEdit));
    REQUIRE_FALSE(grant.allows(Capability::DocumentsDelete));
}
