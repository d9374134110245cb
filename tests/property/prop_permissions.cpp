#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/permissions.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace tether;

namespace rc {

template<>
struct Arbitrary<Role> {
    static Gen<Role> arbitrary() {
        return gen::element(Role::Owner, Role::Admin, Role::Member, Role::Guest);
    }
};

template<>
struct Arbitrary<Capability> {
    static Gen<Capability> arbitrary() {
        return gen::elementOf(all_capabilities());
    }
};

} // namespace rc

namespace {

// Known capability names mixed with arbitrary strings.
rc::Gen<std::vector<std::string>> custom_permissions() {
    return rc::gen::container<std::vector<std::string>>(
        rc::gen::oneOf(
            rc::gen::map(rc::gen::arbitrary<Capability>(),
                         [](Capability c) { return std::string(capability_name(c)); }),
            rc::gen::string<std::string>()));
}

bool contains_all(const CapabilitySet& outer, const CapabilitySet& inner) {
    return std::includes(outer.begin(), outer.end(), inner.begin(), inner.end());
}

} // namespace

TEST_CASE("Property: role defaults nest", "[property][permissions]") {
    REQUIRE(rc::check("a capability of a role is held by every higher role",
        [](Capability capability) {
            const std::vector<Role> ascending{Role::Guest, Role::Member, Role::Admin, Role::Owner};
            for (size_t i = 0; i + 1 < ascending.size(); ++i) {
                if (has_permission(ascending[i], capability)) {
                    RC_ASSERT(has_permission(ascending[i + 1], capability));
                }
                RC_ASSERT(contains_all(role_capabilities(ascending[i + 1]),
                                       role_capabilities(ascending[i])));
            }
        }));
}

TEST_CASE("Property: custom permissions only add", "[property][permissions]") {
    REQUIRE(rc::check("resolve keeps the role defaults and adds only known names",
        [](Role role) {
            const auto custom = *custom_permissions();
            const auto defaults = role_capabilities(role);
            const auto resolved = resolve(role, custom);

            RC_ASSERT(contains_all(resolved, defaults));
            for (auto capability : resolved) {
                if (defaults.count(capability) > 0) continue;
                const auto name = std::string(capability_name(capability));
                RC_ASSERT(std::find(custom.begin(), custom.end(), name) != custom.end());
            }
        }));
}

TEST_CASE("Property: resolve is deterministic", "[property][permissions]") {
    REQUIRE(rc::check("order and repetition of custom permissions do not matter",
        [](Role role) {
            auto custom = *custom_permissions();
            const auto first = resolve(role, custom);

            std::reverse(custom.begin(), custom.end());
            RC_ASSERT(resolve(role, custom) == first);

            custom.insert(custom.end(), custom.begin(), custom.end());
            RC_ASSERT(resolve(role, custom) == first);
        }));
}

TEST_CASE("Property: has_permission agrees with resolve", "[property][permissions]") {
    REQUIRE(rc::check("membership in the resolved set",
        [](Role role, Capability capability) {
            const auto custom = *custom_permissions();
            RC_ASSERT(has_permission(role, capability, custom)
                      == (resolve(role, custom).count(capability) > 0));
        }));
}

TEST_CASE("Property: capability names parse back", "[property][permissions]") {
    REQUIRE(rc::check("parse_capability(capability_name(c)) == c",
        [](Capability capability) {
            RC_ASSERT(parse_capability(capability_name(capability)) == capability);
        }));
}

TEST_CASE("Property: wire timestamps keep every millisecond", "[property][types]") {
    REQUIRE(rc::check("from_timestamp then to_timestamp is the identity",
        [] {
            const auto millis = *rc::gen::inRange<int64_t>(-(int64_t{1} << 50), int64_t{1} << 50);
            const auto wire = WireTimestamp::from_timestamp(Timestamp(millis));
            RC_ASSERT(wire.nanos >= 0);
            RC_ASSERT(wire.nanos < 1'000'000'000);
            RC_ASSERT(wire.to_timestamp() == Timestamp(millis));
        }));
}
