#include <catch2/catch_test_macros.hpp>
#include "core/entity.hpp"
#include "core/types.hpp"

#include <set>

using namespace tether;

TEST_CASE("Uuid::generate produces distinct v4 ids", "[types]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto text = Uuid::generate().to_string();
        REQUIRE(text.size() == 36);
        REQUIRE(text[14] == '4');
        seen.insert(text);
    }
    REQUIRE(seen.size() == 100);
    REQUIRE(Uuid{}.is_nil());
}

TEST_CASE("Timestamp formats as ISO-8601 UTC", "[types]") {
    Timestamp ts(1700000000123);
    REQUIRE(ts.to_iso_string() == "2023-11-14T22:13:20.123Z");
    REQUIRE(ts + std::chrono::milliseconds(877) == Timestamp(1700000001000));
    REQUIRE(Timestamp(1) < Timestamp(2));
}

TEST_CASE("WireTimestamp converts to and from milliseconds", "[types]") {
    SECTION("positive values split into seconds and nanos") {
        auto wire = WireTimestamp::from_timestamp(Timestamp(1700000000123));
        REQUIRE(wire.seconds == 1700000000);
        REQUIRE(wire.nanos == 123'000'000);
        REQUIRE(wire.to_timestamp() == Timestamp(1700000000123));
    }

    SECTION("pre-epoch values keep nanos non-negative") {
        auto wire = WireTimestamp::from_timestamp(Timestamp(-1));
        REQUIRE(wire.seconds == -1);
        REQUIRE(wire.nanos == 999'000'000);
        REQUIRE(wire.to_timestamp() == Timestamp(-1));
    }

    SECTION("sub-millisecond nanos are truncated") {
        WireTimestamp wire{10, 1'999'999};
        REQUIRE(wire.to_timestamp() == Timestamp(10'001));
    }
}

TEST_CASE("ScopeKey renders field and value", "[types]") {
    ScopeKey key{ScopeField::Workspace, "w1"};
    REQUIRE(key.to_string() == "workspace:w1");
    REQUIRE(key == ScopeKey{ScopeField::Workspace, "w1"});
    REQUIRE_FALSE(key == ScopeKey{ScopeField::Owner, "w1"});
}
