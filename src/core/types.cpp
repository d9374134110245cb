#include "core/types.hpp"

#include <type_traits>

// The types module is header-only; these assertions pin its layout.

namespace tether {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(std::is_trivially_copyable_v<WireTimestamp>, "WireTimestamp should be trivially copyable");

} // namespace tether
