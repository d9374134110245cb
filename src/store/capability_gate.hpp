#pragma once

#include "core/permissions.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

namespace tether::store {

/**
 * CapabilityGate - Answers whether the active principal may exercise a
 * capability in a workspace. Stores consult it before dispatching a
 * workspace-scoped mutation; a denial never reaches the port.
 */
class CapabilityGate {
public:
    virtual ~CapabilityGate() = default;

    [[nodiscard]] virtual Result<void> check(Capability capability,
                                             const EntityId& workspace_id) const = 0;
};

} // namespace tether::store
