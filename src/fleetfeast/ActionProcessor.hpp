#pragma once

#include "fleetfeast/Action.hpp"
#include "fleetfeast/Fleet.hpp"
#include "fleetfeast/World.hpp"

#include <vector>

namespace fleetfeast {

// Apply one drained batch of actions at the current tick boundary, in FIFO order.
//
// Each action is validated against the truck's state at the start of the batch, so a
// truck makes at most one structural transition per tick: a later accepted action on
// the same truck replaces the effect of an earlier one. Hold never changes a truck.
//
// Rejections never fail the tick. Every outcome is appended to world.recentActions
// and returned.
std::vector<ActionOutcome> ApplyPendingActions(WorldState& world, const std::vector<PendingAction>& actions,
                                               const FleetParams& params);

} // namespace fleetfeast
