#pragma once

// CoordGuard: Safety-checked coordination for multi-agent scope work
//
// Tracks agent lifecycles, hands out per-scope exclusive locks, orders
// cross-scope syncs by their dependencies, and continuously checks the
// coordination state against a fixed set of safety invariants.

// Core
#include "coordguard/types.hpp"
#include "coordguard/exceptions.hpp"
#include "coordguard/config.hpp"
#include "coordguard/history.hpp"
#include "coordguard/safety_violation.hpp"
#include "coordguard/agent.hpp"

// Components
#include "coordguard/lock_manager.hpp"
#include "coordguard/sync_coordinator.hpp"
#include "coordguard/safety_validator.hpp"
#include "coordguard/agent_manager.hpp"
#include "coordguard/monitor.hpp"

// Request surface
#include "coordguard/request.hpp"
#include "coordguard/coordination_service.hpp"
