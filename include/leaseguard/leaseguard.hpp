#pragma once

// LeaseGuard: Resource Pool with a Guarded Health State Machine
//
// Leases bounded capacity to concurrent callers, expires abandoned leases,
// and classifies system health through hysteretic, evidence-gated transitions.

// Core
#include "leaseguard/types.hpp"
#include "leaseguard/exceptions.hpp"
#include "leaseguard/error_envelope.hpp"
#include "leaseguard/config.hpp"
#include "leaseguard/monitor.hpp"
#include "leaseguard/scheduler.hpp"

// Health state machine
#include "leaseguard/metric_evaluator.hpp"
#include "leaseguard/state_history.hpp"
#include "leaseguard/recovery_validator.hpp"
#include "leaseguard/health_state_manager.hpp"

// Pool
#include "leaseguard/resource_detector.hpp"
#include "leaseguard/lease_cache.hpp"
#include "leaseguard/circuit_breaker.hpp"
#include "leaseguard/resource_pool_manager.hpp"
