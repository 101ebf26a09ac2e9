#pragma once

// AgentTreasury: Budget Enforcement Engine for Autonomous Agents
//
// Lets independent agents spend bounded budgets with no double-spend,
// records every spend attempt, rescales limits from realized ROI, and
// can halt all spending through an emergency circuit breaker.

// Core
#include "agenttreasury/types.hpp"
#include "agenttreasury/exceptions.hpp"
#include "agenttreasury/config.hpp"
#include "agenttreasury/config_loader.hpp"
#include "agenttreasury/time_util.hpp"
#include "agenttreasury/monitor.hpp"
#include "agenttreasury/treasury.hpp"

// Store adapters
#include "agenttreasury/cache_store.hpp"
#include "agenttreasury/ledger_store.hpp"
#include "agenttreasury/sqlite_ledger_store.hpp"
#include "agenttreasury/codec.hpp"

// Components
#include "agenttreasury/retry.hpp"
#include "agenttreasury/write_behind_queue.hpp"
#include "agenttreasury/budget_cache.hpp"
#include "agenttreasury/transaction_ledger.hpp"
#include "agenttreasury/circuit_breaker.hpp"
#include "agenttreasury/budget_registry.hpp"
#include "agenttreasury/performance_scaler.hpp"
#include "agenttreasury/daily_reset_scheduler.hpp"
