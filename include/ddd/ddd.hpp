#pragma once

/**
 * DDD building blocks.
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Logging and configuration
#include "logging.hpp"
#include "config.hpp"

// Helper utilities
#include "helpers.hpp"

// Validation helpers
#include "validation.hpp"

// Registration macros
#include "macros.hpp"

// Model building blocks
#include "entity.hpp"
#include "value_object.hpp"
#include "state_router.hpp"
#include "aggregate.hpp"

// Persistence and delivery
#include "repository.hpp"
#include "in_memory_repository.hpp"
#include "event_dispatcher.hpp"
#include "dispatching_repository.hpp"

// Transactions
#include "cancellation.hpp"
#include "unit_of_work.hpp"
#include "transaction_runner.hpp"

// Application services
#include "request_handler.hpp"
