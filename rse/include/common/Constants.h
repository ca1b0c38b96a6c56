#pragma once

#include <cstddef>

/**
 * @file Constants.h
 * @brief Shared limits and wire-level names of the rule step engine
 */

namespace RSE::Constants {

// ============================================================================
// Execution guards
// ============================================================================

constexpr size_t DEFAULT_MAX_STEPS = 10000;
constexpr size_t DEFAULT_MAX_LOOP_ITERATIONS = 100000;

/**
 * @brief Upper bound for collections built by range(), repetition and similar
 */
constexpr size_t MAX_COLLECTION_SIZE = 1000000;

// ============================================================================
// Parser guards
// ============================================================================

/**
 * @brief Deepest bracket, unary operator or block nesting a rule may use
 */
constexpr size_t MAX_NESTING_DEPTH = 200;

/**
 * @brief Deepest expression tree the parser builds, operator chains included
 */
constexpr size_t MAX_EXPRESSION_DEPTH = 1000;

// ============================================================================
// Message sink
// ============================================================================

constexpr size_t DEFAULT_MESSAGE_CAPACITY = 1000;
constexpr const char *LOG_MESSAGE_PREFIX = "LOG: ";

// ============================================================================
// Instrumentation
// ============================================================================

/**
 * @brief Name of the step-marker built-in called by instrumented source
 *
 * Marker shape: __rule_step__("S<n>", instrumentedLine, originalLine, "text")
 */
constexpr const char *STEP_MARKER_NAME = "__rule_step__";
constexpr const char *STEP_ID_PREFIX = "S";
constexpr const char *COMPLETION_DESCRIPTION = "Execution completed";
constexpr const char *COMPLETION_STEP_ID = "END";

// ============================================================================
// Error reporting
// ============================================================================

constexpr const char *TRACEBACK_HEADER = "Traceback (most recent statement last):";

/**
 * @brief Line printed by the CLI before the JSON error object on fatal failure
 */
constexpr const char *ERROR_SENTINEL = "__RULE_DEBUG_ERROR__";

}  // namespace RSE::Constants
