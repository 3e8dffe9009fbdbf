#pragma once

#include <string>

namespace qdag {
namespace system {

/**
 * @brief Reads a boolean flag from the environment.
 *
 * A flag is set when the variable exists and equals "1".
 */
bool env_flag(const char *name);

/**
 * @brief Whether the tracer should start enabled.
 *
 * Controlled by the QDAG_TRACE environment variable, read once.
 */
bool trace_enabled_from_env();

/**
 * @brief Checks if randomized property tests should be run.
 *
 * Returns false if the QDAG_SKIP_SLOW_TESTS environment variable is set to
 * "1".
 */
bool should_run_slow_tests();

std::string version();

} // namespace system
} // namespace qdag
