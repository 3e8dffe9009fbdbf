#include "qdag/system.hpp"

#include <cstdlib>

namespace qdag {
namespace system {

bool env_flag(const char *name) {
    const char *env = std::getenv(name);
    return env != nullptr && std::string(env) == "1";
}

bool trace_enabled_from_env() {
    // Thread-safe static init per C++11
    static const bool enabled = env_flag("QDAG_TRACE");
    return enabled;
}

bool should_run_slow_tests() { return !env_flag("QDAG_SKIP_SLOW_TESTS"); }

std::string version() { return "0.3.0"; }

} // namespace system
} // namespace qdag
