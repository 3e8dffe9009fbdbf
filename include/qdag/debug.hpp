#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace qdag {
namespace trace {

struct TraceEvent {
    std::string op_name;
    std::string description;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::nanoseconds duration;
    int64_t node_index; // -1 for detached nodes
};

// Records node-level events (snapshot, restore, duplication, operation
// replacement). Starts enabled when QDAG_TRACE=1.
class Tracer {
  public:
    static Tracer &instance();

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }
    bool is_enabled() const { return enabled_; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

    void record(const std::string &op_name, const std::string &desc,
                std::chrono::nanoseconds duration, int64_t node_index);

    std::string dump() const;

    std::vector<TraceEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

  private:
    Tracer();
    std::atomic<bool> enabled_{false};
    mutable std::mutex mutex_;
    std::vector<TraceEvent> events_;
};

inline void enable() { Tracer::instance().enable(); }
inline void disable() { Tracer::instance().disable(); }
inline void clear() { Tracer::instance().clear(); }
inline std::string dump() { return Tracer::instance().dump(); }
inline bool is_enabled() { return Tracer::instance().is_enabled(); }

class ScopedTrace {
  public:
    ScopedTrace(const std::string &op_name, const std::string &desc = "",
                int64_t node_index = -1);
    ~ScopedTrace();

    ScopedTrace(const ScopedTrace &) = delete;
    ScopedTrace &operator=(const ScopedTrace &) = delete;

    // The index is often only known once the traced step has finished
    void set_node_index(int64_t node_index) { node_index_ = node_index; }

  private:
    std::string op_name_;
    std::string desc_;
    std::chrono::steady_clock::time_point start_;
    int64_t node_index_;
};

} // namespace trace
} // namespace qdag
