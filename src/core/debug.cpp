#include "qdag/debug.hpp"
#include "qdag/system.hpp"

#include <iomanip>
#include <sstream>

namespace qdag {
namespace trace {

Tracer::Tracer() : enabled_(system::trace_enabled_from_env()) {}

Tracer &Tracer::instance() {
    static Tracer tracer;
    return tracer;
}

void Tracer::record(const std::string &op_name, const std::string &desc,
                    std::chrono::nanoseconds duration, int64_t node_index) {
    if (!enabled_)
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back({op_name, desc, std::chrono::steady_clock::now(),
                       duration, node_index});
}

std::string Tracer::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    oss << "=== qdag Trace (" << events_.size() << " events) ===\n";
    oss << std::left << std::setw(20) << "Operation" << std::setw(15)
        << "Duration(us)" << std::setw(10) << "Node"
        << "Description\n";
    oss << std::string(80, '-') << "\n";

    std::chrono::nanoseconds total_time{0};
    size_t detached_count = 0;

    for (const auto &event : events_) {
        double duration_us = event.duration.count() / 1000.0;

        oss << std::left << std::setw(20) << event.op_name << std::setw(15)
            << std::fixed << std::setprecision(2) << duration_us
            << std::setw(10)
            << (event.node_index < 0 ? std::string("-")
                                     : std::to_string(event.node_index))
            << event.description << "\n";

        total_time += event.duration;
        if (event.node_index < 0)
            detached_count++;
    }

    oss << std::string(80, '-') << "\n";
    oss << "Total time: " << (total_time.count() / 1000.0) << " us\n";
    oss << "Detached nodes: " << detached_count << " / " << events_.size()
        << "\n";

    return oss.str();
}

ScopedTrace::ScopedTrace(const std::string &op_name, const std::string &desc,
                         int64_t node_index)
    : op_name_(op_name), desc_(desc),
      start_(std::chrono::steady_clock::now()), node_index_(node_index) {}

ScopedTrace::~ScopedTrace() {
    if (Tracer::instance().is_enabled()) {
        auto end = std::chrono::steady_clock::now();
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
        Tracer::instance().record(op_name_, desc_, duration, node_index_);
    }
}

} // namespace trace
} // namespace qdag
