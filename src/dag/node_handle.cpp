#include "qdag/dag/node_handle.hpp"
#include "qdag/error.hpp"
#include "qdag/hash.hpp"

#include <limits>

namespace qdag {
namespace dag {

NodeHandle::NodeHandle(size_t index) { attach(index); }

NodeHandle NodeHandle::from_raw(int64_t raw) {
    NodeHandle handle;
    handle.set_raw_index(raw);
    return handle;
}

void NodeHandle::set_raw_index(int64_t raw) {
    if (raw == kDetached) {
        index_.reset();
        return;
    }
    if (raw < 0) {
        throw ValueError::invalid_node_index(raw);
    }
    index_ = static_cast<size_t>(raw);
}

void NodeHandle::attach(size_t index) {
    if (index > static_cast<size_t>(std::numeric_limits<int64_t>::max())) {
        throw ValueError::out_of_range(
            "node index", 0,
            static_cast<double>(std::numeric_limits<int64_t>::max()),
            static_cast<double>(index));
    }
    index_ = index;
}

uint64_t NodeHandle::hash() const { return fnv_hash_i64(FNV_OFFSET, raw_index()); }

} // namespace dag
} // namespace qdag
