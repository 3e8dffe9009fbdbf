#pragma once

#include <cstdint>
#include <string>

#include "qdag/circuit/bit.hpp"
#include "qdag/dag/node_handle.hpp"
#include "qdag/error.hpp"
#include "qdag/hash.hpp"

namespace qdag {
namespace dag {

// Input nodes start a wire's lifetime in the graph, output nodes end it
enum class WireRole : uint8_t { Input, Output };

template <WireRole Role> class BoundaryNode {
  public:
    static constexpr WireRole role = Role;

    // Detached node; throws ValueError for a null wire
    explicit BoundaryNode(WireRef wire) : wire_(std::move(wire)) {
        if (!wire_) {
            throw ValueError::null_wire(type_name());
        }
    }

    // Attached node. Only the graph engine builds these, while inserting.
    BoundaryNode(size_t index, WireRef wire) : BoundaryNode(std::move(wire)) {
        handle_.attach(index);
    }

    const NodeHandle &handle() const { return handle_; }
    NodeHandle &handle() { return handle_; }

    const WireRef &wire() const { return wire_; }

    // Index and wire only. The role does not take part, so an input and an
    // output node with the same index and wire compare equal.
    template <WireRole OtherRole>
    bool operator==(const BoundaryNode<OtherRole> &other) const {
        return handle_ == other.handle() && wire_eq(wire_, other.wire());
    }

    template <WireRole OtherRole>
    bool operator!=(const BoundaryNode<OtherRole> &other) const {
        return !(*this == other);
    }

    uint64_t hash() const {
        uint64_t h = fnv_hash_i64(FNV_OFFSET, handle_.raw_index());
        return fnv_hash_u64(h, wire_hash(wire_));
    }

    static const char *type_name() {
        return Role == WireRole::Input ? "DAGInNode" : "DAGOutNode";
    }

    std::string repr() const {
        return std::string(type_name()) + "(wire=" + wire_repr(wire_) + ")";
    }

  private:
    NodeHandle handle_;
    WireRef wire_;
};

using InNode = BoundaryNode<WireRole::Input>;
using OutNode = BoundaryNode<WireRole::Output>;

} // namespace dag
} // namespace qdag
