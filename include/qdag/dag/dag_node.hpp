#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

#include "qdag/dag/boundary_node.hpp"
#include "qdag/dag/node_handle.hpp"
#include "qdag/dag/op_node.hpp"

namespace qdag {
namespace dag {

using DAGNode = std::variant<OpNode, InNode, OutNode>;

// Stable tags; they are part of the snapshot format
enum class NodeKind : uint8_t { Op = 0, In = 1, Out = 2 };

NodeKind node_kind(const DAGNode &node);
std::string node_kind_name(NodeKind kind);

const NodeHandle &node_handle(const DAGNode &node);
NodeHandle &node_handle(DAGNode &node);

// Operation nodes only equal operation nodes; boundary nodes compare across
// roles
bool node_eq(const DAGNode &a, const DAGNode &b);

uint64_t node_hash(const DAGNode &node);

std::string to_string(const DAGNode &node);
std::ostream &operator<<(std::ostream &os, const DAGNode &node);

// Container adaptors: std::unordered_set<DAGNode, NodeHash, NodeEqual>,
// std::set<DAGNode, NodeLess>
struct NodeHash {
    size_t operator()(const DAGNode &node) const {
        return static_cast<size_t>(node_hash(node));
    }
};

struct NodeEqual {
    bool operator()(const DAGNode &a, const DAGNode &b) const {
        return node_eq(a, b);
    }
};

// Deterministic order by raw index; carries no semantic meaning
struct NodeLess {
    bool operator()(const DAGNode &a, const DAGNode &b) const {
        return node_handle(a) < node_handle(b);
    }
};

} // namespace dag
} // namespace qdag
