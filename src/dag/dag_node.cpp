#include "qdag/dag/dag_node.hpp"

#include <type_traits>

namespace qdag {
namespace dag {

NodeKind node_kind(const DAGNode &node) {
    return static_cast<NodeKind>(node.index());
}

std::string node_kind_name(NodeKind kind) {
    switch (kind) {
    case NodeKind::Op:
        return "op";
    case NodeKind::In:
        return "in";
    case NodeKind::Out:
        return "out";
    }
    return "unknown";
}

const NodeHandle &node_handle(const DAGNode &node) {
    return std::visit(
        [](const auto &n) -> const NodeHandle & { return n.handle(); }, node);
}

NodeHandle &node_handle(DAGNode &node) {
    return std::visit([](auto &n) -> NodeHandle & { return n.handle(); },
                      node);
}

bool node_eq(const DAGNode &a, const DAGNode &b) {
    return std::visit(
        [](const auto &x, const auto &y) -> bool {
            using X = std::decay_t<decltype(x)>;
            using Y = std::decay_t<decltype(y)>;
            constexpr bool x_op = std::is_same_v<X, OpNode>;
            constexpr bool y_op = std::is_same_v<Y, OpNode>;
            if constexpr (x_op && y_op) {
                return x == y;
            } else if constexpr (!x_op && !y_op) {
                return x == y;
            } else {
                return false;
            }
        },
        a, b);
}

uint64_t node_hash(const DAGNode &node) {
    return std::visit([](const auto &n) { return n.hash(); }, node);
}

std::string to_string(const DAGNode &node) {
    return std::visit([](const auto &n) { return n.repr(); }, node);
}

std::ostream &operator<<(std::ostream &os, const DAGNode &node) {
    return os << to_string(node);
}

} // namespace dag
} // namespace qdag
