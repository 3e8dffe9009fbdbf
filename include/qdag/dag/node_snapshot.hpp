#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "qdag/circuit/bit.hpp"
#include "qdag/dag/dag_node.hpp"

namespace qdag {
namespace dag {

// Portable form of a node: its kind, the arguments of its detached
// constructor and its raw index (-1 when detached). The index is plain data;
// restoring never inserts the node into a graph.
struct NodeSnapshot {
    NodeKind kind;
    // [operation, qargs, cargs] for operation nodes, [wire] otherwise
    nlohmann::json args;
    int64_t index = NodeHandle::kDetached;
};

// Maps a decoded bit onto a live wire of an existing wire table
using WireResolver = std::function<WireRef(const Bit &)>;

// Creates a fresh shared bit equal to the decoded one
WireRef fresh_wire(const Bit &bit);

NodeSnapshot snapshot(const DAGNode &node);

// Replays the detached constructor, then sets the raw index directly. The
// index is trusted and not checked against any graph. Throws
// io::SerializationError for malformed arguments.
DAGNode restore(const NodeSnapshot &snap,
                const WireResolver &resolve = fresh_wire);

nlohmann::json to_json(const NodeSnapshot &snap);
NodeSnapshot snapshot_from_json(const nlohmann::json &j);

// JSON text round trip
std::string dumps(const DAGNode &node);
DAGNode loads(const std::string &text,
              const WireResolver &resolve = fresh_wire);

} // namespace dag
} // namespace qdag
