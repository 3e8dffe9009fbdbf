#include "qdag/dag/node_snapshot.hpp"
#include "qdag/debug.hpp"
#include "qdag/io/codec.hpp"

#include <type_traits>

namespace qdag {
namespace dag {

namespace {

nlohmann::json encode_wires(const WireList &wires) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &wire : wires) {
        out.push_back(io::Codec::encode_wire(*wire));
    }
    return out;
}

WireList decode_wires(const nlohmann::json &j, const WireResolver &resolve) {
    if (!j.is_array()) {
        throw io::SerializationError("wire list must be an array");
    }
    WireList wires;
    wires.reserve(j.size());
    for (const auto &w : j) {
        wires.push_back(resolve(io::Codec::decode_wire(w)));
    }
    return wires;
}

void expect_args(const NodeSnapshot &snap, size_t count) {
    if (!snap.args.is_array() || snap.args.size() != count) {
        throw io::SerializationError(
            node_kind_name(snap.kind) + " node snapshot needs " +
            std::to_string(count) + " constructor arguments");
    }
}

template <typename Boundary>
DAGNode restore_boundary(const NodeSnapshot &snap,
                         const WireResolver &resolve) {
    expect_args(snap, 1);
    Boundary node(resolve(io::Codec::decode_wire(snap.args[0])));
    node.handle().set_raw_index(snap.index);
    return node;
}

} // namespace

WireRef fresh_wire(const Bit &bit) { return std::make_shared<const Bit>(bit); }

NodeSnapshot snapshot(const DAGNode &node) {
    trace::ScopedTrace trace("snapshot", to_string(node),
                             node_handle(node).raw_index());

    NodeSnapshot snap{node_kind(node), nlohmann::json::array(),
                      node_handle(node).raw_index()};
    std::visit(
        [&snap](const auto &n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, OpNode>) {
                snap.args.push_back(io::Codec::encode_operation(*n.op()));
                snap.args.push_back(encode_wires(n.qargs()));
                snap.args.push_back(encode_wires(n.cargs()));
            } else {
                snap.args.push_back(io::Codec::encode_wire(*n.wire()));
            }
        },
        node);
    return snap;
}

DAGNode restore(const NodeSnapshot &snap, const WireResolver &resolve) {
    trace::ScopedTrace trace("restore", node_kind_name(snap.kind), snap.index);

    switch (snap.kind) {
    case NodeKind::Op: {
        expect_args(snap, 3);
        OpNode node(io::Codec::decode_operation(snap.args[0]),
                    decode_wires(snap.args[1], resolve),
                    decode_wires(snap.args[2], resolve));
        node.handle().set_raw_index(snap.index);
        return node;
    }
    case NodeKind::In:
        return restore_boundary<InNode>(snap, resolve);
    case NodeKind::Out:
        return restore_boundary<OutNode>(snap, resolve);
    }
    throw io::SerializationError("unknown node kind");
}

nlohmann::json to_json(const NodeSnapshot &snap) {
    return nlohmann::json::array(
        {node_kind_name(snap.kind), snap.args, snap.index});
}

NodeSnapshot snapshot_from_json(const nlohmann::json &j) {
    if (!j.is_array() || j.size() != 3) {
        throw io::SerializationError(
            "node snapshot must be a [kind, args, index] array");
    }

    NodeSnapshot snap;
    auto kind_name = j[0].is_string() ? j[0].get<std::string>() : "";
    if (kind_name == "op") {
        snap.kind = NodeKind::Op;
    } else if (kind_name == "in") {
        snap.kind = NodeKind::In;
    } else if (kind_name == "out") {
        snap.kind = NodeKind::Out;
    } else {
        throw io::SerializationError("unknown node kind '" + j[0].dump() +
                                     "'");
    }

    if (!j[2].is_number_integer()) {
        throw io::SerializationError("node index must be an integer");
    }
    snap.args = j[1];
    snap.index = j[2].get<int64_t>();
    return snap;
}

std::string dumps(const DAGNode &node) { return to_json(snapshot(node)).dump(); }

DAGNode loads(const std::string &text, const WireResolver &resolve) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        throw io::SerializationError(std::string("invalid JSON: ") + e.what());
    }
    return restore(snapshot_from_json(j), resolve);
}

} // namespace dag
} // namespace qdag
