#include <benchmark/benchmark.h>

#include <qdag/qdag.hpp>
#include <unordered_set>
#include <vector>

using namespace qdag;
using namespace qdag::dag;

// ============================================================================
// Node population
// ============================================================================

static std::vector<DAGNode> make_nodes(int64_t count) {
    auto qubits = make_register(BitKind::Qubit, "q", 16);
    std::vector<DAGNode> nodes;
    nodes.reserve(static_cast<size_t>(count));

    for (int64_t i = 0; i < count; ++i) {
        const auto &wire = qubits[static_cast<size_t>(i) % qubits.size()];
        switch (i % 4) {
        case 0:
            nodes.push_back(InNode(static_cast<size_t>(i), wire));
            break;
        case 1:
            nodes.push_back(OutNode(static_cast<size_t>(i), wire));
            break;
        case 2: {
            OpNode node(std::make_shared<StandardGateObject>(
                            StandardGate::RZ, ParamList{0.001 * i}),
                        {wire});
            node.handle().attach(static_cast<size_t>(i));
            nodes.push_back(std::move(node));
            break;
        }
        default: {
            OpNode node(std::make_shared<StandardGateObject>(StandardGate::CX),
                        {wire, qubits[(static_cast<size_t>(i) + 1) %
                                      qubits.size()]});
            node.handle().attach(static_cast<size_t>(i));
            nodes.push_back(std::move(node));
            break;
        }
        }
    }
    return nodes;
}

// ============================================================================
// Hash container benchmarks
// ============================================================================

static void BM_NodeSet_Insert(benchmark::State &state) {
    auto nodes = make_nodes(state.range(0));

    for (auto _ : state) {
        std::unordered_set<DAGNode, NodeHash, NodeEqual> set;
        set.reserve(nodes.size());
        for (const auto &node : nodes) {
            set.insert(node);
        }
        benchmark::DoNotOptimize(set.size());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_NodeSet_Lookup(benchmark::State &state) {
    auto nodes = make_nodes(state.range(0));
    std::unordered_set<DAGNode, NodeHash, NodeEqual> set(nodes.begin(),
                                                         nodes.end());

    for (auto _ : state) {
        size_t hits = 0;
        for (const auto &node : nodes) {
            hits += set.count(node);
        }
        benchmark::DoNotOptimize(hits);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

// ============================================================================
// Snapshot benchmarks
// ============================================================================

static void BM_Node_SnapshotRestore(benchmark::State &state) {
    io::Codec::initialize_builtin_types();
    auto nodes = make_nodes(state.range(0));

    for (auto _ : state) {
        for (const auto &node : nodes) {
            auto restored = restore(snapshot(node));
            benchmark::DoNotOptimize(node_handle(restored).raw_index());
        }
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_OpNode_DeepCopy(benchmark::State &state) {
    auto nodes = make_nodes(state.range(0));

    for (auto _ : state) {
        for (const auto &node : nodes) {
            if (auto *op = std::get_if<OpNode>(&node)) {
                auto copy = op->duplicate(true);
                benchmark::DoNotOptimize(copy.handle().raw_index());
            }
        }
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_NodeSet_Insert)->RangeMultiplier(8)->Range(64, 32768);
BENCHMARK(BM_NodeSet_Lookup)->RangeMultiplier(8)->Range(64, 32768);
BENCHMARK(BM_Node_SnapshotRestore)->Arg(256)->Arg(4096);
BENCHMARK(BM_OpNode_DeepCopy)->Arg(256)->Arg(4096);

BENCHMARK_MAIN();
