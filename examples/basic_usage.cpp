#include <iostream>
#include <qdag/qdag.hpp>
#include <unordered_set>

using namespace qdag;
using namespace qdag::dag;

int main() {
    io::Codec::initialize_builtin_types();
    std::cout << "qdag " << system::version() << std::endl;

    auto q = make_register(BitKind::Qubit, "q", 2);
    auto c = make_register(BitKind::Clbit, "c", 1);

    // Boundary nodes for the first qubit and an entangling gate
    InNode in(0, q[0]);
    OutNode out(1, q[0]);
    OpNode cx(std::make_shared<StandardGateObject>(StandardGate::CX),
              {q[0], q[1]});
    cx.handle().attach(2);

    OpNode rz(std::make_shared<StandardGateObject>(StandardGate::RZ,
                                                   ParamList{0.25}),
              {q[1]});
    rz.handle().attach(3);

    OpNode meas(std::make_shared<StandardInstructionObject>(
                    StandardInstruction::measure()),
                {q[1]}, {c[0]});
    meas.handle().attach(4);

    std::unordered_set<DAGNode, NodeHash, NodeEqual> nodes = {in, out, cx, rz,
                                                              meas};
    for (const auto &node : nodes) {
        std::cout << node << std::endl;
    }

    // Parameters within a relative 1e-10 still compare equal
    OpNode nudged = rz.duplicate();
    nudged.handle().attach(3);
    nudged.set_params({0.25 * (1.0 + 1e-12)});
    std::cout << "nudged rz equal: " << std::boolalpha << (nudged == rz)
              << std::endl;

    // Portable round trip through JSON
    auto text = dumps(DAGNode(meas));
    std::cout << text << std::endl;
    auto restored = loads(text);
    std::cout << to_string(restored) << " equal: " << node_eq(restored, meas)
              << std::endl;

    return 0;
}
