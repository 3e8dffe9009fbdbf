#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <Eigen/Dense>

#include "qdag/circuit/bit.hpp"
#include "qdag/circuit/circuit_instruction.hpp"
#include "qdag/circuit/operation.hpp"
#include "qdag/dag/node_handle.hpp"

namespace qdag {
namespace dag {

// A graph node that applies an operation to a set of wires.
//
// Equality is positional first: two nodes are equal only if their indices
// match and their descriptors compare equal. Parameters of native gates and
// instructions must agree within a relative 1e-10, and both wire lists must
// match element-wise. It is meant for container membership, not for
// semantic equivalence.
//
// The hash covers the index and the operation name only. Equal nodes always
// share both, so the hash contract holds.
class OpNode {
  public:
    // Detached node. Throws TypeError if `op` is not a valid operation and
    // ValueError for null wires.
    explicit OpNode(const OperationRef &op, WireList qargs = {},
                    WireList cargs = {});

    // Detached node around an existing instruction; with `deepcopy` the
    // descriptor is rebuilt and the cached host object dropped
    static OpNode from_instruction(CircuitInstruction instruction,
                                   bool deepcopy = false);

    CircuitInstruction to_circuit_instruction(bool deepcopy = false) const;

    // Detached copy of the payload
    OpNode duplicate(bool deep = false) const;

    const NodeHandle &handle() const { return handle_; }
    NodeHandle &handle() { return handle_; }

    const CircuitInstruction &instruction() const { return instruction_; }

    // Materialized operation object
    OperationRef op() const { return instruction_.get_operation(); }

    // Replaces the operation; parameters and label are re-derived from it
    void set_op(const OperationRef &op);

    std::string name() const { return instruction_.operation.name(); }

    // Renames the live operation object and re-derives the descriptor
    void set_name(const std::string &name);

    const WireList &qargs() const { return instruction_.qubits; }
    void set_qargs(WireList qargs);

    const WireList &cargs() const { return instruction_.clbits; }
    void set_cargs(WireList cargs);

    const ParamList &params() const { return instruction_.params; }
    void set_params(ParamList params);

    const std::optional<std::string> &label() const {
        return instruction_.label;
    }
    void set_label(std::optional<std::string> label);

    OperationKind kind() const { return instruction_.operation.kind(); }
    uint32_t num_qubits() const { return instruction_.operation.num_qubits(); }
    uint32_t num_clbits() const { return instruction_.operation.num_clbits(); }

    std::optional<Eigen::MatrixXcd> matrix() const {
        return instruction_.operation.matrix(instruction_.params);
    }

    bool is_standard_gate() const { return instruction_.is_standard_gate(); }
    bool is_parameterized() const { return instruction_.is_parameterized(); }
    bool is_directive() const { return instruction_.is_directive(); }
    bool is_controlled_gate() const {
        return instruction_.is_controlled_gate();
    }
    bool is_control_flow() const { return instruction_.is_control_flow(); }

    bool operator==(const OpNode &other) const;
    bool operator!=(const OpNode &other) const { return !(*this == other); }

    uint64_t hash() const;

    std::string repr() const;

  private:
    explicit OpNode(CircuitInstruction instruction);

    NodeHandle handle_;
    CircuitInstruction instruction_;
};

} // namespace dag
} // namespace qdag
