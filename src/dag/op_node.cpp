#include "qdag/dag/op_node.hpp"
#include "qdag/debug.hpp"
#include "qdag/error.hpp"
#include "qdag/hash.hpp"

#include <sstream>

namespace qdag {
namespace dag {

namespace {

void check_wires(const WireList &wires, const char *context) {
    for (const auto &wire : wires) {
        if (!wire) {
            throw ValueError::null_wire(context);
        }
    }
}

} // namespace

OpNode::OpNode(CircuitInstruction instruction)
    : instruction_(std::move(instruction)) {
    check_wires(instruction_.qubits, "OpNode qargs");
    check_wires(instruction_.clbits, "OpNode cargs");
}

OpNode::OpNode(const OperationRef &op, WireList qargs, WireList cargs)
    : OpNode(CircuitInstruction::from_operation(op, std::move(qargs),
                                                std::move(cargs))) {}

OpNode OpNode::from_instruction(CircuitInstruction instruction, bool deepcopy) {
    if (deepcopy) {
        return OpNode(instruction.duplicate(true));
    }
    return OpNode(std::move(instruction));
}

CircuitInstruction OpNode::to_circuit_instruction(bool deepcopy) const {
    auto instruction = instruction_.duplicate(deepcopy);
    instruction.invalidate_cache();
    return instruction;
}

OpNode OpNode::duplicate(bool deep) const {
    return OpNode(instruction_.duplicate(deep));
}

void OpNode::set_op(const OperationRef &op) {
    trace::ScopedTrace trace("set_op", op ? op->name() : "null",
                             handle_.raw_index());
    auto extracted = extract_operation(op);
    instruction_.operation = std::move(extracted.operation);
    instruction_.params = std::move(extracted.params);
    instruction_.label = std::move(extracted.label);
    instruction_.cached_op_ = op;
}

void OpNode::set_name(const std::string &name) {
    auto op = instruction_.get_operation_mut();
    op->set_name(name);
    instruction_.operation = extract_operation(op).operation;
}

void OpNode::set_qargs(WireList qargs) {
    check_wires(qargs, "OpNode::set_qargs");
    instruction_.qubits = std::move(qargs);
}

void OpNode::set_cargs(WireList cargs) {
    check_wires(cargs, "OpNode::set_cargs");
    instruction_.clbits = std::move(cargs);
}

void OpNode::set_params(ParamList params) {
    instruction_.params = std::move(params);
    instruction_.invalidate_cache();
}

void OpNode::set_label(std::optional<std::string> label) {
    instruction_.label = std::move(label);
    instruction_.invalidate_cache();
}

bool OpNode::operator==(const OpNode &other) const {
    if (handle_ != other.handle_)
        return false;
    if (instruction_.operation != other.instruction_.operation)
        return false;

    // Object-backed descriptors already compared their parameters; native
    // entries keep theirs outside the descriptor
    if (!instruction_.operation.holds_object() &&
        !params_eq_tolerant(instruction_.params, other.instruction_.params)) {
        return false;
    }

    return wires_eq(instruction_.qubits, other.instruction_.qubits) &&
           wires_eq(instruction_.clbits, other.instruction_.clbits);
}

uint64_t OpNode::hash() const {
    uint64_t h = fnv_hash_i64(FNV_OFFSET, handle_.raw_index());
    return fnv_hash_string(h, instruction_.operation.name());
}

std::string OpNode::repr() const {
    std::ostringstream oss;
    oss << "DAGOpNode(op=" << op()->repr()
        << ", qargs=" << wires_repr(instruction_.qubits)
        << ", cargs=" << wires_repr(instruction_.clbits) << ")";
    return oss.str();
}

} // namespace dag
} // namespace qdag
