#include "qdag/circuit/circuit_instruction.hpp"
#include "qdag/debug.hpp"

namespace qdag {

CircuitInstruction CircuitInstruction::from_operation(const OperationRef &op,
                                                      WireList qubits,
                                                      WireList clbits) {
    auto extracted = extract_operation(op);
    CircuitInstruction instruction{std::move(extracted.operation),
                                   std::move(qubits),
                                   std::move(clbits),
                                   std::move(extracted.params),
                                   std::move(extracted.label),
                                   op};
    return instruction;
}

OperationRef CircuitInstruction::get_operation() const {
    if (!cached_op_) {
        cached_op_ = materialize_operation(operation, params, label);
    }
    return cached_op_;
}

OperationRef CircuitInstruction::get_operation_mut() { return get_operation(); }

CircuitInstruction CircuitInstruction::duplicate(bool deep) const {
    if (!deep) {
        CircuitInstruction copy = *this;
        // A materialized native object must not be shared between copies
        if (!operation.holds_object())
            copy.invalidate_cache();
        return copy;
    }

    trace::ScopedTrace trace("deep_copy", operation.name());
    return CircuitInstruction{operation.deep_copy(), qubits, clbits,
                              deep_copy_params(params), label, nullptr};
}

} // namespace qdag
