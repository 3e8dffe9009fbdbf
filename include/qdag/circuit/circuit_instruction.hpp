#pragma once

#include <optional>
#include <string>

#include "qdag/circuit/bit.hpp"
#include "qdag/circuit/packed_operation.hpp"
#include "qdag/circuit/param.hpp"

namespace qdag {

// An operation together with the wires it acts on
struct CircuitInstruction {
    PackedOperation operation;
    WireList qubits;
    WireList clbits;
    ParamList params;
    std::optional<std::string> label;

    // Host object built on first access to `get_operation()`. Reset on every
    // path that changes the operation, its parameters or its label.
    mutable OperationRef cached_op_;

    // Validates `op` and takes the descriptor, parameters and label from it.
    // The object itself seeds the cache.
    static CircuitInstruction from_operation(const OperationRef &op,
                                             WireList qubits = {},
                                             WireList clbits = {});

    OperationRef get_operation() const;

    // The cached host object, for in-place mutation. Callers re-derive the
    // descriptor afterwards.
    OperationRef get_operation_mut();

    bool has_cached_operation() const { return cached_op_ != nullptr; }
    void invalidate_cache() const { cached_op_.reset(); }

    // Shallow copies share object-backed descriptors and parameter objects.
    // Deep copies rebuild both and start with an empty cache.
    CircuitInstruction duplicate(bool deep) const;

    bool is_standard_gate() const { return operation.is_standard_gate(); }
    bool is_parameterized() const { return qdag::is_parameterized(params); }
    bool is_directive() const { return operation.is_directive(); }
    bool is_controlled_gate() const { return operation.is_controlled_gate(); }
    bool is_control_flow() const { return operation.is_control_flow(); }
};

} // namespace qdag
