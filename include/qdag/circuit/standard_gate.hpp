#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace qdag {

// Closed catalog of natively recognized gates
enum class StandardGate : uint8_t {
    // Single-qubit, fixed
    H,
    X,
    Y,
    Z,
    S,
    Sdg,
    T,
    Tdg,
    SX,

    // Single-qubit, parameterized
    RX,
    RY,
    RZ,
    Phase,
    U,

    // Two-qubit
    CX,
    CY,
    CZ,
    CH,
    CRX,
    CRY,
    CRZ,
    CPhase,
    Swap,
    ISwap,
    RXX,
    RZZ,

    // Three-qubit
    CCX,
    CSwap,
};

constexpr size_t kNumStandardGates =
    static_cast<size_t>(StandardGate::CSwap) + 1;

struct StandardGateInfo {
    const char *name;
    uint32_t num_qubits;
    uint32_t num_params;
    bool controlled;
};

const StandardGateInfo &standard_gate_info(StandardGate gate);

inline std::string standard_gate_name(StandardGate gate) {
    return standard_gate_info(gate).name;
}

inline uint32_t standard_gate_num_qubits(StandardGate gate) {
    return standard_gate_info(gate).num_qubits;
}

inline uint32_t standard_gate_num_params(StandardGate gate) {
    return standard_gate_info(gate).num_params;
}

inline bool standard_gate_is_controlled(StandardGate gate) {
    return standard_gate_info(gate).controlled;
}

std::optional<StandardGate> standard_gate_from_name(const std::string &name);

// ============================================================================
// Native non-unitary instructions
// ============================================================================

enum class StandardInstructionType : uint8_t { Measure, Reset, Barrier, Delay };

struct StandardInstruction {
    StandardInstructionType type;
    uint32_t num_qubits = 1; // only barriers span a variable width

    static StandardInstruction measure() {
        return {StandardInstructionType::Measure, 1};
    }
    static StandardInstruction reset() {
        return {StandardInstructionType::Reset, 1};
    }
    static StandardInstruction barrier(uint32_t num_qubits) {
        return {StandardInstructionType::Barrier, num_qubits};
    }
    static StandardInstruction delay() {
        return {StandardInstructionType::Delay, 1};
    }

    std::string name() const;
    uint32_t num_clbits() const {
        return type == StandardInstructionType::Measure ? 1 : 0;
    }
    uint32_t num_params() const {
        return type == StandardInstructionType::Delay ? 1 : 0;
    }
    bool is_directive() const {
        return type == StandardInstructionType::Barrier;
    }

    bool operator==(const StandardInstruction &other) const {
        return type == other.type && num_qubits == other.num_qubits;
    }
    bool operator!=(const StandardInstruction &other) const {
        return !(*this == other);
    }
};

std::optional<StandardInstructionType>
standard_instruction_from_name(const std::string &name);

} // namespace qdag
