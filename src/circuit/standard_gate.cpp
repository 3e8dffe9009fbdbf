#include "qdag/circuit/standard_gate.hpp"

#include <array>
#include <unordered_map>

namespace qdag {

namespace {

// Indexed by StandardGate
constexpr std::array<StandardGateInfo, kNumStandardGates> kGateTable = {{
    {"h", 1, 0, false},     {"x", 1, 0, false},    {"y", 1, 0, false},
    {"z", 1, 0, false},     {"s", 1, 0, false},    {"sdg", 1, 0, false},
    {"t", 1, 0, false},     {"tdg", 1, 0, false},  {"sx", 1, 0, false},
    {"rx", 1, 1, false},    {"ry", 1, 1, false},   {"rz", 1, 1, false},
    {"p", 1, 1, false},     {"u", 1, 3, false},    {"cx", 2, 0, true},
    {"cy", 2, 0, true},     {"cz", 2, 0, true},    {"ch", 2, 0, true},
    {"crx", 2, 1, true},    {"cry", 2, 1, true},   {"crz", 2, 1, true},
    {"cp", 2, 1, true},     {"swap", 2, 0, false}, {"iswap", 2, 0, false},
    {"rxx", 2, 1, false},   {"rzz", 2, 1, false},  {"ccx", 3, 0, true},
    {"cswap", 3, 0, true},
}};

} // namespace

const StandardGateInfo &standard_gate_info(StandardGate gate) {
    return kGateTable[static_cast<size_t>(gate)];
}

std::optional<StandardGate> standard_gate_from_name(const std::string &name) {
    static const std::unordered_map<std::string, StandardGate> by_name = [] {
        std::unordered_map<std::string, StandardGate> m;
        for (size_t i = 0; i < kNumStandardGates; ++i) {
            m.emplace(kGateTable[i].name, static_cast<StandardGate>(i));
        }
        return m;
    }();

    auto it = by_name.find(name);
    if (it == by_name.end())
        return std::nullopt;
    return it->second;
}

std::string StandardInstruction::name() const {
    switch (type) {
    case StandardInstructionType::Measure:
        return "measure";
    case StandardInstructionType::Reset:
        return "reset";
    case StandardInstructionType::Barrier:
        return "barrier";
    case StandardInstructionType::Delay:
        return "delay";
    }
    return "unknown";
}

std::optional<StandardInstructionType>
standard_instruction_from_name(const std::string &name) {
    if (name == "measure")
        return StandardInstructionType::Measure;
    if (name == "reset")
        return StandardInstructionType::Reset;
    if (name == "barrier")
        return StandardInstructionType::Barrier;
    if (name == "delay")
        return StandardInstructionType::Delay;
    return std::nullopt;
}

} // namespace qdag
