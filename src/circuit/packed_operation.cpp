#include "qdag/circuit/packed_operation.hpp"
#include "qdag/error.hpp"

namespace qdag {

OperationKind PackedOperation::kind() const {
    switch (repr_.index()) {
    case 0:
        return OperationKind::StandardGate;
    case 1:
        return OperationKind::StandardInstruction;
    case 2:
        return OperationKind::Unitary;
    default:
        break;
    }

    // Renamed native objects keep their class but lose native status
    switch (std::get<OperationRef>(repr_)->kind()) {
    case OperationKind::StandardGate:
    case OperationKind::Unitary:
    case OperationKind::Gate:
        return OperationKind::Gate;
    case OperationKind::StandardInstruction:
    case OperationKind::Instruction:
        return OperationKind::Instruction;
    case OperationKind::Operation:
        return OperationKind::Operation;
    }
    return OperationKind::Operation;
}

std::string PackedOperation::name() const {
    switch (repr_.index()) {
    case 0:
        return standard_gate_name(std::get<StandardGate>(repr_));
    case 1:
        return std::get<StandardInstruction>(repr_).name();
    case 2:
        return "unitary";
    default:
        return std::get<OperationRef>(repr_)->name();
    }
}

uint32_t PackedOperation::num_qubits() const {
    switch (repr_.index()) {
    case 0:
        return standard_gate_num_qubits(std::get<StandardGate>(repr_));
    case 1:
        return std::get<StandardInstruction>(repr_).num_qubits;
    case 2: {
        uint32_t n = 0;
        while ((Eigen::Index(1) << n) < std::get<UnitaryRef>(repr_)->rows())
            ++n;
        return n;
    }
    default:
        return std::get<OperationRef>(repr_)->num_qubits();
    }
}

uint32_t PackedOperation::num_clbits() const {
    switch (repr_.index()) {
    case 1:
        return std::get<StandardInstruction>(repr_).num_clbits();
    case 3:
        return std::get<OperationRef>(repr_)->num_clbits();
    default:
        return 0;
    }
}

std::optional<StandardGate> PackedOperation::try_standard_gate() const {
    if (auto *gate = std::get_if<StandardGate>(&repr_))
        return *gate;
    return std::nullopt;
}

std::optional<StandardInstruction>
PackedOperation::try_standard_instruction() const {
    if (auto *instruction = std::get_if<StandardInstruction>(&repr_))
        return *instruction;
    return std::nullopt;
}

bool PackedOperation::is_directive() const {
    if (auto *instruction = std::get_if<StandardInstruction>(&repr_))
        return instruction->is_directive();
    if (auto *object = std::get_if<OperationRef>(&repr_))
        return (*object)->is_directive();
    return false;
}

bool PackedOperation::is_controlled_gate() const {
    if (auto *gate = std::get_if<StandardGate>(&repr_))
        return standard_gate_is_controlled(*gate);
    if (auto *object = std::get_if<OperationRef>(&repr_))
        return (*object)->is_controlled_gate();
    return false;
}

bool PackedOperation::is_control_flow() const {
    if (auto *object = std::get_if<OperationRef>(&repr_))
        return (*object)->is_control_flow();
    return false;
}

const PackedOperation::UnitaryRef &PackedOperation::unitary() const {
    if (auto *matrix = std::get_if<UnitaryRef>(&repr_))
        return *matrix;
    throw RuntimeError::internal("operation '" + name() +
                                 "' is not a unitary");
}

const OperationRef &PackedOperation::object() const {
    if (auto *object = std::get_if<OperationRef>(&repr_))
        return *object;
    throw RuntimeError::internal("operation '" + name() +
                                 "' is not backed by an object");
}

std::optional<Eigen::MatrixXcd>
PackedOperation::matrix(const ParamList &params) const {
    (void)params; // parameterized kernels are out of scope
    if (auto *matrix = std::get_if<UnitaryRef>(&repr_))
        return **matrix;
    if (auto *object = std::get_if<OperationRef>(&repr_))
        return (*object)->matrix();
    return std::nullopt;
}

PackedOperation PackedOperation::deep_copy() const {
    switch (repr_.index()) {
    case 0:
        return PackedOperation(std::get<StandardGate>(repr_));
    case 1:
        return PackedOperation(std::get<StandardInstruction>(repr_));
    case 2:
        return PackedOperation(std::make_shared<const Eigen::MatrixXcd>(
            *std::get<UnitaryRef>(repr_)));
    default:
        return PackedOperation(std::get<OperationRef>(repr_)->deep_copy());
    }
}

bool PackedOperation::operator==(const PackedOperation &other) const {
    if (repr_.index() != other.repr_.index())
        return false;

    switch (repr_.index()) {
    case 0:
        return std::get<StandardGate>(repr_) ==
               std::get<StandardGate>(other.repr_);
    case 1:
        return std::get<StandardInstruction>(repr_) ==
               std::get<StandardInstruction>(other.repr_);
    case 2: {
        const auto &a = std::get<UnitaryRef>(repr_);
        const auto &b = std::get<UnitaryRef>(other.repr_);
        return a == b || matrices_close(*a, *b);
    }
    default: {
        const auto &a = std::get<OperationRef>(repr_);
        const auto &b = std::get<OperationRef>(other.repr_);
        return a == b || a->equals(*b);
    }
    }
}

// ============================================================================
// Extraction / materialization
// ============================================================================

ExtractedOperation extract_operation(const OperationRef &op) {
    if (!op) {
        throw TypeError::not_an_operation("a null object");
    }

    switch (op->kind()) {
    case OperationKind::StandardGate: {
        auto *native = dynamic_cast<const StandardGateObject *>(op.get());
        if (native == nullptr) {
            throw TypeError::not_an_operation("'" + op->type_name() +
                                              "' claiming to be a native gate");
        }
        if (!native->is_canonical())
            break;
        auto params = native->params();
        if (params.size() != standard_gate_num_params(native->gate())) {
            throw TypeError::param_count_mismatch(
                op->name(), standard_gate_num_params(native->gate()),
                params.size());
        }
        return {PackedOperation(native->gate()), std::move(params),
                native->label()};
    }
    case OperationKind::StandardInstruction: {
        auto *native =
            dynamic_cast<const StandardInstructionObject *>(op.get());
        if (native == nullptr) {
            throw TypeError::not_an_operation(
                "'" + op->type_name() + "' claiming to be a native instruction");
        }
        if (!native->is_canonical())
            break;
        auto params = native->params();
        if (params.size() != native->instruction().num_params()) {
            throw TypeError::param_count_mismatch(
                op->name(), native->instruction().num_params(),
                params.size());
        }
        return {PackedOperation(native->instruction()), std::move(params),
                native->label()};
    }
    case OperationKind::Unitary: {
        auto *unitary = dynamic_cast<const UnitaryGate *>(op.get());
        if (unitary == nullptr) {
            throw TypeError::not_an_operation("'" + op->type_name() +
                                              "' claiming to be a unitary");
        }
        if (!unitary->is_canonical())
            break;
        return {PackedOperation(
                    std::make_shared<const Eigen::MatrixXcd>(unitary->data())),
                {}, unitary->label()};
    }
    case OperationKind::Gate:
        if (op->num_clbits() != 0) {
            throw TypeError("gate '" + op->name() + "' declares " +
                            std::to_string(op->num_clbits()) +
                            " classical bits");
        }
        break;
    case OperationKind::Instruction:
    case OperationKind::Operation:
        break;
    }

    return {PackedOperation(op), op->params(), op->label()};
}

OperationRef materialize_operation(const PackedOperation &operation,
                                   const ParamList &params,
                                   const std::optional<std::string> &label) {
    switch (operation.kind()) {
    case OperationKind::StandardGate:
        return std::make_shared<StandardGateObject>(
            *operation.try_standard_gate(), params, label);
    case OperationKind::StandardInstruction:
        return std::make_shared<StandardInstructionObject>(
            *operation.try_standard_instruction(), params, label);
    case OperationKind::Unitary:
        return std::make_shared<UnitaryGate>(*operation.unitary(), label);
    default:
        return operation.object();
    }
}

} // namespace qdag
