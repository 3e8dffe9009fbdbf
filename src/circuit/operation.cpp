#include "qdag/circuit/operation.hpp"
#include "qdag/error.hpp"
#include "qdag/io/codec.hpp"

#include <sstream>

namespace qdag {

std::string operation_kind_name(OperationKind kind) {
    switch (kind) {
    case OperationKind::StandardGate:
        return "standard_gate";
    case OperationKind::StandardInstruction:
        return "standard_instruction";
    case OperationKind::Gate:
        return "gate";
    case OperationKind::Instruction:
        return "instruction";
    case OperationKind::Unitary:
        return "unitary";
    case OperationKind::Operation:
        return "operation";
    }
    return "unknown";
}

std::string OperationObject::repr() const {
    std::ostringstream oss;
    oss << "Instruction(name='" << name() << "', num_qubits=" << num_qubits()
        << ", num_clbits=" << num_clbits()
        << ", params=" << params_repr(params()) << ")";
    return oss.str();
}

// ============================================================================
// Instruction
// ============================================================================

Instruction::Instruction(std::string name, uint32_t num_qubits,
                         uint32_t num_clbits, ParamList params,
                         std::optional<std::string> label)
    : name_(std::move(name)), num_qubits_(num_qubits),
      num_clbits_(num_clbits), params_(std::move(params)),
      label_(std::move(label)) {}

bool Instruction::equals(const OperationObject &other) const {
    if (this == &other)
        return true;
    if (other.type_name() != type_name())
        return false;
    return other.name() == name_ && other.num_qubits() == num_qubits_ &&
           other.num_clbits() == num_clbits_ &&
           params_eq_tolerant(params_, other.params());
}

OperationRef Instruction::deep_copy() const {
    return std::make_shared<Instruction>(name_, num_qubits_, num_clbits_,
                                         deep_copy_params(params_), label_);
}

nlohmann::json Instruction::to_json() const {
    nlohmann::json j = {{"name", name_},
                        {"num_qubits", num_qubits_},
                        {"num_clbits", num_clbits_},
                        {"params", io::Codec::encode_params(params_)}};
    j["label"] = label_ ? nlohmann::json(*label_) : nlohmann::json(nullptr);
    return j;
}

namespace {

std::optional<std::string> label_from_json(const nlohmann::json &j) {
    auto it = j.find("label");
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<std::string>();
}

} // namespace

OperationRef Instruction::from_json(const nlohmann::json &j) {
    return std::make_shared<Instruction>(
        j.at("name").get<std::string>(), j.at("num_qubits").get<uint32_t>(),
        j.at("num_clbits").get<uint32_t>(),
        io::Codec::decode_params(j.at("params")), label_from_json(j));
}

// ============================================================================
// Gate
// ============================================================================

Gate::Gate(std::string name, uint32_t num_qubits, ParamList params,
           std::optional<std::string> label)
    : Instruction(std::move(name), num_qubits, 0, std::move(params),
                  std::move(label)) {}

OperationRef Gate::deep_copy() const {
    return std::make_shared<Gate>(name_, num_qubits_,
                                  deep_copy_params(params_), label_);
}

OperationRef Gate::from_json(const nlohmann::json &j) {
    return std::make_shared<Gate>(j.at("name").get<std::string>(),
                                  j.at("num_qubits").get<uint32_t>(),
                                  io::Codec::decode_params(j.at("params")),
                                  label_from_json(j));
}

// ============================================================================
// StandardGateObject
// ============================================================================

StandardGateObject::StandardGateObject(StandardGate gate, ParamList params,
                                       std::optional<std::string> label)
    : Gate(standard_gate_name(gate), standard_gate_num_qubits(gate),
           std::move(params), std::move(label)),
      gate_(gate) {
    if (params_.size() != standard_gate_num_params(gate)) {
        throw TypeError::param_count_mismatch(standard_gate_name(gate),
                                              standard_gate_num_params(gate),
                                              params_.size());
    }
}

OperationRef StandardGateObject::deep_copy() const {
    auto copy = std::make_shared<StandardGateObject>(
        gate_, deep_copy_params(params_), label_);
    copy->set_name(name_);
    return copy;
}

nlohmann::json StandardGateObject::to_json() const {
    nlohmann::json j = Instruction::to_json();
    j["gate"] = standard_gate_name(gate_);
    return j;
}

OperationRef StandardGateObject::from_json(const nlohmann::json &j) {
    auto gate_name = j.at("gate").get<std::string>();
    auto gate = standard_gate_from_name(gate_name);
    if (!gate) {
        throw io::SerializationError("unknown standard gate '" + gate_name +
                                     "'");
    }
    auto op = std::make_shared<StandardGateObject>(
        *gate, io::Codec::decode_params(j.at("params")), label_from_json(j));
    op->set_name(j.at("name").get<std::string>());
    return op;
}

// ============================================================================
// StandardInstructionObject
// ============================================================================

StandardInstructionObject::StandardInstructionObject(
    StandardInstruction instruction, ParamList params,
    std::optional<std::string> label)
    : Instruction(instruction.name(), instruction.num_qubits,
                  instruction.num_clbits(), std::move(params),
                  std::move(label)),
      instruction_(instruction) {
    if (params_.size() != instruction.num_params()) {
        throw TypeError::param_count_mismatch(
            instruction.name(), instruction.num_params(), params_.size());
    }
}

OperationRef StandardInstructionObject::deep_copy() const {
    auto copy = std::make_shared<StandardInstructionObject>(
        instruction_, deep_copy_params(params_), label_);
    copy->set_name(name_);
    return copy;
}

nlohmann::json StandardInstructionObject::to_json() const {
    nlohmann::json j = Instruction::to_json();
    j["instruction"] = instruction_.name();
    return j;
}

OperationRef StandardInstructionObject::from_json(const nlohmann::json &j) {
    auto instruction_name = j.at("instruction").get<std::string>();
    auto type = standard_instruction_from_name(instruction_name);
    if (!type) {
        throw io::SerializationError("unknown standard instruction '" +
                                     instruction_name + "'");
    }
    StandardInstruction instruction{*type, j.at("num_qubits").get<uint32_t>()};
    auto op = std::make_shared<StandardInstructionObject>(
        instruction, io::Codec::decode_params(j.at("params")),
        label_from_json(j));
    op->set_name(j.at("name").get<std::string>());
    return op;
}

// ============================================================================
// UnitaryGate
// ============================================================================

uint32_t unitary_num_qubits(const Eigen::MatrixXcd &matrix) {
    auto rows = matrix.rows();
    if (rows != matrix.cols()) {
        throw ValueError::not_unitary("matrix is " + std::to_string(rows) +
                                      "x" + std::to_string(matrix.cols()));
    }
    if (rows < 2 || (rows & (rows - 1)) != 0) {
        throw ValueError::not_unitary("dimension " + std::to_string(rows) +
                                      " is not a power of two");
    }

    Eigen::MatrixXcd residual =
        matrix.adjoint() * matrix - Eigen::MatrixXcd::Identity(rows, rows);
    double deviation = residual.cwiseAbs().maxCoeff();
    if (deviation > 1e-8) {
        std::ostringstream oss;
        oss << "U^dagger U deviates from identity by " << deviation;
        throw ValueError::not_unitary(oss.str());
    }

    uint32_t num_qubits = 0;
    while ((Eigen::Index(1) << num_qubits) < rows) {
        ++num_qubits;
    }
    return num_qubits;
}

UnitaryGate::UnitaryGate(Eigen::MatrixXcd matrix,
                         std::optional<std::string> label)
    : Gate("unitary", unitary_num_qubits(matrix), {}, std::move(label)),
      matrix_(std::move(matrix)) {}

bool UnitaryGate::equals(const OperationObject &other) const {
    if (this == &other)
        return true;
    auto *unitary = dynamic_cast<const UnitaryGate *>(&other);
    return unitary != nullptr && unitary->name() == name_ &&
           matrices_close(matrix_, unitary->matrix_);
}

OperationRef UnitaryGate::deep_copy() const {
    auto copy = std::make_shared<UnitaryGate>(matrix_, label_);
    copy->set_name(name_);
    return copy;
}

nlohmann::json UnitaryGate::to_json() const {
    nlohmann::json j = {{"name", name_}, {"matrix", matrix_to_json(matrix_)}};
    j["label"] = label_ ? nlohmann::json(*label_) : nlohmann::json(nullptr);
    return j;
}

OperationRef UnitaryGate::from_json(const nlohmann::json &j) {
    auto op = std::make_shared<UnitaryGate>(matrix_from_json(j.at("matrix")),
                                            label_from_json(j));
    op->set_name(j.at("name").get<std::string>());
    return op;
}

bool matrices_close(const Eigen::MatrixXcd &a, const Eigen::MatrixXcd &b,
                    double atol) {
    if (a.rows() != b.rows() || a.cols() != b.cols())
        return false;
    if (a.size() == 0)
        return true;
    return (a - b).cwiseAbs().maxCoeff() <= atol;
}

nlohmann::json matrix_to_json(const Eigen::MatrixXcd &matrix) {
    nlohmann::json rows = nlohmann::json::array();
    for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (Eigen::Index c = 0; c < matrix.cols(); ++c) {
            row.push_back({matrix(r, c).real(), matrix(r, c).imag()});
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

Eigen::MatrixXcd matrix_from_json(const nlohmann::json &j) {
    if (!j.is_array() || j.empty()) {
        throw io::SerializationError("matrix must be a non-empty array");
    }
    auto n_rows = static_cast<Eigen::Index>(j.size());
    auto n_cols = static_cast<Eigen::Index>(j[0].size());
    Eigen::MatrixXcd matrix(n_rows, n_cols);
    for (Eigen::Index r = 0; r < n_rows; ++r) {
        const auto &row = j[static_cast<size_t>(r)];
        if (static_cast<Eigen::Index>(row.size()) != n_cols) {
            throw io::SerializationError("ragged matrix row " +
                                         std::to_string(r));
        }
        for (Eigen::Index c = 0; c < n_cols; ++c) {
            const auto &entry = row[static_cast<size_t>(c)];
            matrix(r, c) = std::complex<double>(entry.at(0).get<double>(),
                                                entry.at(1).get<double>());
        }
    }
    return matrix;
}

} // namespace qdag
