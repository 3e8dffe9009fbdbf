#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "qdag/circuit/param.hpp"
#include "qdag/circuit/standard_gate.hpp"

namespace qdag {

enum class OperationKind : uint8_t {
    StandardGate,
    StandardInstruction,
    Gate,
    Instruction,
    Unitary,
    Operation, // opaque, externally defined
};

std::string operation_kind_name(OperationKind kind);

// ============================================================================
// Materialized operation objects
// ============================================================================

// The mutable, reference-shared form of an operation. Subclasses that are
// not instructions are treated as opaque operations.
class OperationObject {
  public:
    virtual ~OperationObject() = default;

    virtual OperationKind kind() const { return OperationKind::Operation; }

    // Codec tag; must be unique per concrete class
    virtual std::string type_name() const = 0;

    virtual const std::string &name() const = 0;
    virtual void set_name(const std::string &name) = 0;

    virtual uint32_t num_qubits() const = 0;
    virtual uint32_t num_clbits() const = 0;

    virtual ParamList params() const { return {}; }
    virtual std::optional<std::string> label() const { return std::nullopt; }

    virtual bool is_directive() const { return false; }

    // Gates built as a controlled version of a base gate
    virtual bool is_controlled_gate() const { return false; }

    // Operations that carry nested blocks (if/else, loops, switch)
    virtual bool is_control_flow() const { return false; }

    virtual std::optional<Eigen::MatrixXcd> matrix() const {
        return std::nullopt;
    }

    virtual bool equals(const OperationObject &other) const = 0;

    // Independent copy with no shared mutable state
    virtual std::shared_ptr<OperationObject> deep_copy() const = 0;

    // Encoded payload; `type_name()` is stored alongside by the codec
    virtual nlohmann::json to_json() const = 0;

    virtual std::string repr() const;
};

using OperationRef = std::shared_ptr<OperationObject>;

// Generic instruction: any name, width and parameter list
class Instruction : public OperationObject {
  public:
    Instruction(std::string name, uint32_t num_qubits, uint32_t num_clbits,
                ParamList params = {},
                std::optional<std::string> label = std::nullopt);

    OperationKind kind() const override { return OperationKind::Instruction; }
    std::string type_name() const override { return "instruction"; }

    const std::string &name() const override { return name_; }
    void set_name(const std::string &name) override { name_ = name; }

    uint32_t num_qubits() const override { return num_qubits_; }
    uint32_t num_clbits() const override { return num_clbits_; }

    ParamList params() const override { return params_; }
    void set_params(ParamList params) { params_ = std::move(params); }

    std::optional<std::string> label() const override { return label_; }
    void set_label(std::optional<std::string> label) {
        label_ = std::move(label);
    }

    // Same concrete type, name, width and parameters (within 1e-10).
    // Labels do not take part.
    bool equals(const OperationObject &other) const override;

    OperationRef deep_copy() const override;

    nlohmann::json to_json() const override;

    static OperationRef from_json(const nlohmann::json &j);

  protected:
    std::string name_;
    uint32_t num_qubits_;
    uint32_t num_clbits_;
    ParamList params_;
    std::optional<std::string> label_;
};

// Generic unitary gate; never touches classical bits
class Gate : public Instruction {
  public:
    Gate(std::string name, uint32_t num_qubits, ParamList params = {},
         std::optional<std::string> label = std::nullopt);

    OperationKind kind() const override { return OperationKind::Gate; }
    std::string type_name() const override { return "gate"; }

    OperationRef deep_copy() const override;

    static OperationRef from_json(const nlohmann::json &j);
};

// Host-side view of a native catalog gate
class StandardGateObject : public Gate {
  public:
    // Throws TypeError when the parameter count disagrees with the catalog
    StandardGateObject(StandardGate gate, ParamList params = {},
                       std::optional<std::string> label = std::nullopt);

    OperationKind kind() const override { return OperationKind::StandardGate; }
    std::string type_name() const override { return "standard_gate"; }

    StandardGate gate() const { return gate_; }

    // False once the object has been renamed away from its catalog name
    bool is_canonical() const { return name_ == standard_gate_name(gate_); }

    bool is_controlled_gate() const override {
        return standard_gate_is_controlled(gate_);
    }

    OperationRef deep_copy() const override;

    nlohmann::json to_json() const override;

    static OperationRef from_json(const nlohmann::json &j);

  private:
    StandardGate gate_;
};

// Host-side view of a native non-unitary instruction
class StandardInstructionObject : public Instruction {
  public:
    StandardInstructionObject(StandardInstruction instruction,
                              ParamList params = {},
                              std::optional<std::string> label = std::nullopt);

    OperationKind kind() const override {
        return OperationKind::StandardInstruction;
    }
    std::string type_name() const override { return "standard_instruction"; }

    const StandardInstruction &instruction() const { return instruction_; }

    bool is_canonical() const { return name_ == instruction_.name(); }

    bool is_directive() const override { return instruction_.is_directive(); }

    OperationRef deep_copy() const override;

    nlohmann::json to_json() const override;

    static OperationRef from_json(const nlohmann::json &j);

  private:
    StandardInstruction instruction_;
};

// Gate given directly by its matrix
class UnitaryGate : public Gate {
  public:
    // Throws ValueError unless the matrix is square, of dimension 2^n and
    // unitary within 1e-8
    explicit UnitaryGate(Eigen::MatrixXcd matrix,
                         std::optional<std::string> label = std::nullopt);

    OperationKind kind() const override { return OperationKind::Unitary; }
    std::string type_name() const override { return "unitary"; }

    const Eigen::MatrixXcd &data() const { return matrix_; }

    std::optional<Eigen::MatrixXcd> matrix() const override {
        return matrix_;
    }

    bool is_canonical() const { return name_ == "unitary"; }

    bool equals(const OperationObject &other) const override;

    OperationRef deep_copy() const override;

    nlohmann::json to_json() const override;

    static OperationRef from_json(const nlohmann::json &j);

  private:
    Eigen::MatrixXcd matrix_;
};

// Element-wise |a - b| <= atol; shapes must agree
bool matrices_close(const Eigen::MatrixXcd &a, const Eigen::MatrixXcd &b,
                    double atol = 1e-10);

// Validates and returns the qubit count of a unitary matrix
uint32_t unitary_num_qubits(const Eigen::MatrixXcd &matrix);

nlohmann::json matrix_to_json(const Eigen::MatrixXcd &matrix);
Eigen::MatrixXcd matrix_from_json(const nlohmann::json &j);

} // namespace qdag
