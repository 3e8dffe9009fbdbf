#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <Eigen/Dense>

#include "qdag/circuit/operation.hpp"
#include "qdag/circuit/param.hpp"
#include "qdag/circuit/standard_gate.hpp"

namespace qdag {

// Operation descriptor as stored in a node. Native catalog entries and
// unitaries are held by value; every other kind shares its host object.
class PackedOperation {
  public:
    using UnitaryRef = std::shared_ptr<const Eigen::MatrixXcd>;

    PackedOperation(StandardGate gate) : repr_(gate) {}
    PackedOperation(StandardInstruction instruction) : repr_(instruction) {}
    PackedOperation(UnitaryRef matrix) : repr_(std::move(matrix)) {}
    PackedOperation(OperationRef object) : repr_(std::move(object)) {}

    OperationKind kind() const;

    std::string name() const;
    uint32_t num_qubits() const;
    uint32_t num_clbits() const;

    std::optional<StandardGate> try_standard_gate() const;
    std::optional<StandardInstruction> try_standard_instruction() const;
    bool is_standard_gate() const { return try_standard_gate().has_value(); }
    bool is_directive() const;
    bool is_controlled_gate() const;
    bool is_control_flow() const;

    const UnitaryRef &unitary() const;         // Unitary kind only
    const OperationRef &object() const;        // object kinds only
    bool holds_object() const {
        return std::holds_alternative<OperationRef>(repr_);
    }

    // Pass-through; native gate matrices are not synthesized here
    std::optional<Eigen::MatrixXcd> matrix(const ParamList &params) const;

    // Kind-specific rebuild with no backing state shared with this one
    PackedOperation deep_copy() const;

    // Descriptor equality: same kind, then catalog entry, matrix (1e-10)
    // or the object's own equality. Native gate parameters live outside the
    // descriptor and are not compared here.
    bool operator==(const PackedOperation &other) const;
    bool operator!=(const PackedOperation &other) const {
        return !(*this == other);
    }

  private:
    std::variant<StandardGate, StandardInstruction, UnitaryRef, OperationRef>
        repr_;
};

// Result of shape validation on a host object
struct ExtractedOperation {
    PackedOperation operation;
    ParamList params;
    std::optional<std::string> label;
};

// Validates an operation object and lowers it to its packed form. Throws
// TypeError for null objects, gates that claim classical bits, and native
// entries whose parameter count disagrees with the catalog.
ExtractedOperation extract_operation(const OperationRef &op);

// Builds a fresh host object for the packed form (objects are returned as is)
OperationRef materialize_operation(const PackedOperation &operation,
                                   const ParamList &params,
                                   const std::optional<std::string> &label);

} // namespace qdag
