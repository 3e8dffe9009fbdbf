#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "qdag/circuit/bit.hpp"
#include "qdag/circuit/operation.hpp"
#include "qdag/circuit/param.hpp"

namespace qdag {
namespace io {

// ============================================================================
// Exceptions
// ============================================================================

class SerializationError : public std::runtime_error {
  public:
    explicit SerializationError(const std::string &message)
        : std::runtime_error("qdag serialization error: " + message) {}
};

// ============================================================================
// Type registry for operation objects and parameters
// ============================================================================

// Encodes polymorphic values as {"type": <type_name>, "data": <payload>}.
// Decoding looks the type name up in a process-wide registry; external
// operation and parameter kinds register their own decoder.
class Codec {
  public:
    using OperationDecoder = std::function<OperationRef(const nlohmann::json &)>;
    using ExpressionDecoder =
        std::function<ExpressionRef(const nlohmann::json &)>;
    using ObjectDecoder = std::function<ObjectRef(const nlohmann::json &)>;

    static void register_operation_type(const std::string &type_name,
                                        OperationDecoder decoder);
    static void register_expression_type(const std::string &type_name,
                                         ExpressionDecoder decoder);
    static void register_object_type(const std::string &type_name,
                                     ObjectDecoder decoder);

    static bool has_operation_type(const std::string &type_name);
    static bool has_expression_type(const std::string &type_name);
    static bool has_object_type(const std::string &type_name);

    // Registers instruction, gate, standard_gate, standard_instruction,
    // unitary, symbol and linear. Safe to call more than once.
    static void initialize_builtin_types();

    static nlohmann::json encode_operation(const OperationObject &op);
    static OperationRef decode_operation(const nlohmann::json &j);

    // Floats encode as plain numbers, expressions as {"expr": ...} and
    // objects as {"object": ...}
    static nlohmann::json encode_param(const Param &param);
    static Param decode_param(const nlohmann::json &j);

    static nlohmann::json encode_params(const ParamList &params);
    static ParamList decode_params(const nlohmann::json &j);

    static nlohmann::json encode_wire(const Bit &bit);
    static Bit decode_wire(const nlohmann::json &j);

  private:
    struct Registry {
        std::map<std::string, OperationDecoder> operations;
        std::map<std::string, ExpressionDecoder> expressions;
        std::map<std::string, ObjectDecoder> objects;
    };

    static Registry &get_registry();
};

} // namespace io
} // namespace qdag
