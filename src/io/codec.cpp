#include "qdag/io/codec.hpp"

#include <cmath>
#include <mutex>

namespace qdag {
namespace io {

namespace {

std::mutex &registry_mutex() {
    static std::mutex mutex;
    return mutex;
}

nlohmann::json tagged(const std::string &type_name, nlohmann::json data) {
    return {{"type", type_name}, {"data", std::move(data)}};
}

std::string type_of(const nlohmann::json &j, const char *what) {
    if (!j.is_object() || !j.contains("type") || !j.contains("data")) {
        throw SerializationError(std::string(what) +
                                 " must be an object with 'type' and 'data'");
    }
    if (!j.at("type").is_string()) {
        throw SerializationError(std::string(what) +
                                 " type tag must be a string");
    }
    return j.at("type").get<std::string>();
}

template <typename Decoder>
Decoder find_decoder(const std::map<std::string, Decoder> &decoders,
                     const std::string &type_name, const char *what) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    auto it = decoders.find(type_name);
    if (it == decoders.end()) {
        throw SerializationError(std::string("no decoder registered for ") +
                                 what + " type '" + type_name + "'");
    }
    return it->second;
}

} // namespace

Codec::Registry &Codec::get_registry() {
    static Registry registry;
    return registry;
}

void Codec::register_operation_type(const std::string &type_name,
                                    OperationDecoder decoder) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    get_registry().operations[type_name] = std::move(decoder);
}

void Codec::register_expression_type(const std::string &type_name,
                                     ExpressionDecoder decoder) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    get_registry().expressions[type_name] = std::move(decoder);
}

void Codec::register_object_type(const std::string &type_name,
                                 ObjectDecoder decoder) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    get_registry().objects[type_name] = std::move(decoder);
}

bool Codec::has_operation_type(const std::string &type_name) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    return get_registry().operations.count(type_name) > 0;
}

bool Codec::has_expression_type(const std::string &type_name) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    return get_registry().expressions.count(type_name) > 0;
}

bool Codec::has_object_type(const std::string &type_name) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    return get_registry().objects.count(type_name) > 0;
}

void Codec::initialize_builtin_types() {
    register_operation_type("instruction", &Instruction::from_json);
    register_operation_type("gate", &Gate::from_json);
    register_operation_type("standard_gate", &StandardGateObject::from_json);
    register_operation_type("standard_instruction",
                            &StandardInstructionObject::from_json);
    register_operation_type("unitary", &UnitaryGate::from_json);

    register_expression_type("symbol", &Symbol::from_json);
    register_expression_type("linear", &LinearExpression::from_json);
}

// ============================================================================
// Operations
// ============================================================================

nlohmann::json Codec::encode_operation(const OperationObject &op) {
    return tagged(op.type_name(), op.to_json());
}

OperationRef Codec::decode_operation(const nlohmann::json &j) {
    auto type_name = type_of(j, "operation");
    auto decoder =
        find_decoder(get_registry().operations, type_name, "operation");
    try {
        auto op = decoder(j.at("data"));
        if (!op) {
            throw SerializationError("decoder for '" + type_name +
                                     "' returned null");
        }
        return op;
    } catch (const nlohmann::json::exception &e) {
        throw SerializationError("malformed '" + type_name +
                                 "' operation: " + e.what());
    }
}

// ============================================================================
// Parameters
// ============================================================================

nlohmann::json Codec::encode_param(const Param &param) {
    switch (param_kind(param)) {
    case ParamKind::Float: {
        double value = std::get<double>(param);
        if (!std::isfinite(value)) {
            // JSON has no literal for these
            return {{"float", std::isnan(value) ? "nan"
                              : value > 0       ? "inf"
                                                : "-inf"}};
        }
        return value;
    }
    case ParamKind::Expression: {
        const auto &expr = std::get<ExpressionRef>(param);
        if (!expr) {
            throw SerializationError("cannot encode a null expression");
        }
        return {{"expr", tagged(expr->type_name(), expr->to_json())}};
    }
    case ParamKind::Object: {
        const auto &obj = std::get<ObjectRef>(param);
        if (!obj) {
            throw SerializationError("cannot encode a null parameter object");
        }
        return {{"object", tagged(obj->type_name(), obj->to_json())}};
    }
    }
    throw SerializationError("unknown parameter kind");
}

Param Codec::decode_param(const nlohmann::json &j) {
    if (j.is_number()) {
        return j.get<double>();
    }
    if (!j.is_object()) {
        throw SerializationError("parameter must be a number or an object");
    }

    if (j.contains("float")) {
        if (!j.at("float").is_string()) {
            throw SerializationError("float literal must be a string");
        }
        auto text = j.at("float").get<std::string>();
        if (text == "nan")
            return std::nan("");
        if (text == "inf")
            return HUGE_VAL;
        if (text == "-inf")
            return -HUGE_VAL;
        throw SerializationError("unknown float literal '" + text + "'");
    }
    if (j.contains("expr")) {
        const auto &inner = j.at("expr");
        auto type_name = type_of(inner, "expression");
        auto decoder = find_decoder(get_registry().expressions, type_name,
                                    "expression");
        try {
            return decoder(inner.at("data"));
        } catch (const nlohmann::json::exception &e) {
            throw SerializationError("malformed '" + type_name +
                                     "' expression: " + e.what());
        }
    }
    if (j.contains("object")) {
        const auto &inner = j.at("object");
        auto type_name = type_of(inner, "parameter object");
        auto decoder =
            find_decoder(get_registry().objects, type_name, "parameter object");
        try {
            return decoder(inner.at("data"));
        } catch (const nlohmann::json::exception &e) {
            throw SerializationError("malformed '" + type_name +
                                     "' parameter object: " + e.what());
        }
    }
    throw SerializationError("unrecognized parameter encoding: " + j.dump());
}

nlohmann::json Codec::encode_params(const ParamList &params) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &p : params) {
        out.push_back(encode_param(p));
    }
    return out;
}

ParamList Codec::decode_params(const nlohmann::json &j) {
    if (!j.is_array()) {
        throw SerializationError("parameters must be an array");
    }
    ParamList params;
    params.reserve(j.size());
    for (const auto &p : j) {
        params.push_back(decode_param(p));
    }
    return params;
}

// ============================================================================
// Wires
// ============================================================================

nlohmann::json Codec::encode_wire(const Bit &bit) {
    nlohmann::json j = {{"kind", bit_kind_name(bit.kind())}};
    if (bit.has_register()) {
        j["register"] = *bit.register_name();
        j["position"] = bit.position();
    } else {
        j["id"] = bit.id();
    }
    return j;
}

Bit Codec::decode_wire(const nlohmann::json &j) {
    try {
        auto kind_name = j.at("kind").get<std::string>();
        BitKind kind;
        if (kind_name == "qubit") {
            kind = BitKind::Qubit;
        } else if (kind_name == "clbit") {
            kind = BitKind::Clbit;
        } else {
            throw SerializationError("unknown wire kind '" + kind_name + "'");
        }

        if (j.contains("register")) {
            return Bit(kind, j.at("register").get<std::string>(),
                       j.at("position").get<uint32_t>());
        }
        return Bit::anonymous(kind, j.at("id").get<uint64_t>());
    } catch (const nlohmann::json::exception &e) {
        throw SerializationError(std::string("malformed wire: ") + e.what());
    }
}

} // namespace io
} // namespace qdag
