#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace qdag {

// ============================================================================
// Symbolic parameter expressions (immutable, freely shared)
// ============================================================================

class ParameterExpression {
  public:
    virtual ~ParameterExpression() = default;

    virtual std::string type_name() const = 0;
    virtual bool equals(const ParameterExpression &other) const = 0;
    virtual uint64_t hash() const = 0;
    virtual std::string to_string() const = 0;

    // Encoded payload; `type_name()` is stored alongside by the codec
    virtual nlohmann::json to_json() const = 0;
};

// A named free parameter
class Symbol : public ParameterExpression {
  public:
    explicit Symbol(std::string name) : name_(std::move(name)) {}

    const std::string &name() const { return name_; }

    std::string type_name() const override { return "symbol"; }
    bool equals(const ParameterExpression &other) const override;
    uint64_t hash() const override;
    std::string to_string() const override { return name_; }
    nlohmann::json to_json() const override;

    static std::shared_ptr<const ParameterExpression>
    from_json(const nlohmann::json &j);

  private:
    std::string name_;
};

// constant + sum(coefficient * symbol)
class LinearExpression : public ParameterExpression {
  public:
    LinearExpression(double constant, std::map<std::string, double> terms);

    double constant() const { return constant_; }
    const std::map<std::string, double> &terms() const { return terms_; }

    std::string type_name() const override { return "linear"; }
    bool equals(const ParameterExpression &other) const override;
    uint64_t hash() const override;
    std::string to_string() const override;
    nlohmann::json to_json() const override;

    static std::shared_ptr<const ParameterExpression>
    from_json(const nlohmann::json &j);

  private:
    double constant_;
    std::map<std::string, double> terms_; // zero coefficients are dropped
};

// ============================================================================
// Opaque parameter objects (mutable, compared by their own equality)
// ============================================================================

class ParamObject {
  public:
    virtual ~ParamObject() = default;

    virtual std::string type_name() const = 0;
    virtual bool equals(const ParamObject &other) const = 0;
    virtual std::shared_ptr<ParamObject> deep_copy() const = 0;
    virtual std::string to_string() const = 0;
    virtual nlohmann::json to_json() const = 0;
};

// ============================================================================
// Param
// ============================================================================

using ExpressionRef = std::shared_ptr<const ParameterExpression>;
using ObjectRef = std::shared_ptr<ParamObject>;

using Param = std::variant<double, ExpressionRef, ObjectRef>;
using ParamList = std::vector<Param>;

enum class ParamKind : uint8_t { Float, Expression, Object };

inline ParamKind param_kind(const Param &p) {
    return static_cast<ParamKind>(p.index());
}

inline bool is_float(const Param &p) {
    return std::holds_alternative<double>(p);
}

inline bool is_expression(const Param &p) {
    return std::holds_alternative<ExpressionRef>(p);
}

// Relative float comparison: |a-b| <= DBL_EPSILON, or
// |a-b| <= max(|a|, |b|) * max_relative
bool relative_eq(double a, double b, double max_relative = 1e-10);

// Pairwise comparison used for native gates: floats with relative_eq,
// expressions and objects through their own equality, mixed kinds unequal.
bool param_eq_tolerant(const Param &a, const Param &b);
bool params_eq_tolerant(const ParamList &a, const ParamList &b);

// Exact comparison: floats bit-for-bit equal (NaN never equal)
bool param_eq_exact(const Param &a, const Param &b);
bool params_eq_exact(const ParamList &a, const ParamList &b);

bool is_parameterized(const ParamList &params);

// Object parameters are copied, expressions (immutable) stay shared
Param deep_copy_param(const Param &p);
ParamList deep_copy_params(const ParamList &params);

std::string param_repr(const Param &p);
std::string params_repr(const ParamList &params);

ExpressionRef make_symbol(const std::string &name);

} // namespace qdag
