#include "qdag/circuit/param.hpp"
#include "qdag/hash.hpp"

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <sstream>

namespace qdag {

// ============================================================================
// Symbol
// ============================================================================

bool Symbol::equals(const ParameterExpression &other) const {
    auto *sym = dynamic_cast<const Symbol *>(&other);
    return sym != nullptr && sym->name_ == name_;
}

uint64_t Symbol::hash() const {
    return fnv_hash_string(fnv_hash_string(FNV_OFFSET, "symbol"), name_);
}

nlohmann::json Symbol::to_json() const { return {{"name", name_}}; }

std::shared_ptr<const ParameterExpression>
Symbol::from_json(const nlohmann::json &j) {
    return std::make_shared<const Symbol>(j.at("name").get<std::string>());
}

// ============================================================================
// LinearExpression
// ============================================================================

LinearExpression::LinearExpression(double constant,
                                   std::map<std::string, double> terms)
    : constant_(constant) {
    for (auto &[name, coeff] : terms) {
        if (coeff != 0.0) {
            terms_.emplace(name, coeff);
        }
    }
}

bool LinearExpression::equals(const ParameterExpression &other) const {
    auto *lin = dynamic_cast<const LinearExpression *>(&other);
    return lin != nullptr && lin->constant_ == constant_ &&
           lin->terms_ == terms_;
}

uint64_t LinearExpression::hash() const {
    uint64_t h = fnv_hash_string(FNV_OFFSET, "linear");
    h = fnv_hash_double(h, constant_);
    for (const auto &[name, coeff] : terms_) {
        h = fnv_hash_string(h, name);
        h = fnv_hash_double(h, coeff);
    }
    return h;
}

std::string LinearExpression::to_string() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto &[name, coeff] : terms_) {
        if (!first)
            oss << " + ";
        if (coeff != 1.0)
            oss << coeff << "*";
        oss << name;
        first = false;
    }
    if (first || constant_ != 0.0) {
        if (!first)
            oss << " + ";
        oss << constant_;
    }
    return oss.str();
}

nlohmann::json LinearExpression::to_json() const {
    nlohmann::json terms = nlohmann::json::object();
    for (const auto &[name, coeff] : terms_) {
        terms[name] = coeff;
    }
    return {{"constant", constant_}, {"terms", terms}};
}

std::shared_ptr<const ParameterExpression>
LinearExpression::from_json(const nlohmann::json &j) {
    std::map<std::string, double> terms;
    for (auto &[name, coeff] : j.at("terms").items()) {
        terms[name] = coeff.get<double>();
    }
    return std::make_shared<const LinearExpression>(
        j.at("constant").get<double>(), std::move(terms));
}

// ============================================================================
// Param comparison
// ============================================================================

bool relative_eq(double a, double b, double max_relative) {
    if (a == b) // also covers matching infinities
        return true;
    if (std::isinf(a) || std::isinf(b))
        return false;

    double diff = std::abs(a - b);
    if (diff <= DBL_EPSILON)
        return true;

    double largest = std::max(std::abs(a), std::abs(b));
    return diff <= largest * max_relative;
}

bool param_eq_tolerant(const Param &a, const Param &b) {
    if (a.index() != b.index())
        return false;

    switch (param_kind(a)) {
    case ParamKind::Float:
        return relative_eq(std::get<double>(a), std::get<double>(b));
    case ParamKind::Expression: {
        const auto &ea = std::get<ExpressionRef>(a);
        const auto &eb = std::get<ExpressionRef>(b);
        if (ea == eb)
            return true;
        return ea && eb && ea->equals(*eb);
    }
    case ParamKind::Object: {
        const auto &oa = std::get<ObjectRef>(a);
        const auto &ob = std::get<ObjectRef>(b);
        if (oa == ob)
            return true;
        return oa && ob && oa->equals(*ob);
    }
    }
    return false;
}

bool params_eq_tolerant(const ParamList &a, const ParamList &b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!param_eq_tolerant(a[i], b[i]))
            return false;
    }
    return true;
}

bool param_eq_exact(const Param &a, const Param &b) {
    if (is_float(a) && is_float(b))
        return std::get<double>(a) == std::get<double>(b);
    return param_eq_tolerant(a, b);
}

bool params_eq_exact(const ParamList &a, const ParamList &b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!param_eq_exact(a[i], b[i]))
            return false;
    }
    return true;
}

bool is_parameterized(const ParamList &params) {
    return std::any_of(params.begin(), params.end(),
                       [](const Param &p) { return is_expression(p); });
}

Param deep_copy_param(const Param &p) {
    if (auto *obj = std::get_if<ObjectRef>(&p)) {
        return *obj ? Param((*obj)->deep_copy()) : p;
    }
    return p;
}

ParamList deep_copy_params(const ParamList &params) {
    ParamList result;
    result.reserve(params.size());
    for (const auto &p : params) {
        result.push_back(deep_copy_param(p));
    }
    return result;
}

std::string param_repr(const Param &p) {
    switch (param_kind(p)) {
    case ParamKind::Float: {
        std::ostringstream oss;
        oss.precision(17);
        oss << std::get<double>(p);
        return oss.str();
    }
    case ParamKind::Expression: {
        const auto &e = std::get<ExpressionRef>(p);
        return e ? e->to_string() : "None";
    }
    case ParamKind::Object: {
        const auto &o = std::get<ObjectRef>(p);
        return o ? o->to_string() : "None";
    }
    }
    return "?";
}

std::string params_repr(const ParamList &params) {
    std::string out = "[";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += param_repr(params[i]);
    }
    return out + "]";
}

ExpressionRef make_symbol(const std::string &name) {
    return std::make_shared<const Symbol>(name);
}

} // namespace qdag
