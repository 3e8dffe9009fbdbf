#pragma once

#include <gtest/gtest.h>
#include <memory>
#include <qdag/qdag.hpp>
#include <string>
#include <vector>

namespace qdag {
namespace testing {

// ============================================================================
// Externally defined kinds used across tests
// ============================================================================

// Opaque operation defined outside the library
class TaggedOperation : public OperationObject {
  public:
    TaggedOperation(std::string name, std::string tag, uint32_t num_qubits)
        : name_(std::move(name)), tag_(std::move(tag)),
          num_qubits_(num_qubits) {}

    std::string type_name() const override { return "test.tagged"; }
    const std::string &name() const override { return name_; }
    void set_name(const std::string &name) override { name_ = name; }
    uint32_t num_qubits() const override { return num_qubits_; }
    uint32_t num_clbits() const override { return 0; }

    const std::string &tag() const { return tag_; }
    void set_tag(const std::string &tag) { tag_ = tag; }

    bool equals(const OperationObject &other) const override {
        auto *o = dynamic_cast<const TaggedOperation *>(&other);
        return o != nullptr && o->name_ == name_ && o->tag_ == tag_ &&
               o->num_qubits_ == num_qubits_;
    }

    OperationRef deep_copy() const override {
        return std::make_shared<TaggedOperation>(name_, tag_, num_qubits_);
    }

    nlohmann::json to_json() const override {
        return {{"name", name_}, {"tag", tag_}, {"num_qubits", num_qubits_}};
    }

    static OperationRef from_json(const nlohmann::json &j) {
        return std::make_shared<TaggedOperation>(
            j.at("name").get<std::string>(), j.at("tag").get<std::string>(),
            j.at("num_qubits").get<uint32_t>());
    }

  private:
    std::string name_;
    std::string tag_;
    uint32_t num_qubits_;
};

// Opaque, mutable parameter object
class Duration : public ParamObject {
  public:
    Duration(double value, std::string unit)
        : value_(value), unit_(std::move(unit)) {}

    double value() const { return value_; }
    void set_value(double value) { value_ = value; }

    std::string type_name() const override { return "test.duration"; }

    bool equals(const ParamObject &other) const override {
        auto *o = dynamic_cast<const Duration *>(&other);
        return o != nullptr && o->value_ == value_ && o->unit_ == unit_;
    }

    std::shared_ptr<ParamObject> deep_copy() const override {
        return std::make_shared<Duration>(value_, unit_);
    }

    std::string to_string() const override {
        return std::to_string(value_) + unit_;
    }

    nlohmann::json to_json() const override {
        return {{"value", value_}, {"unit", unit_}};
    }

    static ObjectRef from_json(const nlohmann::json &j) {
        return std::make_shared<Duration>(j.at("value").get<double>(),
                                          j.at("unit").get<std::string>());
    }

  private:
    double value_;
    std::string unit_;
};

// ============================================================================
// Global environment: registers codecs once
// ============================================================================

class QdagEnvironment : public ::testing::Environment {
  public:
    void SetUp() override {
        io::Codec::initialize_builtin_types();
        io::Codec::register_operation_type("test.tagged",
                                           &TaggedOperation::from_json);
        io::Codec::register_object_type("test.duration", &Duration::from_json);
    }
};

// ============================================================================
// Slow-test helpers
// ============================================================================

#define SKIP_IF_SLOW_TESTS_DISABLED()                                          \
    do {                                                                       \
        if (!qdag::system::should_run_slow_tests()) {                          \
            GTEST_SKIP() << "slow tests disabled";                             \
        }                                                                      \
    } while (0)

// ============================================================================
// Builders
// ============================================================================

inline OperationRef rx(double theta) {
    return std::make_shared<StandardGateObject>(StandardGate::RX,
                                                ParamList{theta});
}

inline OperationRef native(StandardGate gate, ParamList params = {}) {
    return std::make_shared<StandardGateObject>(gate, std::move(params));
}

inline OperationRef measure() {
    return std::make_shared<StandardInstructionObject>(
        StandardInstruction::measure());
}

inline Eigen::MatrixXcd pauli_x() {
    Eigen::MatrixXcd m(2, 2);
    m << 0, 1, 1, 0;
    return m;
}

// Attached copy of a node
template <typename Node> Node attached(Node node, size_t index) {
    node.handle().attach(index);
    return node;
}

} // namespace testing
} // namespace qdag
