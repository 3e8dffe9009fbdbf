#include "qdag_test_utils.hpp"

#include <complex>

using namespace qdag;
using qdag::testing::TaggedOperation;

TEST(StandardGateCatalog, LookupByName) {
    auto gate = standard_gate_from_name("rx");
    ASSERT_TRUE(gate.has_value());
    EXPECT_EQ(*gate, StandardGate::RX);
    EXPECT_EQ(standard_gate_num_qubits(StandardGate::CCX), 3u);
    EXPECT_EQ(standard_gate_num_params(StandardGate::U), 3u);
    EXPECT_FALSE(standard_gate_from_name("not_a_gate").has_value());
}

TEST(StandardGateCatalog, NamesRoundTrip) {
    for (size_t i = 0; i < kNumStandardGates; ++i) {
        auto gate = static_cast<StandardGate>(i);
        auto found = standard_gate_from_name(standard_gate_name(gate));
        ASSERT_TRUE(found.has_value()) << standard_gate_name(gate);
        EXPECT_EQ(*found, gate);
    }
}

TEST(StandardInstruction, Properties) {
    auto measure = StandardInstruction::measure();
    EXPECT_EQ(measure.name(), "measure");
    EXPECT_EQ(measure.num_clbits(), 1u);
    EXPECT_FALSE(measure.is_directive());

    auto barrier = StandardInstruction::barrier(4);
    EXPECT_EQ(barrier.num_qubits, 4u);
    EXPECT_TRUE(barrier.is_directive());
    EXPECT_NE(barrier, StandardInstruction::barrier(3));

    EXPECT_EQ(StandardInstruction::delay().num_params(), 1u);
}

TEST(StandardGateObject, RejectsWrongParamCount) {
    EXPECT_THROW(StandardGateObject(StandardGate::RX, {}), TypeError);
    EXPECT_THROW(StandardGateObject(StandardGate::H, {0.1}), TypeError);
    EXPECT_NO_THROW(StandardGateObject(StandardGate::U, {0.1, 0.2, 0.3}));
}

TEST(StandardGateObject, CanonicalUntilRenamed) {
    StandardGateObject gate(StandardGate::CX);
    EXPECT_TRUE(gate.is_canonical());
    EXPECT_EQ(gate.num_qubits(), 2u);
    gate.set_name("my_cx");
    EXPECT_FALSE(gate.is_canonical());
}

TEST(Instruction, EqualityIgnoresLabel) {
    Instruction a("foo", 2, 1, {0.5}, std::string("first"));
    Instruction b("foo", 2, 1, {0.5 + 1e-14}, std::string("second"));
    Instruction c("foo", 2, 0, {0.5});
    EXPECT_TRUE(a.equals(b));
    EXPECT_FALSE(a.equals(c));
}

TEST(Instruction, GateAndInstructionNeverEqual) {
    Instruction inst("foo", 1, 0);
    Gate gate("foo", 1);
    EXPECT_FALSE(inst.equals(gate));
    EXPECT_FALSE(gate.equals(inst));
}

TEST(Instruction, DeepCopyIsIndependent) {
    auto original = std::make_shared<Gate>("g", 1, ParamList{0.3});
    auto copy = original->deep_copy();
    ASSERT_NE(copy.get(), original.get());
    EXPECT_TRUE(copy->equals(*original));

    copy->set_name("renamed");
    EXPECT_EQ(original->name(), "g");
    EXPECT_EQ(copy->kind(), OperationKind::Gate);
}

TEST(UnitaryGate, ValidatesMatrix) {
    EXPECT_NO_THROW(UnitaryGate(qdag::testing::pauli_x()));

    Eigen::MatrixXcd not_square(2, 3);
    not_square.setZero();
    EXPECT_THROW(UnitaryGate{not_square}, ValueError);

    Eigen::MatrixXcd wrong_dim = Eigen::MatrixXcd::Identity(3, 3);
    EXPECT_THROW(UnitaryGate{wrong_dim}, ValueError);

    Eigen::MatrixXcd not_unitary(2, 2);
    not_unitary << 1, 1, 0, 1;
    EXPECT_THROW(UnitaryGate{not_unitary}, ValueError);
}

TEST(UnitaryGate, QubitCountFromDimension) {
    UnitaryGate one(qdag::testing::pauli_x());
    EXPECT_EQ(one.num_qubits(), 1u);

    UnitaryGate three(Eigen::MatrixXcd::Identity(8, 8));
    EXPECT_EQ(three.num_qubits(), 3u);
    EXPECT_EQ(three.name(), "unitary");
}

TEST(UnitaryGate, EqualityWithinTolerance) {
    Eigen::MatrixXcd x = qdag::testing::pauli_x();
    Eigen::MatrixXcd nearly_x = x;
    nearly_x(0, 1) += std::complex<double>(1e-12, 0);

    EXPECT_TRUE(UnitaryGate(x).equals(UnitaryGate(nearly_x)));
    EXPECT_FALSE(UnitaryGate(x).equals(UnitaryGate(
        Eigen::MatrixXcd::Identity(2, 2))));
}

TEST(OpaqueOperation, KindAndEquality) {
    TaggedOperation a("custom", "alpha", 2);
    TaggedOperation b("custom", "alpha", 2);
    TaggedOperation c("custom", "beta", 2);
    EXPECT_EQ(a.kind(), OperationKind::Operation);
    EXPECT_TRUE(a.equals(b));
    EXPECT_FALSE(a.equals(c));
}

TEST(OperationObject, Repr) {
    Gate gate("g", 1, {0.5});
    EXPECT_EQ(gate.repr(),
              "Instruction(name='g', num_qubits=1, num_clbits=0, "
              "params=[0.5])");
}
