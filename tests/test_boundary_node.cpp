#include "qdag_test_utils.hpp"

using namespace qdag;
using qdag::dag::InNode;
using qdag::dag::OutNode;

TEST(BoundaryNode, ConstructionIsDetached) {
    auto q = make_qubit("q", 0);
    InNode in(q);
    OutNode out(q);
    EXPECT_FALSE(in.handle().is_attached());
    EXPECT_FALSE(out.handle().is_attached());
    EXPECT_EQ(in.wire().get(), q.get());
}

TEST(BoundaryNode, AttachedConstructor) {
    InNode in(12, make_clbit("c", 1));
    ASSERT_TRUE(in.handle().is_attached());
    EXPECT_EQ(*in.handle().index(), 12u);
}

TEST(BoundaryNode, NullWireIsRejected) {
    EXPECT_THROW(InNode{WireRef()}, ValueError);
    EXPECT_THROW(OutNode(3, WireRef()), ValueError);
}

TEST(BoundaryNode, EqualityUsesIndexAndWire) {
    InNode a(2, make_qubit("q", 0));
    InNode b(2, make_qubit("q", 0)); // distinct object, equal wire
    InNode c(3, make_qubit("q", 0));
    InNode d(2, make_qubit("q", 1));

    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
    EXPECT_FALSE(a == d);
    EXPECT_EQ(a.hash(), b.hash());
}

TEST(BoundaryNode, WireKindTakesPart) {
    InNode q(0, make_qubit("r", 0));
    InNode c(0, make_clbit("r", 0));
    EXPECT_FALSE(q == c);
}

TEST(BoundaryNode, AnonymousWiresCompareByIdentity) {
    auto w = make_qubit();
    InNode a(w);
    InNode b(w);
    InNode other(make_qubit());
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == other);
}

TEST(BoundaryNode, CrossRoleEqualityIgnoresRole) {
    auto q = make_qubit("q", 0);
    InNode in(5, q);
    OutNode out(5, q);

    EXPECT_TRUE(in == out);
    EXPECT_TRUE(out == in);
    EXPECT_EQ(in.hash(), out.hash());
}

TEST(BoundaryNode, Repr) {
    EXPECT_EQ(InNode(make_qubit("q", 2)).repr(), "DAGInNode(wire=Qubit('q', 2))");
    EXPECT_EQ(OutNode(make_clbit("c", 0)).repr(),
              "DAGOutNode(wire=Clbit('c', 0))");
}
