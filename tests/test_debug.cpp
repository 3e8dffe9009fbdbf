#include "qdag_test_utils.hpp"

#include <algorithm>

using namespace qdag;
using namespace qdag::dag;

namespace {

class TracerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        trace::clear();
        trace::enable();
    }

    void TearDown() override {
        trace::disable();
        trace::clear();
    }

    static bool has_event(const std::string &op_name) {
        auto events = trace::Tracer::instance().events();
        return std::any_of(events.begin(), events.end(),
                           [&op_name](const trace::TraceEvent &e) {
                               return e.op_name == op_name;
                           });
    }
};

} // namespace

TEST_F(TracerTest, RecordsSnapshotAndRestore) {
    DAGNode node = qdag::testing::attached(
        OpNode(qdag::testing::rx(0.5), {make_qubit("q", 0)}), 7);
    auto restored = restore(snapshot(node));
    (void)restored;

    EXPECT_TRUE(has_event("snapshot"));
    EXPECT_TRUE(has_event("restore"));

    auto events = trace::Tracer::instance().events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().op_name, "snapshot");
    EXPECT_EQ(events.front().node_index, 7);
}

TEST_F(TracerTest, RecordsDeepCopyAndSetOp) {
    OpNode node(qdag::testing::rx(0.5), {make_qubit("q", 0)});
    auto copy = node.duplicate(true);
    EXPECT_TRUE(has_event("deep_copy"));
    EXPECT_FALSE(has_event("set_op"));

    copy.set_op(qdag::testing::native(StandardGate::H));
    EXPECT_TRUE(has_event("set_op"));
}

TEST_F(TracerTest, ShallowCopyIsNotTraced) {
    OpNode node(qdag::testing::native(StandardGate::X), {make_qubit("q", 0)});
    auto copy = node.duplicate(false);
    (void)copy;
    EXPECT_TRUE(trace::Tracer::instance().events().empty());
}

TEST_F(TracerTest, DumpListsEvents) {
    DAGNode node = InNode(make_qubit("q", 3));
    auto snap = snapshot(node);
    (void)snap;

    auto text = trace::dump();
    EXPECT_NE(text.find("1 events"), std::string::npos);
    EXPECT_NE(text.find("snapshot"), std::string::npos);
    EXPECT_NE(text.find("Detached nodes: 1 / 1"), std::string::npos);
}

TEST_F(TracerTest, ClearAndDisable) {
    DAGNode node = InNode(make_qubit("q", 0));
    (void)snapshot(node);
    EXPECT_FALSE(trace::Tracer::instance().events().empty());

    trace::clear();
    EXPECT_TRUE(trace::Tracer::instance().events().empty());

    trace::disable();
    EXPECT_FALSE(trace::is_enabled());
    (void)snapshot(node);
    EXPECT_TRUE(trace::Tracer::instance().events().empty());
}

TEST_F(TracerTest, EnablingMidScopeMeasuresFromScopeStart) {
    trace::disable();
    {
        trace::ScopedTrace scope("late_enable");
        trace::enable();
    }
    auto events = trace::Tracer::instance().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].op_name, "late_enable");
    EXPECT_LT(events[0].duration, std::chrono::minutes(1));
}
