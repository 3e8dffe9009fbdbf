#include "qdag_test_utils.hpp"

#include <algorithm>
#include <vector>

using qdag::dag::NodeHandle;

TEST(NodeHandle, DefaultIsDetached) {
    NodeHandle handle;
    EXPECT_FALSE(handle.is_attached());
    EXPECT_FALSE(handle.index().has_value());
    EXPECT_EQ(handle.raw_index(), NodeHandle::kDetached);
}

TEST(NodeHandle, AttachAndDetach) {
    NodeHandle handle;
    handle.attach(7);
    ASSERT_TRUE(handle.index().has_value());
    EXPECT_EQ(*handle.index(), 7u);
    EXPECT_EQ(handle.raw_index(), 7);

    handle.detach();
    EXPECT_FALSE(handle.is_attached());
}

TEST(NodeHandle, RawIndexAcceptsSentinel) {
    NodeHandle handle(3);
    handle.set_raw_index(-1);
    EXPECT_FALSE(handle.is_attached());

    handle.set_raw_index(0);
    ASSERT_TRUE(handle.is_attached());
    EXPECT_EQ(*handle.index(), 0u);
}

TEST(NodeHandle, RawIndexRejectsNegative) {
    NodeHandle handle(3);
    EXPECT_THROW(handle.set_raw_index(-2), qdag::ValueError);
    EXPECT_THROW(NodeHandle::from_raw(-100), qdag::ValueError);
    // A rejected value leaves the handle untouched
    EXPECT_EQ(handle.raw_index(), 3);
}

TEST(NodeHandle, ErrorMessageNamesTheValue) {
    try {
        NodeHandle::from_raw(-5);
        FAIL() << "expected ValueError";
    } catch (const qdag::ValueError &e) {
        EXPECT_NE(std::string(e.what()).find("-5"), std::string::npos);
    }
}

TEST(NodeHandle, DetachedSortsFirst) {
    std::vector<NodeHandle> handles = {NodeHandle(5), NodeHandle(),
                                       NodeHandle(0), NodeHandle(2)};
    std::sort(handles.begin(), handles.end());

    EXPECT_FALSE(handles[0].is_attached());
    EXPECT_EQ(handles[1].raw_index(), 0);
    EXPECT_EQ(handles[2].raw_index(), 2);
    EXPECT_EQ(handles[3].raw_index(), 5);

    EXPECT_TRUE(NodeHandle() < NodeHandle(0));
    EXPECT_TRUE(NodeHandle(4) > NodeHandle(1));
}

TEST(NodeHandle, HashFollowsRawIndex) {
    EXPECT_EQ(NodeHandle(9).hash(), NodeHandle::from_raw(9).hash());
    EXPECT_EQ(NodeHandle().hash(), NodeHandle::from_raw(-1).hash());
    EXPECT_NE(NodeHandle(1).hash(), NodeHandle(2).hash());
}

TEST(NodeHandle, AttachRoundTripsAnyIndex) {
    for (size_t i : {size_t(0), size_t(1), size_t(1000), size_t(1) << 40}) {
        NodeHandle handle;
        handle.attach(i);
        EXPECT_EQ(*handle.index(), i);
        handle.detach();
        EXPECT_FALSE(handle.index().has_value());
    }
}
