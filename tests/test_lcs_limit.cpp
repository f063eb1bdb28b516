/// @file test_lcs_limit.cpp
/// @brief Array reconciler behavior when the LCS window exceeds JSONDELTA_LCS_MAX_CELLS.

// Built as its own test executable: the limit is a compile-time setting.
#define JSONDELTA_LCS_MAX_CELLS 4
#include <jsondelta/jsondelta.hpp>

#include <gtest/gtest.h>

using namespace jsondelta;

TEST(LcsLimit, SmallWindowStillUsesLcs) {
    auto d = diff(parse("[1,2,9]"), parse("[1,2,3]"));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(edit_count(*d->get_if<ArrayDelta>()), 2u);
}

TEST(LcsLimit, OversizedWindowDegradesToDeleteAndInsert) {
    auto left = parse("[0,1,2,3,4,5]");
    auto right = parse("[9,5,4,3,2,1,0,8]");
    auto d = diff(left, right);
    ASSERT_TRUE(d.has_value());
    const auto& a = *d->get_if<ArrayDelta>();

    size_t deletes = 0, inserts = 0;
    for (const auto& op : a.ops) {
        EXPECT_FALSE(op.is<Move>());
        EXPECT_FALSE(op.is<Retain>());
        if (op.is<Delete>()) ++deletes;
        if (op.is<Insert>()) ++inserts;
    }
    EXPECT_EQ(deletes, left.size());
    EXPECT_EQ(inserts, right.size());

    patch(left, d);
    EXPECT_EQ(left, right);
}

TEST(LcsLimit, TrimmingHappensBeforeTheLimitApplies) {
    // Long common head and tail, small middle window.
    auto left = parse("[1,2,3,4,5,6,7,8,9,10,11,12]");
    auto right = parse("[1,2,3,4,5,99,7,8,9,10,11,12]");
    auto d = diff(left, right);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(edit_count(*d->get_if<ArrayDelta>()), 2u);
}
