/// @file test_diff.cpp
/// @brief Unit tests for the tree differ, object reconciler and comparator.

#include <jsondelta/jsondelta.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <system_error>

using namespace jsondelta;

namespace {

const Delta* property(const Delta& d, std::string_view name) {
    const auto* obj = d.get_if<ObjectDelta>();
    if (!obj) return nullptr;
    for (const auto& [n, child] : obj->properties)
        if (n == name) return &child;
    return nullptr;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Scalars and kind changes
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Diff, EqualDocumentsHaveNoDelta) {
    auto doc = parse(R"({"a":[1,{"b":null}],"c":"x"})");
    EXPECT_FALSE(diff(doc, doc).has_value());
    EXPECT_FALSE(diff(parse("42"), parse("42")).has_value());
}

TEST(Diff, ScalarChangeIsModified) {
    auto d = diff(parse("1"), parse("2"));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, Delta(Modified{JsonValue(1), JsonValue(2)}));
}

TEST(Diff, KindChangeIsModified) {
    auto d = diff(parse(R"({"a":1})"), parse("[1]"));
    ASSERT_TRUE(d.has_value());
    EXPECT_TRUE(d->is<Modified>());

    d = diff(parse("null"), parse("false"));
    ASSERT_TRUE(d.has_value());
    EXPECT_TRUE(d->is<Modified>());

    d = diff(parse(R"("1")"), parse("1"));
    ASSERT_TRUE(d.has_value());
    EXPECT_TRUE(d->is<Modified>());
}

TEST(Diff, IntegerAndFloatOfSameValueAreEqual) {
    EXPECT_FALSE(diff(parse("1"), parse("1.0")).has_value());
    EXPECT_TRUE(diff(parse("1"), parse("1.5")).has_value());
}

TEST(Diff, NumericEpsilon) {
    DiffOptions opts;
    opts.numeric_epsilon = 0.01;
    EXPECT_FALSE(diff(parse("1.000"), parse("1.005"), opts).has_value());
    EXPECT_TRUE(diff(parse("1.000"), parse("1.05"), opts).has_value());
    EXPECT_FALSE(diff(parse("[1.0,2.0]"), parse("[1.001,2.0]"), opts).has_value());
}

TEST(Diff, LargeIntegersCompareExactly) {
    EXPECT_TRUE(diff(parse("9007199254740993"), parse("9007199254740992")).has_value());
    EXPECT_TRUE(diff(parse("18446744073709551615"), parse("18446744073709551614")).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Objects
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Diff, ObjectAddRemoveModify) {
    auto d = diff(parse(R"({"keep":1,"gone":true,"edit":"a"})"),
                  parse(R"({"keep":1,"edit":"b","new":[1]})"));
    ASSERT_TRUE(d.has_value());
    const auto* obj = d->get_if<ObjectDelta>();
    ASSERT_NE(obj, nullptr);
    ASSERT_EQ(obj->properties.size(), 3u);

    // Left order first, then right-only names.
    EXPECT_EQ(obj->properties[0].first, "gone");
    EXPECT_EQ(obj->properties[0].second, Delta(Removed{JsonValue(true)}));
    EXPECT_EQ(obj->properties[1].first, "edit");
    EXPECT_EQ(obj->properties[1].second, Delta(Modified{JsonValue("a"), JsonValue("b")}));
    EXPECT_EQ(obj->properties[2].first, "new");
    EXPECT_EQ(obj->properties[2].second, Delta(Added{parse("[1]")}));
}

TEST(Diff, ObjectKeyOrderIsIgnored) {
    EXPECT_FALSE(diff(parse(R"({"a":1,"b":{"x":1,"y":2}})"),
                      parse(R"({"b":{"y":2,"x":1},"a":1})")).has_value());
}

TEST(Diff, NestedObjectsOnlyCarryChanges) {
    auto d = diff(parse(R"({"a":{"b":{"c":1,"d":2}},"e":3})"),
                  parse(R"({"a":{"b":{"c":1,"d":5}},"e":3})"));
    ASSERT_TRUE(d.has_value());
    const Delta* a = property(*d, "a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(property(*d, "e"), nullptr);
    const Delta* b = property(*a, "b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(property(*b, "c"), nullptr);
    ASSERT_NE(property(*b, "d"), nullptr);
    EXPECT_EQ(*property(*b, "d"), Delta(Modified{JsonValue(2), JsonValue(5)}));
}

TEST(Diff, NullPropertyValuesAreValues) {
    auto d = diff(parse(R"({"a":null})"), parse(R"({})"));
    ASSERT_TRUE(d.has_value());
    ASSERT_NE(property(*d, "a"), nullptr);
    EXPECT_EQ(*property(*d, "a"), Delta(Removed{JsonValue(nullptr)}));
}

TEST(Diff, PropertyFilter) {
    DiffOptions opts;
    opts.property_filter = [](std::string_view name, const JsonValue&, const JsonValue&) {
        return name.empty() || name[0] != '$';
    };
    auto left = parse(R"({"$ts":1,"v":1,"list":[{"$ts":1,"x":1}]})");
    auto right = parse(R"({"$ts":2,"v":1,"list":[{"$ts":9,"x":1}],"$new":0})");
    EXPECT_FALSE(diff(left, right, opts).has_value());

    right["v"] = JsonValue(2);
    auto d = diff(left, right, opts);
    ASSERT_TRUE(d.has_value());
    ASSERT_EQ(d->get_if<ObjectDelta>()->properties.size(), 1u);
    EXPECT_NE(property(*d, "v"), nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Limits and purity
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Diff, InputsAreNotModified) {
    auto left = parse(R"({"a":[1,2,3],"b":{"c":1}})");
    auto right = parse(R"({"a":[3,1],"b":{"c":2},"d":4})");
    const auto left_copy = left;
    const auto right_copy = right;
    (void)diff(left, right);
    EXPECT_EQ(left, left_copy);
    EXPECT_EQ(right, right_copy);
}

TEST(Diff, DepthLimit) {
    const int levels = JSONDELTA_MAX_DEPTH + 5;
    std::string deep_left, deep_right;
    for (int i = 0; i < levels; ++i) {
        deep_left += R"({"a":)";
        deep_right += R"({"a":)";
    }
    deep_left += "1";
    deep_right += "2";
    deep_left.append(static_cast<size_t>(levels), '}');
    deep_right.append(static_cast<size_t>(levels), '}');

    ParseOptions popts;
    popts.max_depth = static_cast<size_t>(levels) + 1;
    auto left = parse(deep_left, popts);
    auto right = parse(deep_right, popts);
    try {
        (void)diff(left, right);
        FAIL() << "expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::max_depth_exceeded));
    }
}

TEST(Diff, DeltaKindNames) {
    EXPECT_STREQ(Delta().kind_name(), "unchanged");
    EXPECT_STREQ(Delta(Added{JsonValue(1)}).kind_name(), "added");
    EXPECT_STREQ(Delta(ArrayDelta{}).kind_name(), "array");
}
