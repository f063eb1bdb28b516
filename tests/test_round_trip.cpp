/// @file test_round_trip.cpp
/// @brief Round-trip properties: every delta and every encoding of it
/// turns the left document into the right one and back.

#include <jsondelta/jsondelta.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace jsondelta;

namespace {

struct Case {
    const char* left;
    const char* right;
};

const Case kCases[] = {
    {"null", "1"},
    {"[]", "[1,2,3]"},
    {"[1,2,3]", "[]"},
    {"[1,2,3]", "[3,2,1]"},
    {"[1,1,2,2]", "[2,1,2,1]"},
    {R"(["a","b","c","d","e"])", R"(["e","a","x","d","b"])"},
    {"[[1,2],[3,4]]", "[[3,4,5],[1]]"},
    {R"({"a":1,"b":{"c":[1,2,{"d":3}]}})", R"({"b":{"c":[{"d":4},2]},"e":[]})"},
    {R"([{"id":1,"v":"a"},{"id":2,"v":"b"},{"id":3,"v":"c"}])",
     R"([{"id":3,"v":"c"},{"id":1,"v":"A"},{"id":4},{"id":2,"v":"b"}])"},
    {R"([{"id":"x","list":[1,2,3]},{"id":"y","list":[]}])",
     R"([{"id":"y","list":[1]},{"id":"x","list":[3,1]}])"},
    {R"({"children":[{"id":"buttons"},{"id":"p1","props":{"content":"Widget"}},
        {"id":"p2","props":{"content":"Gadget"}},{"id":"p3","props":{"content":"Gizmo"}}]})",
     R"({"children":[{"id":"buttons"},{"id":"refreshing"},{"id":"p2","props":{"content":"Widget"}},
        {"id":"p3","props":{"content":"Gadget"}},{"id":"p4","props":{"content":"Gizmo"}}]})"},
    {R"({"a/b":{"m~n":[0]}})", R"({"a/b":{"m~n":[0,1]},"~":null})"},
    {R"([{"k":1},{"k":2}])", R"([{"k":2},{"k":1},{"k":3}])"},
};

/// Checks every round-trip property for one pair of documents.
void check_round_trip(const JsonValue& left, const JsonValue& right, const DiffOptions& opts) {
    const std::string label = left.dump() + " -> " + right.dump();
    auto delta = diff(left, right, opts);
    if (left == right) {
        EXPECT_FALSE(delta.has_value()) << label;
        return;
    }
    ASSERT_TRUE(delta.has_value()) << label;

    // In-memory delta, strict mode.
    auto doc = left;
    patch(doc, delta);
    EXPECT_EQ(doc, right) << label;

    // Undo.
    unpatch(doc, delta);
    EXPECT_EQ(doc, left) << label;

    // Reverse applied to the right document.
    doc = right;
    patch(doc, reverse(*delta));
    EXPECT_EQ(doc, left) << label;

    // Native encoding through its text form.
    const auto native = parse(to_native(*delta).dump());
    doc = left;
    patch(doc, native);
    EXPECT_EQ(doc, right) << label << " via " << native.dump();

    // RFC 6902 operations.
    const auto ops = JsonPatchFormatter{}.format(*delta);
    doc = left;
    apply_json_patch(doc, ops);
    EXPECT_EQ(doc, right) << label << " via " << ops.dump();
}

JsonValue random_array(std::mt19937& rng, bool keyed) {
    std::uniform_int_distribution<int> length(0, 8);
    std::uniform_int_distribution<int> value(0, 5);
    std::uniform_int_distribution<int> coin(0, 3);
    Array out;
    const int n = length(rng);
    for (int i = 0; i < n; ++i) {
        if (!keyed) {
            out.emplace_back(value(rng));
            continue;
        }
        Object o;
        o.append("id", JsonValue(value(rng)));
        if (coin(rng) != 0) o.append("v", JsonValue(value(rng)));
        if (coin(rng) == 0) o.append("tags", JsonValue(Array{JsonValue(value(rng)), JsonValue(value(rng))}));
        out.emplace_back(std::move(o));
    }
    return JsonValue(std::move(out));
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Fixed cases
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RoundTrip, FixedCasesKeyed) {
    const auto opts = DiffOptions::keyed_by("id");
    for (const auto& c : kCases) check_round_trip(parse(c.left), parse(c.right), opts);
}

TEST(RoundTrip, FixedCasesUnkeyed) {
    for (const auto& c : kCases) check_round_trip(parse(c.left), parse(c.right), DiffOptions{});
}

TEST(RoundTrip, FixedCasesMatchedByPosition) {
    DiffOptions opts;
    opts.array_object_item_match_by_position = true;
    for (const auto& c : kCases) check_round_trip(parse(c.left), parse(c.right), opts);
}

TEST(RoundTrip, FixedCasesWithoutMoves) {
    auto opts = DiffOptions::keyed_by("id");
    opts.detect_array_move = false;
    for (const auto& c : kCases) check_round_trip(parse(c.left), parse(c.right), opts);
}

TEST(RoundTrip, IdenticalDocumentsHaveNoOperations) {
    for (const auto& c : kCases) {
        const auto doc = parse(c.left);
        EXPECT_FALSE(diff(doc, doc).has_value());
        EXPECT_FALSE(diff(doc, doc, JsonPatchFormatter{}).has_value());
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Generated arrays
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RoundTrip, GeneratedScalarArrays) {
    std::mt19937 rng(20240611u);
    for (int i = 0; i < 300; ++i) {
        const auto left = random_array(rng, false);
        const auto right = random_array(rng, false);
        check_round_trip(left, right, DiffOptions{});
        if (::testing::Test::HasFailure()) break;
    }
}

TEST(RoundTrip, GeneratedKeyedArrays) {
    std::mt19937 rng(7u);
    const auto opts = DiffOptions::keyed_by("id");
    for (int i = 0; i < 300; ++i) {
        const auto left = random_array(rng, true);
        const auto right = random_array(rng, true);
        check_round_trip(left, right, opts);
        if (::testing::Test::HasFailure()) break;
    }
}

TEST(RoundTrip, GeneratedArraysEditCountIsBounded) {
    std::mt19937 rng(99u);
    for (int i = 0; i < 200; ++i) {
        const auto left = random_array(rng, false);
        const auto right = random_array(rng, false);
        auto d = diff(left, right);
        if (!d) continue;
        const auto* a = d->get_if<ArrayDelta>();
        ASSERT_NE(a, nullptr);
        EXPECT_LE(edit_count(*a), left.size() + right.size());
    }
}
