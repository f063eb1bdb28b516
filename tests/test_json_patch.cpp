/// @file test_json_patch.cpp
/// @brief Unit tests for the RFC 6902 JSON Patch applier.

#include <jsondelta/jsondelta.hpp>

#include <gtest/gtest.h>

#include <string>
#include <system_error>

using namespace jsondelta;

namespace {

JsonValue applied(const char* doc, const char* ops) {
    auto v = parse(doc);
    apply_json_patch(v, parse(ops));
    return v;
}

std::error_code failure(const char* doc, const char* ops) {
    auto v = parse(doc);
    const auto before = v;
    auto ec = try_apply_json_patch(v, parse(ops));
    EXPECT_EQ(v, before) << "document changed by a failed patch";
    return ec;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Operations (RFC 6902 appendix A)
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonPatch, AddObjectMember) {
    EXPECT_EQ(applied(R"({"foo":"bar"})", R"([{"op":"add","path":"/baz","value":"qux"}])"),
              parse(R"({"baz":"qux","foo":"bar"})"));
}

TEST(JsonPatch, AddArrayElement) {
    EXPECT_EQ(applied(R"({"foo":["bar","baz"]})", R"([{"op":"add","path":"/foo/1","value":"qux"}])"),
              parse(R"({"foo":["bar","qux","baz"]})"));
    EXPECT_EQ(applied("[1,2]", R"([{"op":"add","path":"/-","value":3}])"), parse("[1,2,3]"));
    EXPECT_EQ(applied("[1,2]", R"([{"op":"add","path":"/2","value":3}])"), parse("[1,2,3]"));
}

TEST(JsonPatch, AddReplacesWholeDocument) {
    EXPECT_EQ(applied(R"({"a":1})", R"([{"op":"add","path":"","value":[1]}])"), parse("[1]"));
}

TEST(JsonPatch, RemoveMemberAndElement) {
    EXPECT_EQ(applied(R"({"baz":"qux","foo":"bar"})", R"([{"op":"remove","path":"/baz"}])"),
              parse(R"({"foo":"bar"})"));
    EXPECT_EQ(applied(R"({"foo":["bar","qux","baz"]})", R"([{"op":"remove","path":"/foo/1"}])"),
              parse(R"({"foo":["bar","baz"]})"));
}

TEST(JsonPatch, Replace) {
    EXPECT_EQ(applied(R"({"baz":"qux","foo":"bar"})", R"([{"op":"replace","path":"/baz","value":"boo"}])"),
              parse(R"({"baz":"boo","foo":"bar"})"));
    EXPECT_EQ(applied("5", R"([{"op":"replace","path":"","value":6}])"), parse("6"));
}

TEST(JsonPatch, MoveValue) {
    EXPECT_EQ(applied(R"({"foo":{"bar":"baz","waldo":"fred"},"qux":{"corge":"grault"}})",
                      R"([{"op":"move","from":"/foo/waldo","path":"/qux/thud"}])"),
              parse(R"({"foo":{"bar":"baz"},"qux":{"corge":"grault","thud":"fred"}})"));
    EXPECT_EQ(applied(R"({"foo":["all","grass","cows","eat"]})",
                      R"([{"op":"move","from":"/foo/1","path":"/foo/3"}])"),
              parse(R"({"foo":["all","cows","eat","grass"]})"));
    EXPECT_EQ(applied("[1,2]", R"([{"op":"move","from":"/0","path":"/0"}])"), parse("[1,2]"));
}

TEST(JsonPatch, CopyValue) {
    EXPECT_EQ(applied(R"({"a":{"b":[1]}})", R"([{"op":"copy","from":"/a/b","path":"/c"}])"),
              parse(R"({"a":{"b":[1]},"c":[1]})"));
}

TEST(JsonPatch, TestValue) {
    EXPECT_EQ(applied(R"({"baz":"qux","foo":["a",2,"c"]})",
                      R"([{"op":"test","path":"/baz","value":"qux"},{"op":"test","path":"/foo/1","value":2}])"),
              parse(R"({"baz":"qux","foo":["a",2,"c"]})"));
    EXPECT_EQ(failure(R"({"baz":"qux"})", R"([{"op":"test","path":"/baz","value":"bar"}])"),
              make_error_code(errc::patch_test_failed));
}

TEST(JsonPatch, EscapedPaths) {
    EXPECT_EQ(applied(R"({"/":9,"~1":10})",
                      R"([{"op":"test","path":"/~01","value":10},{"op":"replace","path":"/~1","value":0}])"),
              parse(R"({"/":0,"~1":10})"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonPatch, Errors) {
    EXPECT_EQ(failure(R"({"foo":"bar"})", R"([{"op":"add","path":"/baz/bat","value":"qux"}])"),
              make_error_code(errc::patch_path_not_found));
    EXPECT_EQ(failure("[1]", R"([{"op":"add","path":"/5","value":0}])"),
              make_error_code(errc::patch_index_out_of_range));
    EXPECT_EQ(failure("[1]", R"([{"op":"remove","path":"/1"}])"),
              make_error_code(errc::patch_index_out_of_range));
    EXPECT_EQ(failure(R"({"a":1})", R"([{"op":"remove","path":"/b"}])"),
              make_error_code(errc::patch_path_not_found));
    EXPECT_EQ(failure(R"({"a":1})", R"([{"op":"replace","path":"/b","value":0}])"),
              make_error_code(errc::patch_path_not_found));
    EXPECT_EQ(failure(R"({"a":1})", R"([{"op":"add","path":"/a/b","value":0}])"),
              make_error_code(errc::patch_type_mismatch));
    EXPECT_EQ(failure(R"({"a":{"b":1}})", R"([{"op":"move","from":"/a","path":"/a/b/c"}])"),
              make_error_code(errc::invalid_patch_operation));
    EXPECT_EQ(failure("{}", R"([{"op":"remove","path":""}])"),
              make_error_code(errc::invalid_patch_operation));
}

TEST(JsonPatch, MalformedOperations) {
    EXPECT_EQ(failure("{}", R"({"op":"add"})"), make_error_code(errc::invalid_patch_operation));
    EXPECT_EQ(failure("{}", R"([{"op":"frobnicate","path":"/a"}])"),
              make_error_code(errc::invalid_patch_operation));
    EXPECT_EQ(failure("{}", R"([{"path":"/a","value":1}])"),
              make_error_code(errc::invalid_patch_operation));
    EXPECT_EQ(failure("{}", R"([{"op":"add","path":"/a"}])"),
              make_error_code(errc::invalid_patch_operation));
    EXPECT_EQ(failure("{}", R"([{"op":"add","path":"a","value":1}])"),
              make_error_code(errc::invalid_patch_operation));
    EXPECT_EQ(failure("[]", R"([{"op":"add","path":"/01","value":1}])"),
              make_error_code(errc::patch_path_not_found));
}

TEST(JsonPatch, FailureLeavesDocumentUnchanged) {
    auto doc = parse(R"({"a":1,"list":[1,2]})");
    const auto before = doc;
    const auto ops = parse(R"([
        {"op":"replace","path":"/a","value":2},
        {"op":"add","path":"/list/-","value":3},
        {"op":"remove","path":"/missing"}])");
    try {
        apply_json_patch(doc, ops);
        FAIL() << "expected PatchError";
    } catch (const PatchError& e) {
        EXPECT_EQ(e.path(), "/missing");
        EXPECT_NE(std::string(e.what()).find("operation 2"), std::string::npos);
    }
    EXPECT_EQ(doc, before);
}
