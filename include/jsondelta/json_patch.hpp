#pragma once

/// @file json_patch.hpp
/// @brief RFC 6902 JSON Patch applier.
///
/// Supports add, remove, replace, move, copy and test. The operations are
/// applied to a working copy that replaces the document only after every
/// operation succeeded, so a failing patch leaves the document unchanged.

#include "error.hpp"
#include "json_pointer.hpp"
#include "value.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace jsondelta {
namespace detail {

class JsonPatchApplier {
public:
    explicit JsonPatchApplier(JsonValue& doc) noexcept : doc_(doc) {}

    void apply(const JsonValue& operations) {
        if (!operations.is_array())
            throw PatchError(errc::invalid_patch_operation, "JSON patch must be an array", "");
        for (size_t i = 0; i < operations.size(); ++i) {
            index_ = i;
            apply_one(operations.as_array()[i]);
        }
    }

private:
    JsonValue& doc_;
    size_t index_ = 0;

    [[noreturn]] void fail(errc code, const std::string& msg, const std::string& path) const {
        throw PatchError(code, "operation " + std::to_string(index_) + ": " + msg, path);
    }

    const std::string& member(const JsonValue& op, const char* name) const {
        const JsonValue* v = op.find(name);
        if (!v || !v->is_string())
            fail(errc::invalid_patch_operation, std::string("missing string member \"") + name + "\"", "");
        return v->as_string();
    }

    const JsonValue& value_member(const JsonValue& op) const {
        const JsonValue* v = op.find("value");
        if (!v) fail(errc::invalid_patch_operation, "missing member \"value\"", "");
        return *v;
    }

    JsonPointer pointer(const std::string& text) const {
        try {
            return JsonPointer(text);
        } catch (const PointerError& e) {
            fail(errc::invalid_patch_operation, e.what(), text);
        }
    }

    /// Container holding the last token of @p ptr.
    JsonValue& parent_of(const JsonPointer& ptr, const std::string& text) {
        JsonValue* parent = ptr.parent().try_resolve(doc_);
        if (!parent) fail(errc::patch_path_not_found, "parent does not exist", text);
        if (!parent->is_container())
            fail(errc::patch_type_mismatch, std::string("parent is ") + type_name(parent->type()), text);
        return *parent;
    }

    size_t element_index(const JsonValue& array, const std::string& token, bool allow_end,
                         const std::string& text) const {
        auto idx = parse_array_index(token);
        if (!idx) fail(errc::patch_path_not_found, "invalid array index \"" + token + "\"", text);
        const size_t limit = array.size() + (allow_end ? 1 : 0);
        if (*idx >= limit) fail(errc::patch_index_out_of_range, "array index out of range", text);
        return *idx;
    }

    void add(const JsonPointer& ptr, const std::string& text, JsonValue value) {
        if (ptr.empty()) {
            doc_ = std::move(value);
            return;
        }
        JsonValue& parent = parent_of(ptr, text);
        if (parent.is_object()) {
            parent.as_object().insert(ptr.back(), std::move(value));
            return;
        }
        Array& arr = parent.as_array();
        if (ptr.back() == "-") {
            arr.push_back(std::move(value));
            return;
        }
        const size_t idx = element_index(parent, ptr.back(), true, text);
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(idx), std::move(value));
    }

    JsonValue remove(const JsonPointer& ptr, const std::string& text) {
        if (ptr.empty()) fail(errc::invalid_patch_operation, "cannot remove the document root", text);
        JsonValue& parent = parent_of(ptr, text);
        if (parent.is_object()) {
            JsonValue* v = parent.find(ptr.back());
            if (!v) fail(errc::patch_path_not_found, "property does not exist", text);
            JsonValue out = std::move(*v);
            parent.as_object().erase(ptr.back());
            return out;
        }
        Array& arr = parent.as_array();
        const size_t idx = element_index(parent, ptr.back(), false, text);
        JsonValue out = std::move(arr[idx]);
        arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(idx));
        return out;
    }

    JsonValue& existing(const JsonPointer& ptr, const std::string& text) {
        JsonValue* v = ptr.try_resolve(doc_);
        if (!v) fail(errc::patch_path_not_found, "path does not exist", text);
        return *v;
    }

    void apply_one(const JsonValue& op) {
        if (!op.is_object()) fail(errc::invalid_patch_operation, "operation must be an object", "");
        const std::string& name = member(op, "op");
        const std::string& path_text = member(op, "path");
        const JsonPointer path = pointer(path_text);

        if (name == "add") {
            add(path, path_text, value_member(op));
        } else if (name == "remove") {
            remove(path, path_text);
        } else if (name == "replace") {
            existing(path, path_text) = value_member(op);
        } else if (name == "move") {
            const std::string& from_text = member(op, "from");
            const JsonPointer from = pointer(from_text);
            if (from.is_proper_prefix_of(path))
                fail(errc::invalid_patch_operation, "cannot move a value into itself", path_text);
            if (from == path) {
                existing(from, from_text);
                return;
            }
            add(path, path_text, remove(from, from_text));
        } else if (name == "copy") {
            const std::string& from_text = member(op, "from");
            JsonValue copy = existing(pointer(from_text), from_text);
            add(path, path_text, std::move(copy));
        } else if (name == "test") {
            if (existing(path, path_text) != value_member(op))
                fail(errc::patch_test_failed, "value differs", path_text);
        } else {
            fail(errc::invalid_patch_operation, "unknown op \"" + name + "\"", path_text);
        }
    }
};

} // namespace detail

/// @brief Apply an RFC 6902 operation list to @p document.
/// Throws PatchError (with the failing path); @p document is unchanged on failure.
inline void apply_json_patch(JsonValue& document, const JsonValue& operations) {
    JsonValue working = document;
    detail::JsonPatchApplier applier(working);
    applier.apply(operations);
    document = std::move(working);
}

/// @brief apply_json_patch() without exceptions.
[[nodiscard]] inline std::error_code try_apply_json_patch(JsonValue& document,
                                                          const JsonValue& operations) {
    try {
        apply_json_patch(document, operations);
        return {};
    } catch (const std::system_error& e) {
        return e.code();
    }
}

} // namespace jsondelta
