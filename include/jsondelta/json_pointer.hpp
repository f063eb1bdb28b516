#pragma once

/// @file json_pointer.hpp
/// @brief JSON Pointer (RFC 6901): token escaping, parsing and resolution.
///
///   "" -> root document
///   "/foo" -> key "foo"
///   "/foo/0" -> first element of array "foo"
///   "/a~1b" -> key "a/b" (~ encoding: ~0 = ~, ~1 = /)
///
/// The differ and formatters only need escape_token(); the JsonPointer class
/// is used by the RFC 6902 applier and by tests to address documents.

#include "error.hpp"
#include "value.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsondelta {

/// @brief Escape a reference token: ~ -> ~0, / -> ~1.
[[nodiscard]] inline std::string escape_token(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '~') result += "~0";
        else if (c == '/') result += "~1";
        else result += c;
    }
    return result;
}

/// @brief Append an escaped reference token to @p out without a temporary.
inline void append_escaped_token(std::string& out, std::string_view s) {
    for (char c : s) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out += c;
    }
}

/// @brief Unescape a reference token: ~1 -> /, ~0 -> ~.
/// Throws PointerError on a '~' not followed by '0' or '1'.
[[nodiscard]] inline std::string unescape_token(std::string_view sv) {
    std::string result;
    result.reserve(sv.size());
    for (size_t i = 0; i < sv.size(); ++i) {
        if (sv[i] != '~') { result += sv[i]; continue; }
        if (i + 1 < sv.size() && sv[i + 1] == '1') { result += '/'; ++i; continue; }
        if (i + 1 < sv.size() && sv[i + 1] == '0') { result += '~'; ++i; continue; }
        throw PointerError("JSON pointer: invalid escape in token \"" + std::string(sv) + "\"");
    }
    return result;
}

/// @brief Parse an array index token ("0", "17"; no sign, no leading zeros).
/// @return nullopt for anything that is not a canonical decimal index.
[[nodiscard]] inline std::optional<size_t> parse_array_index(std::string_view tok) noexcept {
    if (tok.empty() || (tok.size() > 1 && tok[0] == '0')) return std::nullopt;
    size_t idx = 0;
    auto [p, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), idx);
    if (ec != std::errc{} || p != tok.data() + tok.size()) return std::nullopt;
    return idx;
}

/// @brief JSON Pointer (RFC 6901) for navigating JSON documents.
class JsonPointer {
public:
    /// Construct empty pointer (references root document).
    JsonPointer() = default;

    /// Construct from RFC 6901 string (e.g. "/foo/bar/0").
    explicit JsonPointer(std::string_view ptr) {
        if (ptr.empty()) return;
        if (ptr[0] != '/')
            throw PointerError("JSON pointer must start with '/' or be empty: \"" +
                               std::string(ptr) + "\"");
        ptr.remove_prefix(1);
        for (;;) {
            auto pos = ptr.find('/');
            tokens_.push_back(unescape_token(ptr.substr(0, pos)));
            if (pos == std::string_view::npos) break;
            ptr.remove_prefix(pos + 1);
        }
    }

    /// Resolve pointer against a JSON value (const). Throws on failure.
    const JsonValue& resolve(const JsonValue& root) const {
        const JsonValue* cur = &root;
        for (size_t i = 0; i < tokens_.size(); ++i) {
            const auto& tok = tokens_[i];
            if (cur->is_object()) {
                auto* p = cur->find(tok);
                if (!p)
                    throw OutOfRangeError("JSON pointer: key not found \"" + tok +
                                          "\" in " + prefix(i), errc::key_not_found);
                cur = p;
            } else if (cur->is_array()) {
                auto idx = parse_array_index(tok);
                if (!idx || *idx >= cur->size())
                    throw OutOfRangeError("JSON pointer: array index \"" + tok +
                                          "\" out of range in " + prefix(i));
                cur = &cur->as_array()[*idx];
            } else {
                throw TypeError("JSON pointer: cannot index into " +
                                std::string(type_name(cur->type())) + " at " + prefix(i));
            }
        }
        return *cur;
    }

    /// Resolve pointer against a JSON value (mutable).
    JsonValue& resolve(JsonValue& root) const {
        return const_cast<JsonValue&>(
            static_cast<const JsonPointer*>(this)->resolve(
                static_cast<const JsonValue&>(root)));
    }

    /// Try to resolve without exceptions; returns nullptr if path doesn't exist.
    const JsonValue* try_resolve(const JsonValue& root) const noexcept {
        const JsonValue* cur = &root;
        for (const auto& tok : tokens_) {
            if (cur->is_object()) {
                cur = cur->find(tok);
                if (!cur) return nullptr;
            } else if (cur->is_array()) {
                auto idx = parse_array_index(tok);
                if (!idx || *idx >= cur->size()) return nullptr;
                cur = &cur->as_array()[*idx];
            } else {
                return nullptr;
            }
        }
        return cur;
    }

    JsonValue* try_resolve(JsonValue& root) const noexcept {
        return const_cast<JsonValue*>(
            try_resolve(static_cast<const JsonValue&>(root)));
    }

    /// Append a token (returns new pointer).
    [[nodiscard]] JsonPointer append(std::string_view token) const {
        JsonPointer p(*this);
        p.tokens_.emplace_back(token);
        return p;
    }

    [[nodiscard]] JsonPointer append(size_t index) const {
        return append(std::to_string(index));
    }

    /// Get parent pointer (empty if already root).
    [[nodiscard]] JsonPointer parent() const {
        JsonPointer p(*this);
        if (!p.tokens_.empty()) p.tokens_.pop_back();
        return p;
    }

    /// Last reference token. Precondition: !empty().
    [[nodiscard]] const std::string& back() const { return tokens_.back(); }

    [[nodiscard]] bool empty() const noexcept { return tokens_.empty(); }
    [[nodiscard]] size_t depth() const noexcept { return tokens_.size(); }

    /// Serialize back to RFC 6901 string.
    [[nodiscard]] std::string to_string() const { return prefix(tokens_.size()); }

    [[nodiscard]] const std::vector<std::string>& tokens() const noexcept {
        return tokens_;
    }

    /// True if this pointer is a proper prefix of @p other.
    [[nodiscard]] bool is_proper_prefix_of(const JsonPointer& other) const noexcept {
        if (tokens_.size() >= other.tokens_.size()) return false;
        for (size_t i = 0; i < tokens_.size(); ++i)
            if (tokens_[i] != other.tokens_[i]) return false;
        return true;
    }

    bool operator==(const JsonPointer& o) const { return tokens_ == o.tokens_; }
    bool operator!=(const JsonPointer& o) const { return tokens_ != o.tokens_; }

private:
    std::vector<std::string> tokens_;

    std::string prefix(size_t n) const {
        std::string result;
        for (size_t i = 0; i < n; ++i) {
            result += '/';
            append_escaped_token(result, tokens_[i]);
        }
        return result;
    }
};

/// Convenience: resolve pointer string against a value.
inline const JsonValue& resolve(const JsonValue& root, std::string_view pointer) {
    return JsonPointer(pointer).resolve(root);
}

inline JsonValue& resolve(JsonValue& root, std::string_view pointer) {
    return JsonPointer(pointer).resolve(root);
}

} // namespace jsondelta
