#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for jsondelta.

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsondelta {

// ─── Forward declarations ───────────────────────────────────────────────
class JsonValue;
class Delta;
struct SerializeOptions;

/// JSON value types
enum class Type : uint8_t {
    Null     = 0,
    Bool     = 1,
    Integer  = 2,
    Float    = 3,
    String   = 4,
    Array    = 5,
    Object   = 6,
    UInteger = 7
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:     return "null";
        case Type::Bool:     return "bool";
        case Type::Integer:  return "integer";
        case Type::Float:    return "float";
        case Type::String:   return "string";
        case Type::Array:    return "array";
        case Type::Object:   return "object";
        case Type::UInteger: return "uinteger";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// JSON array: ordered collection of values.
using Array = std::vector<JsonValue>;

/// @brief JSON object: insertion-ordered key-value pairs.
///
/// Order is significant for output (serialization, delta key order) but not
/// for equality. Lookup is linear below JSONDELTA_OBJECT_INDEX_THRESHOLD
/// entries and goes through a hash index above it. Member mutators keep the
/// index in sync; const lookups never write to it, so a const Object can be
/// read from several threads.
struct Object {
    using storage_type = std::vector<std::pair<std::string, JsonValue>>;
    using size_type = size_t;
    /// Views point into entries[].first. Code that edits entries directly
    /// must call clear() or reindex() afterwards.
    using index_type = std::unordered_map<std::string_view, size_type>;

    storage_type entries;
    std::unique_ptr<index_type> index_;

    // ─── Constructors (defined in value.hpp) ─────────────────────────
    Object() = default;
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// Initializer-list constructor: {{"key", value}, ...}
    Object(std::initializer_list<std::pair<std::string, JsonValue>> init);

    // ─── Capacity ────────────────────────────────────────────────────
    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }
    void reserve(size_type n) { entries.reserve(n); }

    // ─── Iterators ───────────────────────────────────────────────────
    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin() const noexcept { return entries.begin(); }
    auto end()   const noexcept { return entries.end(); }

    // ─── Lookup / mutation (defined after JsonValue in value.hpp) ────
    JsonValue* find(std::string_view key) noexcept;
    const JsonValue* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Access or append an element by key.
    JsonValue& operator[](std::string_view key);

    /// Const access by key. Throws OutOfRangeError if not found.
    const JsonValue& at(std::string_view key) const;

    /// Insert or replace; new keys are appended at the end.
    void insert(std::string key, JsonValue value);

    /// Append without a duplicate check; keeps the hash index in sync.
    void append(std::string key, JsonValue value);

    /// Erase by key, preserving the order of the remaining entries.
    bool erase(std::string_view key);

    void clear() noexcept {
        entries.clear();
        index_.reset();
    }

    /// Rebuild (or drop) the hash index after a direct edit of entries.
    void reindex();

    /// Key-order-insensitive comparison.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    bool use_index() const noexcept {
        return entries.size() >= JSONDELTA_OBJECT_INDEX_THRESHOLD;
    }
    void rebuild_index();
};

} // namespace jsondelta
