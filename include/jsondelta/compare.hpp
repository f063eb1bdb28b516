#pragma once

/// @file compare.hpp
/// @brief Scalar comparator and deep equality under DiffOptions.
///
/// The differ classifies values by kind, where integer, unsigned and float
/// values are all one "number" kind. Numbers compare exactly unless a
/// numeric epsilon is configured; objects compare without regard to key
/// order; the property filter also applies to deep equality so that filtered
/// properties never make two elements differ.

#include "options.hpp"
#include "value.hpp"

#include <cmath>
#include <cstdint>

namespace jsondelta {

/// @brief Kinds seen by the differ (all numbers collapse into one).
enum class Kind : uint8_t { Null, Bool, Number, String, Array, Object };

[[nodiscard]] inline Kind kind_of(const JsonValue& v) noexcept {
    switch (v.type()) {
        case Type::Null:     return Kind::Null;
        case Type::Bool:     return Kind::Bool;
        case Type::Integer:
        case Type::UInteger:
        case Type::Float:    return Kind::Number;
        case Type::String:   return Kind::String;
        case Type::Array:    return Kind::Array;
        case Type::Object:   return Kind::Object;
    }
    return Kind::Null;
}

[[nodiscard]] inline bool is_container(Kind k) noexcept {
    return k == Kind::Array || k == Kind::Object;
}

namespace detail {

inline bool numbers_equal(const JsonValue& a, const JsonValue& b, double epsilon) {
    if (epsilon <= 0.0) {
        if (!a.is_float() && !b.is_float()) {
            if (a.type() != b.type()) return false;
            return a.is_integer() ? a.as_integer() == b.as_integer()
                                  : a.as_uinteger() == b.as_uinteger();
        }
        return a.as_float() == b.as_float();
    }
    return std::fabs(a.as_float() - b.as_float()) <= epsilon;
}

} // namespace detail

/// @brief Equality of two scalars of the same kind.
[[nodiscard]] inline bool scalar_equal(const JsonValue& a, const JsonValue& b,
                                       const DiffOptions& opts = {}) {
    switch (kind_of(a)) {
        case Kind::Null:   return b.is_null();
        case Kind::Bool:   return b.is_bool() && a.as_bool() == b.as_bool();
        case Kind::Number: return b.is_number() && detail::numbers_equal(a, b, opts.numeric_epsilon);
        case Kind::String: return b.is_string() && a.as_string_view() == b.as_string_view();
        default:           return false;
    }
}

/// @brief Structural equality as the differ sees it.
[[nodiscard]] inline bool deep_equals(const JsonValue& a, const JsonValue& b,
                                      const DiffOptions& opts = {}) {
    const Kind ka = kind_of(a);
    if (ka != kind_of(b)) return false;
    if (ka == Kind::Array) {
        const auto& la = a.as_array();
        const auto& lb = b.as_array();
        if (la.size() != lb.size()) return false;
        for (size_t i = 0; i < la.size(); ++i)
            if (!deep_equals(la[i], lb[i], opts)) return false;
        return true;
    }
    if (ka == Kind::Object) {
        const auto& oa = a.as_object();
        const auto& ob = b.as_object();
        const auto& filter = opts.property_filter;
        if (!filter) {
            if (oa.size() != ob.size()) return false;
            for (const auto& [key, val] : oa) {
                const auto* other = ob.find(key);
                if (!other || !deep_equals(val, *other, opts)) return false;
            }
            return true;
        }
        for (const auto& [key, val] : oa) {
            if (!filter(key, a, b)) continue;
            const auto* other = ob.find(key);
            if (!other || !deep_equals(val, *other, opts)) return false;
        }
        for (const auto& [key, val] : ob) {
            if (filter(key, a, b) && !oa.contains(key)) return false;
        }
        return true;
    }
    return scalar_equal(a, b, opts);
}

} // namespace jsondelta
