#pragma once

/// @file delta.hpp
/// @brief Delta: the structural difference between two JSON values.
///
/// A closed sum type over the shapes a difference can take:
///   - Unchanged                     nothing to do
///   - Modified{old, new}            replace the value wholesale
///   - Added{value}                  object property (or root) appears
///   - Removed{old}                  object property (or root) disappears
///   - ObjectDelta{(name, Delta)...} per-property changes, never Unchanged
///   - ArrayDelta{ArrayOp...}        edit script for an array
///
/// Array operations use two index spaces: `from` is a position in the
/// original left array, `to` a position in the original right array.
/// ArrayDelta keeps its ops in canonical order: every Delete ascending by
/// `from`, then every placing op (Retain, Modify, Insert, Move) ascending
/// by `to`.
///
/// Consumers dispatch with std::visit over Delta::variant_type, so adding a
/// shape is a compile error until every consumer handles it.

#include "value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsondelta {

struct ArrayOp;

// ─── Delta shapes ───────────────────────────────────────────────────────

struct Unchanged {};

struct Modified {
    JsonValue old_value;
    JsonValue new_value;
};

struct Added {
    JsonValue value;
};

struct Removed {
    JsonValue old_value;
};

struct ObjectDelta {
    /// Changed properties in document order (left order, then right-only).
    std::vector<std::pair<std::string, Delta>> properties;
};

struct ArrayDelta {
    std::vector<ArrayOp> ops;
};

// ─── Delta ──────────────────────────────────────────────────────────────

class Delta {
public:
    using variant_type =
        std::variant<Unchanged, Modified, Added, Removed, ObjectDelta, ArrayDelta>;

    Delta() noexcept = default;
    Delta(Unchanged) noexcept {}
    Delta(Modified d) : v_(std::move(d)) {}
    Delta(Added d) : v_(std::move(d)) {}
    Delta(Removed d) : v_(std::move(d)) {}
    Delta(ObjectDelta d) : v_(std::move(d)) {}
    Delta(ArrayDelta d) : v_(std::move(d)) {}

    [[nodiscard]] bool is_unchanged() const noexcept {
        return std::holds_alternative<Unchanged>(v_);
    }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(v_); }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&v_); }

    template <typename T>
    [[nodiscard]] T* get_if() noexcept { return std::get_if<T>(&v_); }

    [[nodiscard]] const variant_type& variant() const noexcept { return v_; }
    [[nodiscard]] variant_type& variant() noexcept { return v_; }

    /// Short name of the held shape ("modified", "array", ...).
    [[nodiscard]] const char* kind_name() const noexcept {
        static constexpr const char* kNames[] = {
            "unchanged", "modified", "added", "removed", "object", "array"
        };
        return kNames[v_.index()];
    }

private:
    variant_type v_;
};

// ─── Array operations ───────────────────────────────────────────────────

/// Element kept unchanged: left[from] is right[to].
struct Retain {
    size_t from;
    size_t to;
};

/// New element right[to].
struct Insert {
    size_t to;
    JsonValue value;
};

/// Element left[from] removed.
struct Delete {
    size_t from;
    JsonValue old_value;
};

/// Element left[from] repositioned to right[to] outside the LCS, with an
/// optional inner change (Unchanged when it moved as-is).
struct Move {
    size_t from;
    size_t to;
    Delta inner;
};

/// Element left[from] matched right[to] in order but changed.
struct Modify {
    size_t from;
    size_t to;
    Delta inner;
};

struct ArrayOp {
    using variant_type = std::variant<Retain, Insert, Delete, Move, Modify>;

    variant_type op;

    ArrayOp(Retain o) : op(o) {}
    ArrayOp(Insert o) : op(std::move(o)) {}
    ArrayOp(Delete o) : op(std::move(o)) {}
    ArrayOp(Move o) : op(std::move(o)) {}
    ArrayOp(Modify o) : op(std::move(o)) {}

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(op); }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&op); }

    /// True for ops that occupy a slot of the right array.
    [[nodiscard]] bool is_placement() const noexcept { return !is<Delete>(); }

    /// Left index consumed by this op (Insert consumes none).
    [[nodiscard]] std::optional<size_t> source() const noexcept {
        return std::visit([](const auto& o) -> std::optional<size_t> {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Insert>) return std::nullopt;
            else return o.from;
        }, op);
    }

    /// Right index occupied by this op (Delete occupies none).
    [[nodiscard]] std::optional<size_t> target() const noexcept {
        return std::visit([](const auto& o) -> std::optional<size_t> {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Delete>) return std::nullopt;
            else return o.to;
        }, op);
    }
};

// ─── Visitation helper ──────────────────────────────────────────────────

namespace detail {

/// Overload set for std::visit: overloaded{[](const A&){}, [](const B&){}}.
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace detail

// ─── Equality ───────────────────────────────────────────────────────────

inline bool operator==(const Unchanged&, const Unchanged&) noexcept { return true; }
inline bool operator==(const Modified& a, const Modified& b) {
    return a.old_value == b.old_value && a.new_value == b.new_value;
}
inline bool operator==(const Added& a, const Added& b) { return a.value == b.value; }
inline bool operator==(const Removed& a, const Removed& b) { return a.old_value == b.old_value; }
inline bool operator==(const Retain& a, const Retain& b) noexcept {
    return a.from == b.from && a.to == b.to;
}
inline bool operator==(const Insert& a, const Insert& b) {
    return a.to == b.to && a.value == b.value;
}
inline bool operator==(const Delete& a, const Delete& b) {
    return a.from == b.from && a.old_value == b.old_value;
}
inline bool operator==(const Delta& a, const Delta& b);
inline bool operator==(const Move& a, const Move& b) {
    return a.from == b.from && a.to == b.to && a.inner == b.inner;
}
inline bool operator==(const Modify& a, const Modify& b) {
    return a.from == b.from && a.to == b.to && a.inner == b.inner;
}
inline bool operator==(const ArrayOp& a, const ArrayOp& b) { return a.op == b.op; }
inline bool operator==(const ObjectDelta& a, const ObjectDelta& b) {
    return a.properties == b.properties;
}
inline bool operator==(const ArrayDelta& a, const ArrayDelta& b) { return a.ops == b.ops; }
inline bool operator==(const Delta& a, const Delta& b) { return a.variant() == b.variant(); }
inline bool operator!=(const Delta& a, const Delta& b) { return !(a == b); }

// ─── Queries ────────────────────────────────────────────────────────────

/// @brief Number of structural edits (inserts + deletes + moves).
[[nodiscard]] inline size_t edit_count(const ArrayDelta& d) noexcept {
    size_t n = 0;
    for (const auto& op : d.ops)
        if (op.is<Insert>() || op.is<Delete>() || op.is<Move>()) ++n;
    return n;
}

} // namespace jsondelta
