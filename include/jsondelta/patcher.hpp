#pragma once

/// @file patcher.hpp
/// @brief Patch applier: replays a Delta onto a document in place.
///
/// Arrays are rebuilt in a local buffer and assigned back only once the
/// whole array node has been applied, so a failing array operation leaves
/// that array untouched. Failures report the JSON Pointer of the offending
/// location.
///
/// Strict mode (the default) checks every old value carried by the delta
/// against the document and refuses to add an object property that already
/// exists; lenient mode applies the delta structurally.

#include "config.hpp"
#include "delta.hpp"
#include "error.hpp"
#include "native_format.hpp"
#include "options.hpp"
#include "path_context.hpp"
#include "serializer.hpp"
#include "value.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace jsondelta {
namespace detail {

class Patcher {
public:
    explicit Patcher(const PatchOptions& opts) noexcept : opts_(opts) {}

    void apply(JsonValue& target, const Delta& d) {
        if (JSONDELTA_UNLIKELY(path_.depth() > JSONDELTA_MAX_DEPTH))
            throw PatchError(errc::max_depth_exceeded, "maximum nesting depth exceeded", path_.pointer());

        std::visit(overloaded{
            [](const Unchanged&) {},
            [&](const Modified& m) {
                expect_value(target, m.old_value);
                target = m.new_value;
            },
            [&](const Added& a) { target = a.value; },
            [&](const Removed& r) {
                expect_value(target, r.old_value);
                target = JsonValue(nullptr);
            },
            [&](const ObjectDelta& o) { apply_object(target, o); },
            [&](const ArrayDelta& a) { apply_array(target, a); },
        }, d.variant());
    }

private:
    const PatchOptions& opts_;
    PathContext path_;

    static constexpr size_t kInserted = std::numeric_limits<size_t>::max();

    void expect_value(const JsonValue& actual, const JsonValue& expected) const {
        if (opts_.strict && actual != expected)
            throw PatchMismatchError("expected " + expected.dump() + ", found " + actual.dump(),
                                     path_.pointer());
    }

    void expect_type(const JsonValue& target, Type t) const {
        if (target.type() != t)
            throw PatchError(errc::patch_type_mismatch,
                             std::string("expected ") + type_name(t) + ", found " +
                             type_name(target.type()), path_.pointer());
    }

    void apply_object(JsonValue& target, const ObjectDelta& delta) {
        expect_type(target, Type::Object);
        Object& obj = target.as_object();
        for (const auto& [name, child] : delta.properties) {
            auto scope = path_.push(name);
            JsonValue* current = obj.find(name);

            if (const auto* added = child.get_if<Added>()) {
                if (current && opts_.strict)
                    throw PatchMismatchError("property already exists", path_.pointer());
                obj.insert(name, added->value);
            } else if (const auto* removed = child.get_if<Removed>()) {
                if (!current) {
                    if (!opts_.strict) continue;
                    throw PatchError(errc::patch_path_not_found, "property to remove is missing",
                                     path_.pointer());
                }
                expect_value(*current, removed->old_value);
                obj.erase(name);
            } else {
                if (!current)
                    throw PatchError(errc::patch_path_not_found, "property is missing",
                                     path_.pointer());
                apply(*current, child);
            }
        }
    }

    void check_source(size_t from, size_t size) const {
        if (from >= size)
            throw PatchError(errc::patch_index_out_of_range,
                             "left index " + std::to_string(from) + " out of range (size=" +
                             std::to_string(size) + ")", path_.pointer());
    }

    void apply_array(JsonValue& target, const ArrayDelta& delta) {
        expect_type(target, Type::Array);
        const Array& original = target.as_array();
        const size_t size = original.size();

        std::vector<bool> vacated(size, false);
        for (const auto& op : delta.ops) {
            if (const auto* del = op.get_if<Delete>()) {
                check_source(del->from, size);
                auto scope = path_.push(del->from);
                expect_value(original[del->from], del->old_value);
                vacated[del->from] = true;
            } else if (const auto* mv = op.get_if<Move>()) {
                check_source(mv->from, size);
                vacated[mv->from] = true;
            } else if (auto src = op.source()) {
                check_source(*src, size);
            }
        }

        // Kept elements in their original order, with their left index.
        Array buffer;
        std::vector<size_t> origin;
        buffer.reserve(size);
        origin.reserve(size);
        for (size_t i = 0; i < size; ++i) {
            if (vacated[i]) continue;
            buffer.push_back(original[i]);
            origin.push_back(i);
        }

        std::vector<const ArrayOp*> placements;
        for (const auto& op : delta.ops)
            if (op.is<Insert>() || op.is<Move>()) placements.push_back(&op);
        std::stable_sort(placements.begin(), placements.end(),
                         [](const ArrayOp* x, const ArrayOp* y) { return *x->target() < *y->target(); });

        for (const ArrayOp* op : placements) {
            const size_t to = *op->target();
            if (to > buffer.size())
                throw PatchError(errc::patch_index_out_of_range,
                                 "right index " + std::to_string(to) + " beyond array end (size=" +
                                 std::to_string(buffer.size()) + ")", path_.pointer());
            const auto at = static_cast<std::ptrdiff_t>(to);
            if (const auto* ins = op->get_if<Insert>()) {
                buffer.insert(buffer.begin() + at, ins->value);
                origin.insert(origin.begin() + at, kInserted);
            } else {
                const auto* mv = op->get_if<Move>();
                buffer.insert(buffer.begin() + at, original[mv->from]);
                origin.insert(origin.begin() + at, mv->from);
            }
        }

        for (const auto& op : delta.ops) {
            const Delta* inner = nullptr;
            size_t from = 0, to = 0;
            if (const auto* r = op.get_if<Retain>()) {
                from = r->from; to = r->to;
            } else if (const auto* m = op.get_if<Modify>()) {
                from = m->from; to = m->to; inner = &m->inner;
            } else if (const auto* mv = op.get_if<Move>()) {
                from = mv->from; to = mv->to; inner = &mv->inner;
            } else {
                continue;
            }
            if (to >= buffer.size())
                throw PatchError(errc::patch_index_out_of_range,
                                 "right index " + std::to_string(to) + " out of range (size=" +
                                 std::to_string(buffer.size()) + ")", path_.pointer());
            auto scope = path_.push(to);
            if (opts_.strict && origin[to] != from)
                throw PatchMismatchError("element at this index does not come from left index " +
                                         std::to_string(from), path_.pointer());
            if (inner) apply(buffer[to], *inner);
        }

        target.as_array() = std::move(buffer);
    }
};

// ─── Reversal ───────────────────────────────────────────────────────────

inline void sort_canonical(ArrayDelta& a) {
    std::stable_sort(a.ops.begin(), a.ops.end(), [](const ArrayOp& x, const ArrayOp& y) {
        const bool xd = x.is<Delete>();
        const bool yd = y.is<Delete>();
        if (xd != yd) return xd;
        if (xd) return x.get_if<Delete>()->from < y.get_if<Delete>()->from;
        return *x.target() < *y.target();
    });
}

} // namespace detail

/// @brief The delta that undoes @p delta: patch(diff(L,R)) then patch(reverse) gives L.
[[nodiscard]] inline Delta reverse(const Delta& delta) {
    return std::visit(detail::overloaded{
        [](const Unchanged&) -> Delta { return Unchanged{}; },
        [](const Modified& m) -> Delta { return Modified{m.new_value, m.old_value}; },
        [](const Added& a) -> Delta { return Removed{a.value}; },
        [](const Removed& r) -> Delta { return Added{r.old_value}; },
        [](const ObjectDelta& o) -> Delta {
            ObjectDelta out;
            out.properties.reserve(o.properties.size());
            for (const auto& [name, child] : o.properties)
                out.properties.emplace_back(name, reverse(child));
            return out;
        },
        [](const ArrayDelta& a) -> Delta {
            ArrayDelta out;
            out.ops.reserve(a.ops.size());
            for (const auto& op : a.ops) {
                std::visit(detail::overloaded{
                    [&](const Retain& r) { out.ops.emplace_back(Retain{r.to, r.from}); },
                    [&](const Insert& i) { out.ops.emplace_back(Delete{i.to, i.value}); },
                    [&](const Delete& d) { out.ops.emplace_back(Insert{d.from, d.old_value}); },
                    [&](const Move& m) { out.ops.emplace_back(Move{m.to, m.from, reverse(m.inner)}); },
                    [&](const Modify& m) { out.ops.emplace_back(Modify{m.to, m.from, reverse(m.inner)}); },
                }, op.op);
            }
            detail::sort_canonical(out);
            return out;
        },
    }, delta.variant());
}

/// @brief Apply @p delta to @p document in place.
/// Throws PatchError / PatchMismatchError with the failing JSON Pointer.
inline void patch(JsonValue& document, const Delta& delta, const PatchOptions& opts = {}) {
    detail::Patcher patcher(opts);
    patcher.apply(document, delta);
}

/// @brief Apply the result of diff(); std::nullopt leaves @p document untouched.
inline void patch(JsonValue& document, const std::optional<Delta>& delta,
                  const PatchOptions& opts = {}) {
    if (delta) patch(document, *delta, opts);
}

/// @brief Apply a delta in native (jsondiffpatch) encoding.
inline void patch(JsonValue& document, const JsonValue& native_delta,
                  const PatchOptions& opts = {}) {
    patch(document, read_native_delta(native_delta), opts);
}

/// @brief Undo @p delta on a document it was applied to.
inline void unpatch(JsonValue& document, const Delta& delta, const PatchOptions& opts = {}) {
    patch(document, reverse(delta), opts);
}

inline void unpatch(JsonValue& document, const std::optional<Delta>& delta,
                    const PatchOptions& opts = {}) {
    if (delta) unpatch(document, *delta, opts);
}

/// @brief patch() without exceptions.
[[nodiscard]] inline std::error_code try_patch(JsonValue& document, const Delta& delta,
                                               const PatchOptions& opts = {}) {
    try {
        patch(document, delta, opts);
        return {};
    } catch (const std::system_error& e) {
        return e.code();
    }
}

/// @brief patch() of a native delta without exceptions.
[[nodiscard]] inline std::error_code try_patch(JsonValue& document, const JsonValue& native_delta,
                                               const PatchOptions& opts = {}) {
    try {
        patch(document, native_delta, opts);
        return {};
    } catch (const std::system_error& e) {
        return e.code();
    }
}

} // namespace jsondelta
