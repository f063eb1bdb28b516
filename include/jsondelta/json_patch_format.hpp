#pragma once

/// @file json_patch_format.hpp
/// @brief RFC 6902 JSON Patch formatter.
///
/// Produces an array of operations that, applied in order, transform the
/// left document into the right one. Every path refers to the document
/// state after the previously emitted operations.
///
/// Arrays are emitted in three passes:
///   1. "remove" for each deleted element, highest left index first
///   2. "add" / "move" for inserts and moves, ascending by right index
///   3. nested operations of changed elements, ascending by right index
///
/// Operation members are written in the order op, from, path, value.

#include "delta.hpp"
#include "path_context.hpp"
#include "value.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jsondelta {
namespace detail {

/// Per-call state: the output list and the path of the node being written.
class JsonPatchWriter {
public:
    JsonValue finish(const Delta& root) {
        write(root);
        return JsonValue(std::move(ops_));
    }

private:
    PathContext path_;
    Array ops_;

    void emit(const char* op, const std::string& path, const JsonValue* value,
              const std::string* from = nullptr) {
        Object o;
        o.append("op", JsonValue(op));
        if (from) o.append("from", JsonValue(*from));
        o.append("path", JsonValue(path));
        if (value) o.append("value", *value);
        ops_.emplace_back(std::move(o));
    }

    void write(const Delta& d) {
        std::visit(overloaded{
            [](const Unchanged&) {},
            [this](const Modified& m) { emit("replace", path_.pointer(), &m.new_value); },
            [this](const Added& a) { emit("add", path_.pointer(), &a.value); },
            [this](const Removed&) { emit("remove", path_.pointer(), nullptr); },
            [this](const ObjectDelta& o) {
                for (const auto& [name, child] : o.properties) {
                    auto scope = path_.push(name);
                    write(child);
                }
            },
            [this](const ArrayDelta& a) { write_array(a); },
        }, d.variant());
    }

    /// A move source not yet consumed, located by its gap in the array of
    /// settled elements (elements that are neither pending sources nor
    /// removed): it sits after `gap` settled elements.
    struct PendingSource {
        size_t from;
        size_t gap;
    };

    void write_array(const ArrayDelta& a) {
        std::vector<size_t> deletes;
        std::vector<size_t> move_sources;
        std::vector<const ArrayOp*> placements;
        std::vector<std::pair<size_t, const Delta*>> nested;

        for (const auto& op : a.ops) {
            if (const auto* d = op.get_if<Delete>()) {
                deletes.push_back(d->from);
            } else if (const auto* m = op.get_if<Move>()) {
                move_sources.push_back(m->from);
                placements.push_back(&op);
                if (!m->inner.is_unchanged()) nested.emplace_back(m->to, &m->inner);
            } else if (op.is<Insert>()) {
                placements.push_back(&op);
            } else if (const auto* mod = op.get_if<Modify>()) {
                nested.emplace_back(mod->to, &mod->inner);
            }
        }

        // ─── Pass 1: removals, highest index first ────────────────────
        std::sort(deletes.begin(), deletes.end());
        for (auto it = deletes.rbegin(); it != deletes.rend(); ++it) {
            emit("remove", path_.child(*it), nullptr);
        }

        // ─── Pass 2: inserts and moves ────────────────────────────────
        std::vector<size_t> vacated = deletes;
        vacated.insert(vacated.end(), move_sources.begin(), move_sources.end());
        std::sort(vacated.begin(), vacated.end());

        std::vector<PendingSource> pending;
        pending.reserve(move_sources.size());
        for (size_t from : move_sources) {
            const auto before = static_cast<size_t>(
                std::lower_bound(vacated.begin(), vacated.end(), from) - vacated.begin());
            pending.push_back(PendingSource{from, from - before});
        }

        std::stable_sort(placements.begin(), placements.end(),
                         [](const ArrayOp* x, const ArrayOp* y) { return *x->target() < *y->target(); });

        for (const ArrayOp* op : placements) {
            const size_t to = *op->target();
            if (const auto* ins = op->get_if<Insert>()) {
                emit("add", path_.child(position_after_pending(pending, to)), &ins->value);
            } else {
                const auto* mv = op->get_if<Move>();
                auto src = std::find_if(pending.begin(), pending.end(),
                                        [&](const PendingSource& p) { return p.from == mv->from; });
                const std::string from = path_.child(current_position(pending, *src));
                pending.erase(src);
                emit("move", path_.child(position_after_pending(pending, to)), nullptr, &from);
            }
            for (auto& p : pending)
                if (p.gap > to) ++p.gap;
        }

        // ─── Pass 3: nested changes ───────────────────────────────────
        std::stable_sort(nested.begin(), nested.end(),
                         [](const auto& x, const auto& y) { return x.first < y.first; });
        for (const auto& [to, inner] : nested) {
            auto scope = path_.push(to);
            write(*inner);
        }
    }

    /// Index in the current array of a pending move source.
    static size_t current_position(const std::vector<PendingSource>& pending,
                                   const PendingSource& s) {
        size_t pos = s.gap;
        for (const auto& p : pending) {
            if (p.gap < s.gap || (p.gap == s.gap && p.from < s.from)) ++pos;
        }
        return pos;
    }

    /// Index in the current array for settled position @p to, placed after
    /// every pending source in gaps up to and including @p to.
    static size_t position_after_pending(const std::vector<PendingSource>& pending, size_t to) {
        size_t pos = to;
        for (const auto& p : pending)
            if (p.gap <= to) ++pos;
        return pos;
    }
};

} // namespace detail

/// @brief RFC 6902 formatter. Stateless and shareable across threads.
class JsonPatchFormatter {
public:
    using result_type = JsonValue;

    /// @brief Operation list for @p delta (empty array for Unchanged).
    [[nodiscard]] JsonValue format(const Delta& delta) const {
        detail::JsonPatchWriter writer;
        return writer.finish(delta);
    }
};

} // namespace jsondelta
