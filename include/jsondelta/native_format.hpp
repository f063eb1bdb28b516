#pragma once

/// @file native_format.hpp
/// @brief Native delta encoding (jsondiffpatch-compatible JSON).
///
/// Shapes:
///   Added        [new]
///   Modified     [old, new]
///   Removed      [old, 0, 0]
///   ObjectDelta  {"name": <delta>, ...}
///   ArrayDelta   {"_t": "a",
///                 "_<from>": [old, 0, 0]       element deleted
///                 "_<from>": ["", <to>, 3]     element moved to <to>
///                 "<to>": [new]                element inserted
///                 "<to>": <delta>}             element at <to> changed
///
/// Array delta keys are written "_t" first, then "_" entries ascending by
/// left index, then numeric entries ascending by right index. Retain ops are
/// not encoded. Text diffs ([patch, 0, 2]) are rejected when reading.
/// An object is an array delta only when "_t" holds the string "a"; any other
/// "_t" member is the delta of a property named "_t".
///
/// The formatter holds no state: each format()/parse() call creates its own
/// writer or reader with its own PathContext.

#include "delta.hpp"
#include "error.hpp"
#include "json_pointer.hpp"
#include "path_context.hpp"
#include "value.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsondelta {
namespace detail {

inline constexpr int kArrayMoveMarker = 3;
inline constexpr int kTextDiffMarker = 2;

// ─── Writer ─────────────────────────────────────────────────────────────

class NativeWriter {
public:
    JsonValue write(const Delta& d) {
        return std::visit(overloaded{
            [](const Unchanged&) { return JsonValue(nullptr); },
            [](const Modified& m) { return JsonValue(Array{m.old_value, m.new_value}); },
            [](const Added& a) { return JsonValue(Array{a.value}); },
            [](const Removed& r) { return JsonValue(Array{r.old_value, JsonValue(0), JsonValue(0)}); },
            [this](const ObjectDelta& o) { return write_object(o); },
            [this](const ArrayDelta& a) { return write_array(a); },
        }, d.variant());
    }

private:
    PathContext path_;

    JsonValue write_object(const ObjectDelta& o) {
        Object out;
        out.reserve(o.properties.size());
        for (const auto& [name, child] : o.properties) {
            auto scope = path_.push(name);
            if (child.is_unchanged())
                throw DeltaError("object delta holds an unchanged property", path_.pointer());
            if (out.contains(name))
                throw DeltaError("duplicate property in object delta", path_.pointer());
            out.append(name, write(child));
        }
        return JsonValue(std::move(out));
    }

    JsonValue write_array(const ArrayDelta& a) {
        std::vector<std::pair<size_t, JsonValue>> removals;
        std::vector<std::pair<size_t, JsonValue>> placements;
        std::set<size_t> sources;
        std::set<size_t> targets;

        auto claim_source = [&](size_t from) {
            if (!sources.insert(from).second)
                throw DeltaError("array delta consumes left index " + std::to_string(from) + " twice",
                                 path_.pointer());
        };
        auto claim_target = [&](size_t to) {
            if (!targets.insert(to).second)
                throw DeltaError("array delta places right index " + std::to_string(to) + " twice",
                                 path_.pointer());
        };
        auto nested = [&](size_t to, const Delta& inner) {
            auto scope = path_.push(to);
            return write(inner);
        };

        for (const auto& op : a.ops) {
            std::visit(overloaded{
                [&](const Retain& r) { claim_source(r.from); claim_target(r.to); },
                [&](const Insert& i) {
                    claim_target(i.to);
                    placements.emplace_back(i.to, JsonValue(Array{i.value}));
                },
                [&](const Delete& d) {
                    claim_source(d.from);
                    removals.emplace_back(d.from, JsonValue(Array{d.old_value, JsonValue(0), JsonValue(0)}));
                },
                [&](const Move& m) {
                    claim_source(m.from);
                    claim_target(m.to);
                    removals.emplace_back(m.from, JsonValue(Array{JsonValue(""), JsonValue(static_cast<uint64_t>(m.to)),
                                                                  JsonValue(kArrayMoveMarker)}));
                    if (!m.inner.is_unchanged()) placements.emplace_back(m.to, nested(m.to, m.inner));
                },
                [&](const Modify& m) {
                    claim_source(m.from);
                    claim_target(m.to);
                    if (m.inner.is_unchanged())
                        throw DeltaError("array modify op without a change", path_.child(m.to));
                    placements.emplace_back(m.to, nested(m.to, m.inner));
                },
            }, op.op);
        }

        auto by_index = [](const auto& x, const auto& y) { return x.first < y.first; };
        std::sort(removals.begin(), removals.end(), by_index);
        std::sort(placements.begin(), placements.end(), by_index);

        Object out;
        out.reserve(1 + removals.size() + placements.size());
        out.append("_t", JsonValue("a"));
        for (auto& [from, v] : removals) out.append("_" + std::to_string(from), std::move(v));
        for (auto& [to, v] : placements) out.append(std::to_string(to), std::move(v));
        return JsonValue(std::move(out));
    }
};

// ─── Reader ─────────────────────────────────────────────────────────────

class NativeReader {
public:
    Delta read(const JsonValue& v) {
        if (v.is_null()) return Unchanged{};
        if (v.is_array()) return read_leaf(v.as_array());
        if (v.is_object()) {
            // A property delta is never a string, so "_t":"a" cannot be a
            // property named "_t".
            const JsonValue* marker = v.find("_t");
            if (marker && marker->is_string() && marker->as_string_view() == "a")
                return read_array(v.as_object());
            return read_object(v.as_object());
        }
        throw DeltaError(std::string("delta must be an array, object or null, got ") +
                         type_name(v.type()), path_.pointer());
    }

private:
    PathContext path_;

    static bool is_zero(const JsonValue& v) {
        return v.is_integer() && v.as_integer() == 0;
    }

    Delta read_leaf(const Array& a) {
        switch (a.size()) {
            case 1: return Added{a[0]};
            case 2: return Modified{a[0], a[1]};
            case 3:
                if (is_zero(a[1]) && is_zero(a[2])) return Removed{a[0]};
                if (is_zero(a[1]) && a[2].is_integer() && a[2].as_integer() == kTextDiffMarker)
                    throw DeltaError("text diffs are not supported", path_.pointer(),
                                     errc::unsupported_delta);
                if (a[2].is_integer() && a[2].as_integer() == kArrayMoveMarker)
                    throw DeltaError("array move outside an array delta", path_.pointer());
                break;
            default:
                break;
        }
        throw DeltaError("unrecognized delta array of size " + std::to_string(a.size()),
                         path_.pointer());
    }

    Delta read_object(const Object& o) {
        ObjectDelta result;
        result.properties.reserve(o.size());
        for (const auto& [name, child] : o) {
            auto scope = path_.push(name);
            Delta d = read(child);
            if (d.is_unchanged())
                throw DeltaError("null property delta", path_.pointer());
            result.properties.emplace_back(name, std::move(d));
        }
        return result;
    }

    size_t parse_index(std::string_view key) const {
        auto idx = parse_array_index(key);
        if (!idx) throw DeltaError("invalid array delta key \"" + std::string(key) + "\"", path_.pointer());
        return *idx;
    }

    Delta read_array(const Object& o) {
        struct Pending { size_t from; size_t to; };
        std::vector<Delete> deletes;
        std::vector<Pending> moves;
        std::vector<std::pair<size_t, const JsonValue*>> numbered;

        for (const auto& [key, value] : o) {
            if (key == "_t") continue;
            if (!key.empty() && key[0] == '_') {
                const size_t from = parse_index(std::string_view(key).substr(1));
                auto scope = path_.push(key);
                const Array* a = value.is_array() ? &value.as_array() : nullptr;
                if (a && a->size() == 3 && is_zero((*a)[1]) && is_zero((*a)[2])) {
                    deletes.push_back(Delete{from, (*a)[0]});
                } else if (a && a->size() == 3 && (*a)[2].is_integer() &&
                           (*a)[2].as_integer() == kArrayMoveMarker && (*a)[1].is_integer() &&
                           (*a)[1].as_integer() >= 0) {
                    moves.push_back(Pending{from, static_cast<size_t>((*a)[1].as_integer())});
                } else {
                    throw DeltaError("array removal entry must be [old, 0, 0] or [\"\", to, 3]",
                                     path_.pointer());
                }
            } else {
                numbered.emplace_back(parse_index(key), &value);
            }
        }

        // Targets occupied by inserts and moves, and left indices leaving
        // their slot (deletes and move sources).
        std::set<size_t> placed;
        std::set<size_t> vacated;
        auto vacate = [&](size_t from) {
            if (!vacated.insert(from).second)
                throw DeltaError("left index " + std::to_string(from) + " removed twice", path_.pointer());
        };
        auto place = [&](size_t to) {
            if (!placed.insert(to).second)
                throw DeltaError("right index " + std::to_string(to) + " placed twice", path_.pointer());
        };
        for (const auto& d : deletes) vacate(d.from);
        for (const auto& m : moves) { vacate(m.from); place(m.to); }

        std::vector<std::pair<size_t, Delta>> changes;
        std::vector<Insert> inserts;
        for (const auto& [to, value] : numbered) {
            auto scope = path_.push(to);
            if (value->is_array() && value->as_array().size() == 1) {
                place(to);
                inserts.push_back(Insert{to, value->as_array()[0]});
            } else {
                Delta inner = read(*value);
                if (inner.is_unchanged()) throw DeltaError("null array element delta", path_.pointer());
                changes.emplace_back(to, std::move(inner));
            }
        }

        ArrayDelta result;
        std::sort(deletes.begin(), deletes.end(),
                  [](const Delete& a, const Delete& b) { return a.from < b.from; });
        for (auto& d : deletes) result.ops.emplace_back(std::move(d));

        std::vector<ArrayOp> placements;
        for (auto& i : inserts) placements.emplace_back(std::move(i));
        for (const auto& m : moves) {
            Delta inner;
            auto it = std::find_if(changes.begin(), changes.end(),
                                   [&](const auto& c) { return c.first == m.to; });
            if (it != changes.end()) {
                inner = std::move(it->second);
                changes.erase(it);
            }
            placements.emplace_back(Move{m.from, m.to, std::move(inner)});
        }
        for (auto& [to, inner] : changes) {
            if (placed.count(to))
                throw DeltaError("change targets an inserted element", path_.child(to));
            placements.emplace_back(Modify{kept_source(to, placed, vacated), to, std::move(inner)});
        }
        std::stable_sort(placements.begin(), placements.end(),
                         [](const ArrayOp& a, const ArrayOp& b) { return *a.target() < *b.target(); });
        for (auto& p : placements) result.ops.push_back(std::move(p));
        return result;
    }

    /// Left index of the kept element that lands at right index @p to.
    /// Kept elements keep their relative order and fill the right slots not
    /// taken by inserts and moves.
    static size_t kept_source(size_t to, const std::set<size_t>& placed,
                              const std::set<size_t>& vacated) {
        size_t rank = to - static_cast<size_t>(std::distance(placed.begin(), placed.lower_bound(to)));
        size_t from = rank;
        for (size_t v : vacated) {
            if (v <= from) ++from;
            else break;
        }
        return from;
    }
};

} // namespace detail

/// @brief Native (jsondiffpatch) delta formatter. Stateless and shareable.
class NativeFormatter {
public:
    using result_type = JsonValue;

    /// @brief Encode a delta. Unchanged encodes as null.
    /// Throws DeltaError for malformed deltas (an index used twice, ...).
    [[nodiscard]] JsonValue format(const Delta& delta) const {
        detail::NativeWriter writer;
        return writer.write(delta);
    }

    /// @brief Decode a native delta. null decodes as Unchanged.
    [[nodiscard]] Delta parse(const JsonValue& native) const {
        detail::NativeReader reader;
        return reader.read(native);
    }
};

/// @brief Decode a native delta (see NativeFormatter::parse).
[[nodiscard]] inline Delta read_native_delta(const JsonValue& native) {
    return NativeFormatter{}.parse(native);
}

/// @brief Encode a delta as native JSON (see NativeFormatter::format).
[[nodiscard]] inline JsonValue to_native(const Delta& delta) {
    return NativeFormatter{}.format(delta);
}

} // namespace jsondelta
