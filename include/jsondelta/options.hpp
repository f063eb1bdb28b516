#pragma once

/// @file options.hpp
/// @brief Runtime configuration for diff and patch calls.
///
/// Options objects are read-only during a call and may be shared between
/// threads. Callbacks stored in them must be pure functions of their
/// arguments: the engine calls them concurrently when the options object is
/// shared.

#include "serializer.hpp"
#include "value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace jsondelta {

/// @brief Identity key for an array element: (element, index in its array).
/// Returning nullopt falls back to deep-equality matching for that element.
using ArrayItemKeyFinder =
    std::function<std::optional<std::string>(const JsonValue&, size_t)>;

/// @brief Property filter: (name, left object, right object) -> include?
using PropertyFilter =
    std::function<bool(std::string_view, const JsonValue&, const JsonValue&)>;

/// @brief Diff configuration.
struct DiffOptions {
    /// Identity key for object elements of arrays. Empty = no keys.
    ArrayItemKeyFinder array_object_item_key_finder;

    /// During head/tail trimming, treat two containers of the same kind at
    /// the same index as the same element even without a key.
    bool array_object_item_match_by_position = false;

    /// Pair deleted and inserted elements of the same identity into moves.
    bool detect_array_move = true;

    /// Two numbers are equal when |a - b| <= numeric_epsilon.
    double numeric_epsilon = 0.0;

    /// Properties rejected by the filter are ignored on both sides.
    PropertyFilter property_filter;

    /// Options keyed by an object property holding a string or an integer.
    [[nodiscard]] static DiffOptions keyed_by(std::string property) {
        DiffOptions opts;
        opts.array_object_item_key_finder =
            [prop = std::move(property)](const JsonValue& item, size_t) -> std::optional<std::string> {
                const JsonValue* id = item.find(prop);
                if (!id) return std::nullopt;
                if (id->is_string()) return id->as_string();
                if (id->is_integer() || id->is_uinteger()) return id->dump();
                return std::nullopt;
            };
        return opts;
    }
};

/// @brief Patch configuration.
struct PatchOptions {
    /// Verify expected old values and absent targets before mutating.
    bool strict = true;

    /// Default: every old value carried by the delta must match the document.
    static constexpr PatchOptions strict_mode() noexcept { return {}; }

    /// Apply structurally; expected old values are not compared.
    static constexpr PatchOptions lenient() noexcept {
        PatchOptions opts;
        opts.strict = false;
        return opts;
    }
};

} // namespace jsondelta
