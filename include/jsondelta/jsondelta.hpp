#pragma once

/// @file jsondelta.hpp
/// @brief Main header file for the jsondelta library.
///
/// @code
///   auto left  = jsondelta::parse(R"({"a":1,"b":[1,2,3]})");
///   auto right = jsondelta::parse(R"({"a":2,"b":[1,3]})");
///
///   auto delta = jsondelta::diff(left, right);            // std::optional<Delta>
///   auto ops   = jsondelta::diff(left, right, jsondelta::JsonPatchFormatter{});
///   // [{"op":"replace","path":"/a","value":2},{"op":"remove","path":"/b/1"}]
///
///   jsondelta::patch(left, delta);                        // left == right
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "value.hpp"
#include "parse_options.hpp"
#include "serializer.hpp"
#include "parser.hpp"
#include "json_pointer.hpp"
#include "options.hpp"
#include "compare.hpp"
#include "delta.hpp"
#include "array_diff.hpp"
#include "differ.hpp"
#include "native_format.hpp"
#include "json_patch_format.hpp"
#include "patcher.hpp"
#include "json_patch.hpp"

#include <optional>
#include <ostream>
#include <type_traits>

namespace jsondelta {

/// @brief Diff and format in one call.
/// @tparam Formatter  Any type with `result_type` and `result_type format(const Delta&) const`
///                    (NativeFormatter, JsonPatchFormatter, or a user type).
/// @return std::nullopt when the documents are equal under @p opts.
template <typename Formatter, typename = typename Formatter::result_type>
[[nodiscard]] std::optional<typename Formatter::result_type>
diff(const JsonValue& left, const JsonValue& right, const Formatter& formatter,
     const DiffOptions& opts = {}) {
    auto delta = diff(left, right, opts);
    if (!delta) return std::nullopt;
    return formatter.format(*delta);
}

/// Native encoding of @p delta.
inline std::ostream& operator<<(std::ostream& os, const Delta& delta) {
    return os << to_native(delta);
}

} // namespace jsondelta
