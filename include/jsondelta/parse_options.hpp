#pragma once

/// @file parse_options.hpp
/// @brief Parser configuration: duplicate-key policy and nesting limit.

#include <cstddef>

namespace jsondelta {

/// @brief Parser configuration.
struct ParseOptions {
    /// Allow duplicate keys in objects (last value wins)
    bool allow_duplicate_keys = true;

    /// Maximum nesting depth (0 = use JSONDELTA_MAX_DEPTH)
    size_t max_depth = 0;

    /// Duplicate keys rejected with errc::duplicate_key.
    static constexpr ParseOptions strict() noexcept {
        ParseOptions opts;
        opts.allow_duplicate_keys = false;
        return opts;
    }
};

} // namespace jsondelta
