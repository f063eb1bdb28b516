#pragma once

/// @file error.hpp
/// @brief Error types for jsondelta: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError, OutOfRangeError, PointerError,
///     PatchError, PatchMismatchError, DeltaError (default)
///   - Via error_code: jsondelta::errc enum + jsondelta_category() (exception-free)
///
/// Use try_parse(), try_patch() and try_apply_json_patch() for exception-free
/// operation.

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

namespace jsondelta {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief jsondelta error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Parse errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    unterminated_array      = 7,
    unterminated_object     = 8,
    trailing_content        = 9,
    max_depth_exceeded      = 10,
    invalid_literal         = 11,
    duplicate_key           = 12,

    // Value access errors (50-79)
    type_mismatch           = 50,
    out_of_range            = 51,
    key_not_found           = 52,
    invalid_pointer         = 53,

    // Patch errors (80-99)
    patch_path_not_found     = 80,
    patch_type_mismatch      = 81,
    patch_index_out_of_range = 82,
    patch_mismatch           = 83,
    patch_test_failed        = 84,
    invalid_patch_operation  = 85,

    // Delta format errors (100-119)
    invalid_delta            = 100,
    unsupported_delta        = 101,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class jsondelta_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "jsondelta";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                       return "success";
            case errc::unexpected_end_of_input:  return "unexpected end of input";
            case errc::unexpected_character:     return "unexpected character";
            case errc::invalid_escape:           return "invalid escape sequence";
            case errc::invalid_unicode_escape:   return "invalid unicode escape";
            case errc::invalid_number:           return "invalid number";
            case errc::unterminated_string:      return "unterminated string";
            case errc::unterminated_array:       return "unterminated array";
            case errc::unterminated_object:      return "unterminated object";
            case errc::trailing_content:         return "trailing content after JSON";
            case errc::max_depth_exceeded:       return "maximum nesting depth exceeded";
            case errc::invalid_literal:          return "invalid literal";
            case errc::duplicate_key:            return "duplicate key";
            case errc::type_mismatch:            return "type mismatch";
            case errc::out_of_range:             return "index out of range";
            case errc::key_not_found:            return "key not found";
            case errc::invalid_pointer:          return "invalid JSON pointer";
            case errc::patch_path_not_found:     return "patch target path not found";
            case errc::patch_type_mismatch:      return "patch target has unexpected type";
            case errc::patch_index_out_of_range: return "patch array index out of range";
            case errc::patch_mismatch:           return "patch expected value does not match document";
            case errc::patch_test_failed:        return "JSON patch test operation failed";
            case errc::invalid_patch_operation:  return "invalid JSON patch operation";
            case errc::invalid_delta:            return "malformed delta";
            case errc::unsupported_delta:        return "unsupported delta encoding";
            default:                             return "unknown jsondelta error";
        }
    }
};

} // namespace detail

/// @brief Get the jsondelta error category singleton.
inline const std::error_category& jsondelta_category() noexcept {
    static const detail::jsondelta_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from jsondelta::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), jsondelta_category()};
}

/// @brief Create an error_condition from jsondelta::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), jsondelta_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief JSON parse error with source position information.
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
};

/// @brief Type mismatch error when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg, errc code = errc::out_of_range)
        : std::system_error(make_error_code(code), msg) {}
};

/// @brief Malformed JSON Pointer text (RFC 6901).
class PointerError : public std::system_error {
public:
    explicit PointerError(const std::string& msg)
        : std::system_error(make_error_code(errc::invalid_pointer), msg) {}
};

/// @brief Base for errors that carry the JSON Pointer of the failing node.
class PathError : public std::system_error {
public:
    PathError(errc code, const std::string& message, std::string path)
        : std::system_error(make_error_code(code), format_message(message, path))
        , path_(std::move(path)) {}

    /// @brief JSON Pointer of the location that failed ("" is the root).
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    static std::string format_message(const std::string& msg,
                                      const std::string& path) {
        return msg + " at \"" + path + "\"";
    }

    std::string path_;
};

/// @brief A delta cannot be applied: missing path, wrong type or bad index.
class PatchError : public PathError {
public:
    PatchError(errc code, const std::string& message, std::string path)
        : PathError(code, message, std::move(path)) {}
};

/// @brief Strict patching found a value different from the delta's old value.
class PatchMismatchError : public PatchError {
public:
    PatchMismatchError(const std::string& message, std::string path)
        : PatchError(errc::patch_mismatch, message, std::move(path)) {}
};

/// @brief A delta (in memory or in wire form) is malformed or unsupported.
class DeltaError : public PathError {
public:
    DeltaError(const std::string& message, std::string path,
               errc code = errc::invalid_delta)
        : PathError(code, message, std::move(path)) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = jsondelta::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace jsondelta

// Register jsondelta::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<jsondelta::errc> : true_type {};
} // namespace std
