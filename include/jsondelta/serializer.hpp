#pragma once

/// @file serializer.hpp
/// @brief JSON serializer used for dump(), test output and delta rendering.
///
/// Features:
///   - Compact or indented output (compile-time Pretty dispatch)
///   - Shortest round-trip doubles via std::to_chars
///   - Optional key sorting for canonical output
///   - NaN/Infinity written as null (not representable in JSON)

#include "config.hpp"
#include "value.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace jsondelta {

/// @brief Serialization options.
struct SerializeOptions {
    int indent = -1;        ///< Indentation (-1 = compact, >= 0 = pretty-printed)
    bool sort_keys = false; ///< Sort object keys (byte order)
};

namespace detail {

inline constexpr char kHexDigits[16] = {
    '0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'
};

/// @brief Serializer into a std::string: Pretty is a compile-time switch.
template <bool Pretty>
class SerializerCore {
public:
    SerializerCore(std::string& out, const SerializeOptions& opts) noexcept
        : out_(out), opts_(opts) {}

    void serialize(const JsonValue& value) {
        current_indent_ = 0;
        write_value(value);
    }

private:
    std::string& out_;
    const SerializeOptions& opts_;
    int current_indent_ = 0;

    void write_indent() {
        if constexpr (Pretty) out_.append(static_cast<size_t>(current_indent_), ' ');
    }

    void write_newline() {
        if constexpr (Pretty) out_.push_back('\n');
    }

    void write_value(const JsonValue& v) {
        switch (v.type()) {
            case Type::Null:     out_.append("null"); break;
            case Type::Bool:     out_.append(v.as_bool() ? "true" : "false"); break;
            case Type::Integer:  write_integral(v.as_integer()); break;
            case Type::UInteger: write_integral(v.as_uinteger()); break;
            case Type::Float:    write_float(v.as_float()); break;
            case Type::String:   write_string(v.as_string_view()); break;
            case Type::Array:    write_array(v.as_array()); break;
            case Type::Object:   write_object(v.as_object()); break;
        }
    }

    template <typename Int>
    void write_integral(Int val) {
        char buf[24];
        auto res = std::to_chars(buf, buf + sizeof(buf), val);
        out_.append(buf, static_cast<size_t>(res.ptr - buf));
    }

    void write_float(double val) {
        if (JSONDELTA_UNLIKELY(std::isnan(val) || std::isinf(val))) {
            out_.append("null");
            return;
        }
        char buf[32];
        auto res = std::to_chars(buf, buf + sizeof(buf), val);
        std::string_view text(buf, static_cast<size_t>(res.ptr - buf));
        out_.append(text);
        // Keep floats distinguishable from integers after a round trip.
        if (text.find_first_of(".e") == std::string_view::npos) out_.append(".0");
    }

    void write_string(std::string_view s) {
        out_.push_back('"');
        for (char ch : s) {
            auto c = static_cast<unsigned char>(ch);
            switch (c) {
                case '"':  out_.append("\\\""); break;
                case '\\': out_.append("\\\\"); break;
                case '\b': out_.append("\\b"); break;
                case '\f': out_.append("\\f"); break;
                case '\n': out_.append("\\n"); break;
                case '\r': out_.append("\\r"); break;
                case '\t': out_.append("\\t"); break;
                default:
                    if (c < 0x20) {
                        char esc[6] = {'\\', 'u', '0', '0', kHexDigits[c >> 4], kHexDigits[c & 0xF]};
                        out_.append(esc, 6);
                    } else {
                        out_.push_back(ch);
                    }
            }
        }
        out_.push_back('"');
    }

    void write_array(const Array& arr) {
        if (arr.empty()) { out_.append("[]"); return; }
        out_.push_back('[');
        if constexpr (Pretty) current_indent_ += opts_.indent;
        write_newline();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) { out_.push_back(','); write_newline(); }
            write_indent();
            write_value(arr[i]);
        }
        if constexpr (Pretty) current_indent_ -= opts_.indent;
        write_newline();
        write_indent();
        out_.push_back(']');
    }

    void write_member(const std::string& key, const JsonValue& value) {
        write_indent();
        write_string(key);
        out_.push_back(':');
        if constexpr (Pretty) out_.push_back(' ');
        write_value(value);
    }

    void write_object(const Object& obj) {
        if (obj.empty()) { out_.append("{}"); return; }
        out_.push_back('{');
        if constexpr (Pretty) current_indent_ += opts_.indent;
        write_newline();
        if (opts_.sort_keys) {
            std::vector<const std::pair<std::string, JsonValue>*> sorted;
            sorted.reserve(obj.size());
            for (const auto& entry : obj) sorted.push_back(&entry);
            std::sort(sorted.begin(), sorted.end(),
                      [](const auto* a, const auto* b) { return a->first < b->first; });
            for (size_t k = 0; k < sorted.size(); ++k) {
                if (k > 0) { out_.push_back(','); write_newline(); }
                write_member(sorted[k]->first, sorted[k]->second);
            }
        } else {
            bool first = true;
            for (const auto& [key, value] : obj) {
                if (!first) { out_.push_back(','); write_newline(); }
                first = false;
                write_member(key, value);
            }
        }
        if constexpr (Pretty) current_indent_ -= opts_.indent;
        write_newline();
        write_indent();
        out_.push_back('}');
    }
};

} // namespace detail

/// @brief Serialize with extended options.
[[nodiscard]] inline std::string serialize(const JsonValue& value,
                                           const SerializeOptions& opts) {
    std::string out;
    if (opts.indent >= 0) detail::SerializerCore<true>(out, opts).serialize(value);
    else                  detail::SerializerCore<false>(out, opts).serialize(value);
    return out;
}

/// @brief Free function: serialize to string.
[[nodiscard]] inline std::string serialize(const JsonValue& value, int indent = -1) {
    SerializeOptions opts;
    opts.indent = indent;
    return serialize(value, opts);
}

// ─── JsonValue::dump() implementation ────────────────────────────────────

inline std::string JsonValue::dump(int indent) const {
    return serialize(*this, indent);
}

inline std::string JsonValue::dump(const SerializeOptions& opts) const {
    return serialize(*this, opts);
}

/// @brief Compact serialization to a stream (also used by gtest printing).
inline std::ostream& operator<<(std::ostream& os, const JsonValue& value) {
    return os << value.dump();
}

} // namespace jsondelta
