#pragma once

/// @file parser.hpp
/// @brief Recursive-descent JSON parser.
///
/// Features:
///   - Strict RFC 8259 grammar (no comments, no trailing commas)
///   - Exception-free parsing via try_parse() with error_code
///   - Recursion depth limiting to protect against stack overflow
///   - Full UTF-8 support, including \u surrogate pairs
///   - Integers kept exact (int64_t, or uint64_t above INT64_MAX)

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "value.hpp"

#include <charconv>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>

namespace jsondelta {
namespace detail {

/// @brief Recursive-descent JSON parser over a contiguous buffer.
class Parser {
public:
    /// @brief Parse a JSON document (with exceptions).
    [[nodiscard]] static JsonValue parse(std::string_view input,
                                         const ParseOptions& opts = {}) {
        Parser p(input.data(), input.data() + input.size(), opts);
        JsonValue result = p.parse_value();
        p.skip_whitespace();
        if (JSONDELTA_UNLIKELY(p.ptr_ < p.end_)) {
            p.error("unexpected trailing content", errc::trailing_content);
        }
        return result;
    }

private:
    const char* ptr_;
    const char* end_;
    const char* begin_;
    ParseOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;

    Parser(const char* begin, const char* end, const ParseOptions& opts) noexcept
        : ptr_(begin), end_(end), begin_(begin), opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : JSONDELTA_MAX_DEPTH) {}

    // ─── Error reporting ──────────────────────────────────────────────────

    [[nodiscard]] SourceLocation current_location() const noexcept {
        SourceLocation loc;
        loc.offset = static_cast<size_t>(ptr_ - begin_);
        for (const char* p = begin_; p < ptr_; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] JSONDELTA_NOINLINE void error(const std::string& msg,
                                               errc code = errc::unexpected_character) {
        throw ParseError(msg, current_location(), code);
    }

    [[noreturn]] JSONDELTA_NOINLINE void error_unexpected_char() {
        if (ptr_ >= end_) error("unexpected end of input", errc::unexpected_end_of_input);
        error(std::string("unexpected character '") + *ptr_ + "'");
    }

    // ─── Depth tracking ───────────────────────────────────────────────────

    /// RAII guard: one level per open array or object.
    class DepthGuard {
    public:
        explicit DepthGuard(Parser& p) : p_(p) {
            if (JSONDELTA_UNLIKELY(++p_.depth_ > p_.max_depth_))
                p_.error("maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
        ~DepthGuard() { --p_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
    private:
        Parser& p_;
    };

    // ─── Whitespace ───────────────────────────────────────────────────────

    void skip_whitespace() noexcept {
        while (ptr_ < end_) {
            char c = *ptr_;
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') ++ptr_;
            else return;
        }
    }

    // ─── Character reading ────────────────────────────────────────────────

    void expect(char c) {
        if (JSONDELTA_LIKELY(ptr_ < end_ && *ptr_ == c)) {
            ++ptr_;
            return;
        }
        error_unexpected_char();
    }

    void expect_literal(std::string_view literal) {
        if (JSONDELTA_UNLIKELY(static_cast<size_t>(end_ - ptr_) < literal.size()) ||
            JSONDELTA_UNLIKELY(std::memcmp(ptr_, literal.data(), literal.size()) != 0)) {
            error("expected '" + std::string(literal) + "'", errc::invalid_literal);
        }
        ptr_ += literal.size();
    }

    // ─── Value parsing ────────────────────────────────────────────────────

    JsonValue parse_value() {
        skip_whitespace();
        if (JSONDELTA_UNLIKELY(ptr_ >= end_))
            error("unexpected end of input", errc::unexpected_end_of_input);
        switch (*ptr_) {
            case '"': return JsonValue(parse_string());
            case '{': return parse_object();
            case '[': return parse_array();
            case 't': expect_literal("true");  return JsonValue(true);
            case 'f': expect_literal("false"); return JsonValue(false);
            case 'n': expect_literal("null");  return JsonValue(nullptr);
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return parse_number();
            default:
                error_unexpected_char();
        }
    }

    JsonValue parse_array() {
        DepthGuard guard(*this);
        expect('[');
        Array arr;
        skip_whitespace();
        if (ptr_ < end_ && *ptr_ == ']') { ++ptr_; return JsonValue(std::move(arr)); }
        for (;;) {
            arr.push_back(parse_value());
            skip_whitespace();
            if (JSONDELTA_UNLIKELY(ptr_ >= end_))
                error("unterminated array", errc::unterminated_array);
            if (*ptr_ == ']') { ++ptr_; break; }
            expect(',');
        }
        return JsonValue(std::move(arr));
    }

    JsonValue parse_object() {
        DepthGuard guard(*this);
        expect('{');
        Object obj;
        skip_whitespace();
        if (ptr_ < end_ && *ptr_ == '}') { ++ptr_; return JsonValue(std::move(obj)); }
        for (;;) {
            skip_whitespace();
            if (JSONDELTA_UNLIKELY(ptr_ >= end_))
                error("unterminated object", errc::unterminated_object);
            if (*ptr_ != '"') error_unexpected_char();
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            JsonValue value = parse_value();
            if (auto* existing = obj.find(key)) {
                if (!opts_.allow_duplicate_keys)
                    error("duplicate key \"" + key + "\"", errc::duplicate_key);
                *existing = std::move(value);
            } else {
                obj.append(std::move(key), std::move(value));
            }
            skip_whitespace();
            if (JSONDELTA_UNLIKELY(ptr_ >= end_))
                error("unterminated object", errc::unterminated_object);
            if (*ptr_ == '}') { ++ptr_; break; }
            expect(',');
        }
        return JsonValue(std::move(obj));
    }

    // ─── String parsing ───────────────────────────────────────────────────

    std::string parse_string() {
        expect('"');
        std::string out;
        for (;;) {
            const char* run = ptr_;
            while (ptr_ < end_ && *ptr_ != '"' && *ptr_ != '\\' &&
                   static_cast<unsigned char>(*ptr_) >= 0x20) {
                ++ptr_;
            }
            out.append(run, static_cast<size_t>(ptr_ - run));
            if (JSONDELTA_UNLIKELY(ptr_ >= end_))
                error("unterminated string", errc::unterminated_string);
            char c = *ptr_;
            if (c == '"') { ++ptr_; return out; }
            if (c == '\\') { ++ptr_; parse_escape(out); continue; }
            error("control character in string", errc::unexpected_character);
        }
    }

    void parse_escape(std::string& out) {
        if (JSONDELTA_UNLIKELY(ptr_ >= end_))
            error("unterminated escape sequence", errc::invalid_escape);
        char c = *ptr_++;
        switch (c) {
            case '"':  out.push_back('"');  return;
            case '\\': out.push_back('\\'); return;
            case '/':  out.push_back('/');  return;
            case 'b':  out.push_back('\b'); return;
            case 'f':  out.push_back('\f'); return;
            case 'n':  out.push_back('\n'); return;
            case 'r':  out.push_back('\r'); return;
            case 't':  out.push_back('\t'); return;
            case 'u':  parse_unicode_escape(out); return;
            default:
                error(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
        }
    }

    uint32_t parse_hex4() {
        if (JSONDELTA_UNLIKELY(end_ - ptr_ < 4))
            error("incomplete unicode escape", errc::invalid_unicode_escape);
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            char h = ptr_[i];
            uint32_t nib;
            if (h >= '0' && h <= '9')      nib = static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') nib = static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') nib = static_cast<uint32_t>(h - 'A' + 10);
            else error("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            val = (val << 4) | nib;
        }
        ptr_ += 4;
        return val;
    }

    void parse_unicode_escape(std::string& out) {
        uint32_t cp = parse_hex4();
        if (utf8::is_high_surrogate(cp)) {
            if (JSONDELTA_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u'))
                error("missing low surrogate", errc::invalid_unicode_escape);
            ptr_ += 2;
            uint32_t low = parse_hex4();
            if (JSONDELTA_UNLIKELY(!utf8::is_low_surrogate(low)))
                error("invalid low surrogate value", errc::invalid_unicode_escape);
            cp = utf8::combine_surrogates(cp, low);
        } else if (JSONDELTA_UNLIKELY(utf8::is_low_surrogate(cp))) {
            error("unexpected low surrogate", errc::invalid_unicode_escape);
        }
        utf8::encode(cp, out);
    }

    // ─── Number parsing ───────────────────────────────────────────────────

    static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

    JsonValue parse_number() {
        const char* start = ptr_;
        bool negative = false;
        if (*ptr_ == '-') { negative = true; ++ptr_; }
        if (JSONDELTA_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
            error("invalid number", errc::invalid_number);
        if (*ptr_ == '0') {
            ++ptr_;
            if (ptr_ < end_ && is_digit(*ptr_))
                error("leading zeros are not allowed", errc::invalid_number);
        } else {
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        bool is_float = false;
        if (ptr_ < end_ && *ptr_ == '.') {
            is_float = true;
            ++ptr_;
            if (JSONDELTA_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
                error("expected digit after decimal point", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }
        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E')) {
            is_float = true;
            ++ptr_;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) ++ptr_;
            if (JSONDELTA_UNLIKELY(ptr_ >= end_ || !is_digit(*ptr_)))
                error("expected digit in exponent", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        if (!is_float) {
            int64_t iv = 0;
            auto [p, ec] = std::from_chars(start, ptr_, iv);
            if (ec == std::errc{} && p == ptr_) return JsonValue(iv);
            if (!negative) {
                uint64_t uv = 0;
                auto [up, uec] = std::from_chars(start, ptr_, uv);
                if (uec == std::errc{} && up == ptr_) return JsonValue(uv);
            }
            // Out of 64-bit range: fall through to double.
        }
        double dv = 0.0;
        auto [p, ec] = std::from_chars(start, ptr_, dv);
        if (JSONDELTA_UNLIKELY(ec != std::errc{} || p != ptr_))
            error("number out of range", errc::invalid_number);
        return JsonValue(dv);
    }
};

} // namespace detail

// ─── Free functions ─────────────────────────────────────────────────────────

/// @brief Parse a JSON document. Throws ParseError on malformed input.
[[nodiscard]] inline JsonValue parse(std::string_view input,
                                     const ParseOptions& opts = {}) {
    return detail::Parser::parse(input, opts);
}

/// @brief Parse a JSON document without exceptions.
[[nodiscard]] inline result<JsonValue> try_parse(std::string_view input,
                                                 const ParseOptions& opts = {}) {
    try {
        return {parse(input, opts), {}};
    } catch (const ParseError& e) {
        return {JsonValue{}, e.code()};
    }
}

} // namespace jsondelta
