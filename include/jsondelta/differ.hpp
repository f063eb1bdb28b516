#pragma once

/// @file differ.hpp
/// @brief Tree differ and object reconciler.
///
/// diff(left, right) walks both trees once:
///   - different kinds          -> Modified(left, right)
///   - scalars                  -> Unchanged or Modified
///   - objects                  -> ObjectDelta over the union of names
///   - arrays                   -> ArrayDelta (see array_diff.hpp)
///
/// The differ is a pure function of its inputs; all recursion state lives
/// in a detail::Differ created per call.

#include "array_diff.hpp"
#include "compare.hpp"
#include "config.hpp"
#include "delta.hpp"
#include "error.hpp"
#include "options.hpp"
#include "value.hpp"

#include <optional>
#include <string>
#include <utility>

namespace jsondelta {
namespace detail {

class Differ {
public:
    explicit Differ(const DiffOptions& opts) noexcept : opts_(opts) {}

    Delta diff(const JsonValue& left, const JsonValue& right) {
        const Kind kl = kind_of(left);
        const Kind kr = kind_of(right);
        if (kl != kr) return Modified{left, right};

        switch (kl) {
            case Kind::Object: {
                DepthGuard guard(*this);
                return diff_objects(left, right);
            }
            case Kind::Array: {
                DepthGuard guard(*this);
                auto inner = [this](const JsonValue& l, const JsonValue& r) { return diff(l, r); };
                return reconcile_arrays(left.as_array(), right.as_array(), opts_, inner);
            }
            default:
                if (scalar_equal(left, right, opts_)) return Unchanged{};
                return Modified{left, right};
        }
    }

private:
    const DiffOptions& opts_;
    size_t depth_ = 0;

    class DepthGuard {
    public:
        explicit DepthGuard(Differ& d) : d_(d) {
            if (JSONDELTA_UNLIKELY(++d_.depth_ > JSONDELTA_MAX_DEPTH)) {
                --d_.depth_;
                throw std::system_error(make_error_code(errc::max_depth_exceeded),
                                        "diff: maximum nesting depth exceeded");
            }
        }
        ~DepthGuard() { --d_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
    private:
        Differ& d_;
    };

    bool included(const std::string& name, const JsonValue& left, const JsonValue& right) const {
        return !opts_.property_filter || opts_.property_filter(name, left, right);
    }

    Delta diff_objects(const JsonValue& left, const JsonValue& right) {
        const Object& lo = left.as_object();
        const Object& ro = right.as_object();
        ObjectDelta result;

        for (const auto& [name, lval] : lo) {
            if (!included(name, left, right)) continue;
            const JsonValue* rval = ro.find(name);
            if (!rval) {
                result.properties.emplace_back(name, Removed{lval});
                continue;
            }
            Delta child = diff(lval, *rval);
            if (!child.is_unchanged()) result.properties.emplace_back(name, std::move(child));
        }
        for (const auto& [name, rval] : ro) {
            if (lo.contains(name) || !included(name, left, right)) continue;
            result.properties.emplace_back(name, Added{rval});
        }

        if (result.properties.empty()) return Unchanged{};
        return result;
    }
};

} // namespace detail

/// @brief Structural difference between two documents.
/// @return std::nullopt when the documents are equal under @p opts.
[[nodiscard]] inline std::optional<Delta> diff(const JsonValue& left, const JsonValue& right,
                                               const DiffOptions& opts = {}) {
    detail::Differ differ(opts);
    Delta d = differ.diff(left, right);
    if (d.is_unchanged()) return std::nullopt;
    return d;
}

} // namespace jsondelta
