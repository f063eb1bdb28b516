#pragma once

/// @file path_context.hpp
/// @brief Call-scoped JSON Pointer accumulator.
///
/// Every diff, format and patch call creates its own PathContext on the
/// stack and passes it by reference through the recursion; a PathContext is
/// never stored in a reusable object. Segments are pushed and popped with an
/// RAII Scope so that an exception unwinding the recursion leaves the
/// context consistent.
///
/// The rendered pointer is cached: pointer() appends only the segments
/// pushed since the last render, and pop() truncates the cache.

#include "json_pointer.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jsondelta {

class PathContext {
public:
    /// Pops its segment on destruction.
    class Scope {
    public:
        explicit Scope(PathContext& ctx) noexcept : ctx_(&ctx) {}
        ~Scope() { if (ctx_) ctx_->pop(); }

        Scope(Scope&& o) noexcept : ctx_(o.ctx_) { o.ctx_ = nullptr; }
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Scope& operator=(Scope&&) = delete;

    private:
        PathContext* ctx_;
    };

    PathContext() = default;
    PathContext(const PathContext&) = delete;
    PathContext& operator=(const PathContext&) = delete;

    /// Push an object property name.
    [[nodiscard]] Scope push(std::string_view name) {
        segments_.push_back(escape_token(name));
        return Scope(*this);
    }

    /// Push an array index.
    [[nodiscard]] Scope push(size_t index) {
        segments_.push_back(std::to_string(index));
        return Scope(*this);
    }

    /// Current location as an RFC 6901 pointer ("" is the root).
    [[nodiscard]] const std::string& pointer() const {
        while (offsets_.size() < segments_.size()) {
            offsets_.push_back(rendered_.size());
            rendered_ += '/';
            rendered_ += segments_[offsets_.size() - 1];
        }
        return rendered_;
    }

    /// Pointer to a child of the current location, without pushing.
    [[nodiscard]] std::string child(std::string_view name) const {
        std::string p = pointer();
        p += '/';
        append_escaped_token(p, name);
        return p;
    }

    [[nodiscard]] std::string child(size_t index) const {
        return pointer() + '/' + std::to_string(index);
    }

    [[nodiscard]] size_t depth() const noexcept { return segments_.size(); }

private:
    std::vector<std::string> segments_;      ///< Escaped segments
    mutable std::string rendered_;           ///< Cached "/a/b/0" prefix
    mutable std::vector<size_t> offsets_;    ///< rendered_ length before each segment

    void pop() noexcept {
        segments_.pop_back();
        if (offsets_.size() > segments_.size()) {
            rendered_.resize(offsets_[segments_.size()]);
            offsets_.resize(segments_.size());
        }
    }
};

} // namespace jsondelta
