#pragma once

/// @file array_diff.hpp
/// @brief Array reconciler: edit script between two arrays.
///
/// Stages:
///   1. Identity per element: the configured key for object elements,
///      otherwise deep equality. Keys are computed once per element per call.
///   2. Common head and tail trimming (optionally matching containers by
///      position, see DiffOptions::array_object_item_match_by_position).
///   3. LCS over the remaining window; LCS pairs become Retain or Modify.
///   4. Unpaired elements become Delete / Insert, or Move when the same
///      identity appears on both sides outside the LCS.
///
/// All emitted indices refer to the original (untrimmed) arrays: window
/// positions are rebased by adding the head length exactly once, in
/// left_index() / right_index().

#include "compare.hpp"
#include "config.hpp"
#include "delta.hpp"
#include "options.hpp"
#include "value.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace jsondelta {
namespace detail {

/// @brief One array reconciliation. InnerDiff: (const JsonValue&, const JsonValue&) -> Delta.
template <typename InnerDiff>
class ArrayReconciler {
public:
    ArrayReconciler(const Array& left, const Array& right,
                    const DiffOptions& opts, InnerDiff& inner)
        : left_(left), right_(right), opts_(opts), inner_(inner) {}

    Delta run() {
        compute_keys();

        const size_t n_left = left_.size();
        const size_t n_right = right_.size();

        // ─── Common head ──────────────────────────────────────────────
        while (head_ < n_left && head_ < n_right && matches(head_, head_, true)) {
            place_pair(head_, head_);
            ++head_;
        }

        // ─── Common tail (never overlapping the head) ─────────────────
        size_t tail = 0;
        while (head_ + tail < n_left && head_ + tail < n_right &&
               matches(n_left - 1 - tail, n_right - 1 - tail, true)) {
            place_pair(n_left - 1 - tail, n_right - 1 - tail);
            ++tail;
        }

        // ─── Middle window ────────────────────────────────────────────
        const size_t win_left = n_left - head_ - tail;
        const size_t win_right = n_right - head_ - tail;

        std::vector<bool> left_paired(win_left, false);
        std::vector<bool> right_paired(win_right, false);
        const bool within_limit =
            win_left == 0 || win_right <= JSONDELTA_LCS_MAX_CELLS / win_left;

        if (win_left > 0 && win_right > 0 && within_limit) {
            pair_lcs(win_left, win_right, left_paired, right_paired);
        }

        // ─── Moves, inserts, deletes ──────────────────────────────────
        std::vector<bool> left_consumed = left_paired;
        for (size_t j = 0; j < win_right; ++j) {
            if (right_paired[j]) continue;
            std::optional<size_t> source;
            if (opts_.detect_array_move && within_limit) {
                for (size_t i = 0; i < win_left; ++i) {
                    if (!left_consumed[i] && matches(left_index(i), right_index(j), false)) {
                        source = i;
                        break;
                    }
                }
            }
            if (source) {
                left_consumed[*source] = true;
                const size_t from = left_index(*source);
                const size_t to = right_index(j);
                placements_.emplace_back(Move{from, to, inner_(left_[from], right_[to])});
            } else {
                const size_t to = right_index(j);
                placements_.emplace_back(Insert{to, right_[to]});
            }
        }

        ArrayDelta result;
        result.ops.reserve(win_left + placements_.size());
        for (size_t i = 0; i < win_left; ++i) {
            if (!left_consumed[i]) {
                const size_t from = left_index(i);
                result.ops.emplace_back(Delete{from, left_[from]});
            }
        }

        std::stable_sort(placements_.begin(), placements_.end(),
                         [](const ArrayOp& a, const ArrayOp& b) {
                             return *a.target() < *b.target();
                         });

        bool changed = !result.ops.empty();
        for (auto& op : placements_) {
            if (!op.is<Retain>()) changed = true;
            result.ops.push_back(std::move(op));
        }
        if (!changed) return Unchanged{};
        return result;
    }

private:
    const Array& left_;
    const Array& right_;
    const DiffOptions& opts_;
    InnerDiff& inner_;

    std::vector<std::optional<std::string>> left_keys_;
    std::vector<std::optional<std::string>> right_keys_;
    std::vector<ArrayOp> placements_;
    size_t head_ = 0;

    size_t left_index(size_t window_pos) const noexcept { return head_ + window_pos; }
    size_t right_index(size_t window_pos) const noexcept { return head_ + window_pos; }

    void compute_keys() {
        const auto& finder = opts_.array_object_item_key_finder;
        left_keys_.resize(left_.size());
        right_keys_.resize(right_.size());
        if (!finder) return;
        for (size_t i = 0; i < left_.size(); ++i)
            if (left_[i].is_object()) left_keys_[i] = finder(left_[i], i);
        for (size_t j = 0; j < right_.size(); ++j)
            if (right_[j].is_object()) right_keys_[j] = finder(right_[j], j);
    }

    /// Identity match between left[li] and right[ri] (original indices).
    bool matches(size_t li, size_t ri, bool trimming) const {
        const auto& kl = left_keys_[li];
        const auto& kr = right_keys_[ri];
        if (kl && kr) return *kl == *kr;
        if (trimming && opts_.array_object_item_match_by_position && li == ri) {
            const Kind k = kind_of(left_[li]);
            if (is_container(k) && k == kind_of(right_[ri])) return true;
        }
        return deep_equals(left_[li], right_[ri], opts_);
    }

    void place_pair(size_t from, size_t to) {
        Delta inner = inner_(left_[from], right_[to]);
        if (inner.is_unchanged()) placements_.emplace_back(Retain{from, to});
        else placements_.emplace_back(Modify{from, to, std::move(inner)});
    }

    /// LCS over the window; marks and places every pair it selects.
    void pair_lcs(size_t n, size_t m,
                  std::vector<bool>& left_paired, std::vector<bool>& right_paired) {
        std::vector<uint8_t> eq(n * m);
        for (size_t i = 0; i < n; ++i)
            for (size_t j = 0; j < m; ++j)
                eq[i * m + j] = matches(left_index(i), right_index(j), false) ? 1 : 0;

        // Suffix table: len[i][j] = LCS of left window [i, n) and right window [j, m).
        const size_t stride = m + 1;
        std::vector<uint32_t> len((n + 1) * stride, 0);
        for (size_t i = n; i-- > 0;) {
            for (size_t j = m; j-- > 0;) {
                uint32_t best = std::max(len[(i + 1) * stride + j], len[i * stride + j + 1]);
                if (eq[i * m + j]) best = std::max(best, len[(i + 1) * stride + j + 1] + 1);
                len[i * stride + j] = best;
            }
        }

        // Forward walk. A matching pair is always part of some maximal LCS;
        // on ties the right side advances so the earliest left element
        // stays available for pairing.
        size_t i = 0, j = 0;
        while (i < n && j < m) {
            if (eq[i * m + j]) {
                left_paired[i] = true;
                right_paired[j] = true;
                place_pair(left_index(i), right_index(j));
                ++i;
                ++j;
            } else if (len[i * stride + j + 1] >= len[(i + 1) * stride + j]) {
                ++j;
            } else {
                ++i;
            }
        }
    }
};

} // namespace detail

/// @brief Reconcile two arrays into an ArrayDelta (or Unchanged).
/// @param inner  Callable diffing two matched elements: (left, right) -> Delta.
template <typename InnerDiff>
[[nodiscard]] Delta reconcile_arrays(const Array& left, const Array& right,
                                     const DiffOptions& opts, InnerDiff&& inner) {
    detail::ArrayReconciler<std::remove_reference_t<InnerDiff>> rec(left, right, opts, inner);
    return rec.run();
}

} // namespace jsondelta
