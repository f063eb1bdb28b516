#pragma once

/// @file config.hpp
/// @brief Configuration macros for the jsondelta library.
///
/// Controls:
///   - Branch prediction hints
///   - Recursion depth limit shared by the parser, differ and patcher
///   - LCS table size limit for the array reconciler
///   - Object lookup strategy threshold

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define JSONDELTA_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define JSONDELTA_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define JSONDELTA_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define JSONDELTA_LIKELY(x)   (x)
    #define JSONDELTA_UNLIKELY(x) (x)
    #define JSONDELTA_NOINLINE    __declspec(noinline)
#else
    #define JSONDELTA_LIKELY(x)   (x)
    #define JSONDELTA_UNLIKELY(x) (x)
    #define JSONDELTA_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Applies to parsing, diffing, formatting and patching alike.

#if !defined(JSONDELTA_MAX_DEPTH)
    #define JSONDELTA_MAX_DEPTH 512
#endif

// =====================================================================
// LCS table limit
// =====================================================================
// Maximum number of (left x right) cells the array reconciler allocates
// for the LCS table of the window left after head/tail trimming. Larger
// windows degrade to delete-all + insert-all, which is still a correct
// (but not minimal) edit script.

#if !defined(JSONDELTA_LCS_MAX_CELLS)
    #define JSONDELTA_LCS_MAX_CELLS (16u * 1024u * 1024u)
#endif

// =====================================================================
// Small object threshold for linear vs hash lookup
// =====================================================================

#if !defined(JSONDELTA_OBJECT_INDEX_THRESHOLD)
    #define JSONDELTA_OBJECT_INDEX_THRESHOLD 16
#endif
