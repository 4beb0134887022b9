/*
 * lfpool_tools.hpp
 *
 * Portability helpers shared by the pool headers:
 * - force-inline / no-inline attributes,
 * - branch prediction hints,
 * - exception helpers that collapse to no-ops when exceptions are off.
 *
 * Notes:
 * - For GCC/Clang, 'always_inline' is honored only if the function body
 *   is visible. Keep the definition in the header if you expect inlining.
 */

#ifndef LFPOOL_TOOLS_HPP_
#define LFPOOL_TOOLS_HPP_

#include "lfpool_config.hpp"

/* ---------------------------------------------------------------------------
 * RB_FORCEINLINE: "strong" inlining hint for headers
 * ------------------------------------------------------------------------- */
#ifndef RB_FORCEINLINE
#  if defined(_MSC_VER)
#    define RB_FORCEINLINE __forceinline
#  elif defined(__clang__) || defined(__GNUC__)
#    define RB_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define RB_FORCEINLINE inline
#  endif
#endif /* RB_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * RB_NOINLINE: keep slow paths (node allocation) out of the hot loop.
 * ------------------------------------------------------------------------- */
#ifndef RB_NOINLINE
#  if defined(_MSC_VER)
#    define RB_NOINLINE __declspec(noinline)
#  elif defined(__clang__) || defined(__GNUC__)
#    define RB_NOINLINE __attribute__((noinline))
#  else
#    define RB_NOINLINE
#  endif
#endif /* RB_NOINLINE */

/* ---------------------------------------------------------------------------
 * Branch prediction hints.
 * Separate guards prevent losing RB_UNLIKELY if RB_LIKELY is predefined.
 * ------------------------------------------------------------------------- */
#ifndef RB_LIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define RB_LIKELY(x)   __builtin_expect(!!(x), 1)
#  else
#    define RB_LIKELY(x)   (x)
#  endif
#endif /* RB_LIKELY */

#ifndef RB_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define RB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define RB_UNLIKELY(x) (x)
#  endif
#endif /* RB_UNLIKELY */

// ============================================================================
// Exceptions helpers
// ============================================================================

static_assert(LFPOOL_ENABLE_EXCEPTIONS == 0 || LFPOOL_ENABLE_EXCEPTIONS == 1,
              "LFPOOL_ENABLE_EXCEPTIONS must be 0 or 1");

#if LFPOOL_ENABLE_EXCEPTIONS
#  if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
		!(defined(_MSC_VER) && defined(_CPPUNWIND))
#    error "LFPOOL_ENABLE_EXCEPTIONS=1 but compiler appears to have exceptions disabled"
#  endif
#endif /* LFPOOL_ENABLE_EXCEPTIONS */

#if !defined(LFPOOL_TRY)
#  if LFPOOL_ENABLE_EXCEPTIONS
#    define LFPOOL_TRY       try
#    define LFPOOL_CATCH_ALL catch (...)
#    define LFPOOL_RETHROW   throw
#  else
#    define LFPOOL_TRY
#    define LFPOOL_CATCH_ALL if constexpr (false)
#    define LFPOOL_RETHROW
#  endif
#endif /* LFPOOL_TRY */

#endif /* LFPOOL_TOOLS_HPP_ */
