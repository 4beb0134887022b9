/*
 * lfpool_cacheline.hpp
 *
 * Cache-line size deduction used to keep the free-list head on its own line.
 *
 * Exposes:
 *   - Macro  LFPOOL_CACHELINE_BYTES  : detected / forced cache-line size in bytes
 *   - C++    lfpool::hw::cacheline_bytes : constexpr mirror of the macro
 *
 * Override with -DLFPOOL_FORCE_CACHELINE=128.
 *
 * Detection order:
 *   1) Explicit user override
 *   2) Apple ARM64 (128B L1D lines in practice)
 *   3) PowerPC (128B)
 *   4) x86/x64 and ARM A-profile (64B)
 *   5) Fallback (64B)
 */

#ifndef LFPOOL_CACHELINE_HPP_
#define LFPOOL_CACHELINE_HPP_

#include "lfpool_config.hpp"

#ifndef LFPOOL_CACHELINE_MIN
#  define LFPOOL_CACHELINE_MIN 32u
#endif /* LFPOOL_CACHELINE_MIN */

#ifndef LFPOOL_CACHELINE_BYTES
# if defined(LFPOOL_FORCE_CACHELINE)
#   define LFPOOL_CACHELINE_BYTES (0u + LFPOOL_FORCE_CACHELINE)
# elif defined(__APPLE__) && defined(__aarch64__)
#   define LFPOOL_CACHELINE_BYTES 128u
# elif defined(__powerpc64__) || defined(__ppc64__) || \
		defined(__powerpc__)   || defined(__ppc__)
#   define LFPOOL_CACHELINE_BYTES 128u
# elif defined(__x86_64__) || defined(_M_X64) || \
		defined(__i386__)   || defined(_M_IX86)
#   define LFPOOL_CACHELINE_BYTES 64u
# elif defined(__aarch64__) || defined(_M_ARM64) || defined(__arm__) || defined(_M_ARM)
#   define LFPOOL_CACHELINE_BYTES 64u
# else
#   define LFPOOL_CACHELINE_BYTES 64u
# endif
#endif /* !LFPOOL_CACHELINE_BYTES */

#if (LFPOOL_CACHELINE_BYTES < LFPOOL_CACHELINE_MIN)
#  undef  LFPOOL_CACHELINE_BYTES
#  define LFPOOL_CACHELINE_BYTES LFPOOL_CACHELINE_MIN
#endif

#if ((LFPOOL_CACHELINE_BYTES & (LFPOOL_CACHELINE_BYTES - 1u)) != 0)
#  error "LFPOOL_CACHELINE_BYTES must be a power-of-two"
#endif

namespace lfpool::hw {
	inline constexpr unsigned cacheline_bytes = LFPOOL_CACHELINE_BYTES;
}

#endif /* LFPOOL_CACHELINE_HPP_ */
