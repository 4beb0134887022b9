/*
 * lfpool_spin.hpp
 *
 * Spin hint for busy-waiting on the locked free-list head.
 *
 * There is no wake-up signal when the head unlocks, so waiters re-poll.
 * relax() only tells the core that it is in a spin loop:
 *   - x86/x64 : PAUSE
 *   - ARM     : YIELD
 *   - other   : std::this_thread::yield()
 * LFPOOL_SPIN_YIELDS_THREAD=1 forces the scheduler yield everywhere.
 *
 * The wait is unbounded: no backoff cap and no fallback to a
 * blocking primitive.
 */

#ifndef LFPOOL_SPIN_HPP_
#define LFPOOL_SPIN_HPP_

#include <thread>

#include "lfpool_tools.hpp"

#if !LFPOOL_SPIN_YIELDS_THREAD && (defined(__x86_64__) || defined(_M_X64) || \
		defined(__i386__) || defined(_M_IX86))
#  include <immintrin.h>
#  define LFPOOL_CPU_RELAX() _mm_pause()
#elif !LFPOOL_SPIN_YIELDS_THREAD && (defined(__aarch64__) || defined(__arm__)) && \
		(defined(__GNUC__) || defined(__clang__))
#  define LFPOOL_CPU_RELAX() __asm__ __volatile__("yield" ::: "memory")
#else
#  define LFPOOL_CPU_RELAX() std::this_thread::yield()
#endif

namespace lfpool::spin {

RB_FORCEINLINE void relax() noexcept
{
    LFPOOL_CPU_RELAX();
}

} // namespace lfpool::spin

#endif /* LFPOOL_SPIN_HPP_ */
