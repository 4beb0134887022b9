/*
 * lfpool_config.hpp
 *
 * Build toggles for the lock-free object pool. Every switch can be forced
 * from the command line (-DNAME=value); nothing here is read at runtime.
 *
 *   - LFPOOL_ASSERT(x) (default: empty)
 *       Contract-check hook. Tests define it to abort in debug builds.
 *
 *   - LFPOOL_ENABLE_EXCEPTIONS (default: follows the compiler)
 *       0 -> default allocator returns nullptr on failure, get() yields an
 *            empty guard
 *       1 -> default allocator throws std::bad_alloc out of get()
 *
 *   - LFPOOL_SPIN_YIELDS_THREAD (default: 0)
 *       0 -> spin on the locked head with the CPU pause/yield instruction
 *       1 -> spin with std::this_thread::yield() (useful under valgrind or
 *            on single-core targets)
 *
 *   - LFPOOL_REQUIRE_LOCK_FREE (default: 1)
 *       1 -> static_assert that std::atomic<node*> is always lock-free
 *
 *   - LFPOOL_FORCE_CACHELINE (default: undefined)
 *       Overrides cache-line detection, see lfpool_cacheline.hpp.
 */

#ifndef LFPOOL_CONFIG_HPP_
#define LFPOOL_CONFIG_HPP_

// assert ------------------------
#ifndef LFPOOL_ASSERT
#  define LFPOOL_ASSERT(x)
#endif /* LFPOOL_ASSERT */

// ============================================================================
// Exceptions configuration
// ============================================================================
#ifndef LFPOOL_ENABLE_EXCEPTIONS
#  if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || \
		(defined(_MSC_VER) && defined(_CPPUNWIND))
#    define LFPOOL_ENABLE_EXCEPTIONS 1
#  else
#    define LFPOOL_ENABLE_EXCEPTIONS 0
#  endif
#endif /* LFPOOL_ENABLE_EXCEPTIONS */

#ifndef LFPOOL_SPIN_YIELDS_THREAD
#  define LFPOOL_SPIN_YIELDS_THREAD 0
#endif /* LFPOOL_SPIN_YIELDS_THREAD */

#ifndef LFPOOL_REQUIRE_LOCK_FREE
#  define LFPOOL_REQUIRE_LOCK_FREE 1
#endif /* LFPOOL_REQUIRE_LOCK_FREE */

#endif /* LFPOOL_CONFIG_HPP_ */
