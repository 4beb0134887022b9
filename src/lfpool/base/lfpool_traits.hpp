/*
 * lfpool_traits.hpp
 *
 * Cross-thread capability markers.
 *
 * C++ has no compiler-checked notion of "may be moved to another thread" or
 * "may be read from several threads at once", so the pool carries them as
 * opt-out traits on the value type and on the construction function:
 *
 *   is_thread_transferable<T>    : ownership of a T may move to another thread
 *   is_thread_shareable<T>       : a const T& may be read from several threads
 *   is_concurrently_invocable<F> : F may be called from several threads at once
 *
 * All three default to true. Specialize to std::false_type for thread-affine
 * types (thread-local handles, non-reentrant factories, ...):
 *
 *   template <> struct lfpool::is_thread_transferable<MyTlsHandle> : std::false_type {};
 *
 * pool and pool::guard derive their own constants from these, and the
 * require_*() gates turn them into compile errors at the call site that is
 * about to hand a pool or guard to another thread.
 */

#ifndef LFPOOL_TRAITS_HPP_
#define LFPOOL_TRAITS_HPP_

#include <type_traits>

namespace lfpool {

template <class T> struct is_thread_transferable : std::true_type {};
template <class T> struct is_thread_shareable : std::true_type {};
template <class F> struct is_concurrently_invocable : std::true_type {};

template <class T>
inline constexpr bool is_thread_transferable_v =
    is_thread_transferable<std::remove_cv_t<T>>::value;

template <class T>
inline constexpr bool is_thread_shareable_v =
    is_thread_shareable<std::remove_cv_t<T>>::value;

template <class F>
inline constexpr bool is_concurrently_invocable_v =
    is_concurrently_invocable<std::remove_cv_t<F>>::value;

// Compile-time gates. X is a pool or a guard type.
template <class X> constexpr void require_shareable() noexcept {
    static_assert(X::is_shareable,
                  "[lfpool]: type may not be shared across threads "
                  "(check is_thread_transferable / is_thread_shareable / "
                  "is_concurrently_invocable specializations)");
}

template <class X> constexpr void require_transferable() noexcept {
    static_assert(X::is_transferable,
                  "[lfpool]: type may not be moved to another thread "
                  "(check is_thread_transferable specializations)");
}

} // namespace lfpool

#endif /* LFPOOL_TRAITS_HPP_ */
