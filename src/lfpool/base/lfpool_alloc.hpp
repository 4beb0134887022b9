/*
 * lfpool_alloc.hpp
 *
 * Default node allocator for lfpool::pool.
 *
 * The pool rebinds the allocator to its node type and asks for one node at a
 * time, only when the free list is empty. The failure mode is a template
 * knob:
 *   - fail_mode::throws       : allocate() throws std::bad_alloc
 *   - fail_mode::returns_null : allocate() returns nullptr; pool::get()
 *                               turns that into std::bad_alloc, or abort()
 *                               without exceptions
 *
 * default_alloc picks the mode from LFPOOL_ENABLE_EXCEPTIONS.
 * Over-aligned node types go through aligned operator new/delete.
 */

#ifndef LFPOOL_ALLOC_HPP_
#define LFPOOL_ALLOC_HPP_

#include <cstddef>     // std::size_t, std::byte, std::ptrdiff_t
#include <limits>      // std::numeric_limits
#include <new>         // std::nothrow, std::align_val_t, std::bad_alloc
#include <type_traits> // std::true_type

#include "lfpool_tools.hpp"

namespace lfpool::alloc {

enum class fail_mode : unsigned {
    throws,        // allocate() throws std::bad_alloc on failure (requires LFPOOL_ENABLE_EXCEPTIONS != 0)
    returns_null   // allocate() returns nullptr on failure
};

namespace detail {

#if defined(__STDCPP_DEFAULT_NEW_ALIGNMENT__)
inline constexpr std::size_t kDefaultNewAlign = __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
inline constexpr std::size_t kDefaultNewAlign = alignof(std::max_align_t);
#endif

template<class T>
inline constexpr bool needs_overaligned_alloc = (alignof(T) > kDefaultNewAlign);

template<fail_mode Mode>
[[nodiscard]] inline void* fail_ptr() noexcept(Mode == fail_mode::returns_null)
{
    static_assert((Mode != fail_mode::throws) || (LFPOOL_ENABLE_EXCEPTIONS != 0),
                  "fail_mode::throws requires LFPOOL_ENABLE_EXCEPTIONS != 0");

    if constexpr (Mode == fail_mode::throws) {
#if (LFPOOL_ENABLE_EXCEPTIONS != 0)
        throw std::bad_alloc{};
#else
        return nullptr;
#endif
    } else {
        return nullptr;
    }
}

} // namespace detail

// ============================================================================
// basic_allocator<T, Mode>
// ============================================================================

template<class T, fail_mode Mode>
class basic_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal                        = std::true_type;

    static_assert((Mode != fail_mode::throws) || (LFPOOL_ENABLE_EXCEPTIONS != 0),
                  "basic_allocator: fail_mode::throws requires exceptions");

    static constexpr fail_mode mode = Mode;

    basic_allocator() noexcept = default;

    template<class U>
    basic_allocator(const basic_allocator<U, Mode>&) noexcept {}

    [[nodiscard]] T* allocate(size_type n) noexcept(Mode == fail_mode::returns_null)
    {
        if (RB_UNLIKELY(n == 0u)) {
            return nullptr;
        }

        if (RB_UNLIKELY(n > (std::numeric_limits<size_type>::max() / sizeof(T)))) {
            return static_cast<T*>(detail::fail_ptr<Mode>());
        }

        const size_type bytes = n * sizeof(T);

        if constexpr (!detail::needs_overaligned_alloc<T>) {
            if constexpr (Mode == fail_mode::throws) {
                return static_cast<T*>(::operator new(bytes));
            } else {
                return static_cast<T*>(::operator new(bytes, std::nothrow));
            }
        } else {
            if constexpr (Mode == fail_mode::throws) {
                return static_cast<T*>(::operator new(bytes, std::align_val_t{alignof(T)}));
            } else {
                return static_cast<T*>(::operator new(bytes, std::align_val_t{alignof(T)}, std::nothrow));
            }
        }
    }

    void deallocate(T* p, size_type /*n*/) noexcept
    {
        if (RB_UNLIKELY(!p)) {
            return;
        }

        if constexpr (!detail::needs_overaligned_alloc<T>) {
            ::operator delete(p);
        } else {
            ::operator delete(p, std::align_val_t{alignof(T)});
        }
    }

    template<class U>
    struct rebind {
        using other = basic_allocator<U, Mode>;
    };
};

template<class T1, fail_mode M1, class T2, fail_mode M2>
inline bool operator==(const basic_allocator<T1, M1>&,
                       const basic_allocator<T2, M2>&) noexcept
{
    return M1 == M2;
}

template<class T1, fail_mode M1, class T2, fail_mode M2>
inline bool operator!=(const basic_allocator<T1, M1>& a,
                       const basic_allocator<T2, M2>& b) noexcept
{
    return !(a == b);
}

// ============================================================================
// Default allocator alias
// ============================================================================

using default_alloc = basic_allocator<std::byte,
    (LFPOOL_ENABLE_EXCEPTIONS != 0) ? fail_mode::throws : fail_mode::returns_null
>;

} // namespace lfpool::alloc

#endif /* LFPOOL_ALLOC_HPP_ */
