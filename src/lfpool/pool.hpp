/*
 * pool.hpp
 *
 * Lock-free (mostly) object pool: a concurrent free list of heap nodes, each
 * holding one T, handed out through a move-only scoped guard.
 *
 * get():
 * - pops the front node of the free list (see lfpool_free_list.hpp for the
 *   brief lock that closes the ABA window), or
 * - if the list is empty, allocates a node and builds its value with the
 *   construction function. The list is never locked while it runs.
 *
 * guard:
 * - exclusive access to one value for its lifetime,
 * - pushes the node back onto the free list when destroyed or reset().
 *
 * Nodes are never freed individually: they live until the pool is destroyed,
 * which frees every node on the free list.
 *
 * Contract:
 * - No guard may outlive its pool. Destroying a pool with outstanding guards
 *   is undefined behavior (the guards dangle, their nodes leak).
 * - The construction function may run concurrently on several threads when
 *   the pool is shared.
 *
 * Failure:
 * - get() never returns an empty guard. Allocation failure is fatal: it
 *   throws std::bad_alloc when LFPOOL_ENABLE_EXCEPTIONS is set and aborts
 *   otherwise, whether the allocator threw or returned nullptr.
 * - A throwing construction function leaves the pool untouched.
 * - The construction function is always called through a const reference.
 */

#ifndef LFPOOL_POOL_HPP_
#define LFPOOL_POOL_HPP_

#include <atomic>
#include <cstdlib>
#include <functional>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "base/lfpool_alloc.hpp"      // ::lfpool::alloc::default_alloc
#include "base/lfpool_cacheline.hpp"  // ::lfpool::hw::cacheline_bytes
#include "base/lfpool_free_list.hpp"  // ::lfpool::free_list_head
#include "base/lfpool_tools.hpp"      // RB_*, LFPOOL_TRY/CATCH_ALL/RETHROW
#include "base/lfpool_traits.hpp"     // thread capability markers

namespace lfpool {

template <class T> struct default_create {
    [[nodiscard]] T operator()() const { return T{}; }
};

// F is usable as the construction function of a pool<T, F>: callable with no
// arguments through a const reference, yielding something T is built from.
template <class F, class T, class = void>
struct is_create_function : std::false_type {};

template <class F, class T>
struct is_create_function<F, T, std::enable_if_t<std::is_invocable_v<const F &>>>
    : std::bool_constant<
          std::is_same_v<std::remove_cv_t<std::invoke_result_t<const F &>>, T> ||
          std::is_constructible_v<T, std::invoke_result_t<const F &>>> {};

template <class F, class T>
inline constexpr bool is_create_function_v = is_create_function<F, T>::value;

/* =======================================================================
 * pool<T, Create, Alloc>
 * ======================================================================= */
template <class T, class Create = default_create<T>,
          class Alloc = ::lfpool::alloc::default_alloc>
class pool {
    struct node {
        std::atomic<node *> next{nullptr};
        T value;

        explicit node(const Create &create) : value(std::invoke(create)) {}
    };

    using list_type = ::lfpool::free_list_head<node>;

public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using value_type = T;
    using pointer = T *;
    using const_pointer = const T *;
    using reference = T &;
    using const_reference = const T &;
    using create_type = Create;
    using size_type = reg;

    using base_allocator_type = Alloc;
    using node_allocator_type = typename std::allocator_traits<
        base_allocator_type>::template rebind_alloc<node>;
    using node_alloc_traits = std::allocator_traits<node_allocator_type>;

    // Shared by reference across threads: values travel between threads and
    // the construction function runs concurrently.
    static constexpr bool is_shareable =
        ::lfpool::is_thread_transferable_v<T> &&
        ::lfpool::is_concurrently_invocable_v<Create>;

    // Moved to another thread as a whole.
    static constexpr bool is_transferable =
        ::lfpool::is_thread_transferable_v<T> &&
        ::lfpool::is_thread_transferable_v<Create>;

    // ------------------------------------------------------------------------------------------
    // Static Assertions
    // ------------------------------------------------------------------------------------------
    static_assert(!std::is_reference_v<T> && !std::is_const_v<T>,
                  "[lfpool::pool]: T must be a non-const object type.");
    static_assert(std::is_invocable_v<const Create &>,
                  "[lfpool::pool]: Create must be callable with no arguments through a const reference.");
    static_assert(::lfpool::is_create_function_v<Create, T>,
                  "[lfpool::pool]: T must be constructible from Create's result.");
    static_assert(node_alloc_traits::is_always_equal::value,
                  "[lfpool::pool]: node allocator must be always_equal (stateless).");
    static_assert(std::is_default_constructible_v<node_allocator_type>,
                  "[lfpool::pool]: node allocator must be default-constructible.");
    static_assert(std::is_same_v<typename node_alloc_traits::pointer, node *>,
                  "[lfpool::pool]: node allocator pointer type must be raw.");

    /* -------------------------------------------------------------------
     * guard
     * ------------------------------------------------------------------- */
    class guard {
    public:
        using value_type = T;
        using pointer = T *;
        using const_pointer = const T *;

        static constexpr bool is_transferable = ::lfpool::is_thread_transferable_v<T>;
        static constexpr bool is_shareable = ::lfpool::is_thread_shareable_v<T>;

        guard() noexcept = default;

        guard(const guard &) = delete;
        guard &operator=(const guard &) = delete;

        guard(guard &&other) noexcept : p_(other.p_), node_(other.node_) {
            other.p_ = nullptr;
            other.node_ = nullptr;
        }

        guard &operator=(guard &&) = delete;

        ~guard() noexcept { reset(); }

        [[nodiscard]] pointer get() noexcept {
            return node_ ? &node_->value : nullptr;
        }
        [[nodiscard]] const_pointer get() const noexcept {
            return node_ ? &node_->value : nullptr;
        }

        [[nodiscard]] T &operator*() noexcept {
            LFPOOL_ASSERT(node_ && "pool::guard: dereferencing an empty guard");
            return node_->value;
        }
        [[nodiscard]] const T &operator*() const noexcept {
            LFPOOL_ASSERT(node_ && "pool::guard: dereferencing an empty guard");
            return node_->value;
        }

        [[nodiscard]] pointer operator->() noexcept {
            LFPOOL_ASSERT(node_ && "pool::guard: dereferencing an empty guard");
            return &node_->value;
        }
        [[nodiscard]] const_pointer operator->() const noexcept {
            LFPOOL_ASSERT(node_ && "pool::guard: dereferencing an empty guard");
            return &node_->value;
        }

        explicit operator bool() const noexcept { return node_ != nullptr; }

        // Gives the value back to the pool now. The guard is empty afterwards.
        void reset() noexcept {
            if (!node_) {
                return;
            }
            p_->list_.push(node_);
            p_ = nullptr;
            node_ = nullptr;
        }

    private:
        friend class pool;

        guard(pool &p, node *n) noexcept : p_(&p), node_(n) {
            LFPOOL_ASSERT(n != nullptr && "pool::guard: built without a node");
        }

        pool *p_{nullptr};
        node *node_{nullptr};
    };

    // ------------------------------------------------------------------------------------------
    // Constructors / Destructor
    // ------------------------------------------------------------------------------------------

    template <class C = Create,
              typename = std::enable_if_t<std::is_default_constructible_v<C>>>
    pool() noexcept(std::is_nothrow_default_constructible_v<C>) : create_() {}

    explicit pool(Create create) noexcept(std::is_nothrow_move_constructible_v<Create>)
        : create_(std::move(create)) {}

    // Precondition: no outstanding guards.
    ~pool() noexcept { destroy_free_nodes_(); }

    pool(const pool &) = delete;
    pool &operator=(const pool &) = delete;
    pool(pool &&) = delete;
    pool &operator=(pool &&) = delete;

    // ------------------------------------------------------------------------------------------
    // Acquisition
    // ------------------------------------------------------------------------------------------

    [[nodiscard]] guard get() {
        if (node *const n = list_.pop()) {
            return guard(*this, n);
        }
        return guard(*this, make_node_());
    }

    // ------------------------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------------------------

    [[nodiscard]] const Create &create_function() const noexcept { return create_; }

    [[nodiscard]] constexpr base_allocator_type get_allocator() const noexcept {
        return base_allocator_type{};
    }

    // Quiescent-only (no concurrent get()/release): false if the free list is
    // locked or cyclic, otherwise *out_nodes receives the number of free nodes.
    [[nodiscard]] bool check_free_list(size_type *out_nodes = nullptr) const noexcept {
        return list_.check_chain(out_nodes);
    }

private:
    RB_NOINLINE node *make_node_() {
        node_allocator_type a{};
        node *const n = node_alloc_traits::allocate(a, 1u);
        if (RB_UNLIKELY(n == nullptr)) {
            out_of_memory_();
        }

        LFPOOL_TRY {
            node_alloc_traits::construct(a, n, std::as_const(create_));
        }
        LFPOOL_CATCH_ALL {
            node_alloc_traits::deallocate(a, n, 1u);
            LFPOOL_RETHROW;
        }
        return n;
    }

    [[noreturn]] static void out_of_memory_() {
#if LFPOOL_ENABLE_EXCEPTIONS
        throw std::bad_alloc{};
#else
        std::abort();
#endif
    }

    void destroy_free_nodes_() noexcept {
        node_allocator_type a{};
        node *n = list_.take_all_unsynchronized();
        while (n != nullptr) {
            node *const next = n->next.load(std::memory_order_relaxed);
            node_alloc_traits::destroy(a, n);
            node_alloc_traits::deallocate(a, n, 1u);
            n = next;
        }
    }

    alignas(::lfpool::hw::cacheline_bytes) list_type list_;
    alignas(::lfpool::hw::cacheline_bytes) Create create_;
};

template <class F>
pool(F) -> pool<std::remove_cvref_t<std::invoke_result_t<const F &>>, F>;

} // namespace lfpool

#endif /* LFPOOL_POOL_HPP_ */
