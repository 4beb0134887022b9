/*
 * lfpool_free_list.hpp
 *
 * Intrusive free-list head with a three-state atomic:
 *
 *   empty    : head == nullptr
 *   locked   : head == locked sentinel, a pop is between claiming the front
 *              node and publishing its successor
 *   occupied : head points at the front node
 *
 * pop() briefly locks the list so that it reads front->next only after the
 * front node is exclusively claimed. A plain CAS(head, front, front->next)
 * would read 'next' before the claim, and a concurrent pop/push of the same
 * node in between makes that read stale (ABA). push() never reads another
 * node, so it is a plain CAS loop that only waits while the list is locked.
 *
 * Node requirements:
 *   - public member 'std::atomic<Node*> next'
 *   - alignof(Node) > 1, so no node can sit at the (odd) sentinel address
 *
 * Memory ordering (Orders knob, default_orders):
 *   - push publishes with release, pop claims with acquire: writes made to a
 *     node before push() are visible to the thread whose pop() returns it.
 *   - the unlock store is release as well, so that the next acquirer of the
 *     successor still synchronizes with the push that originally stored it.
 *
 * Concurrency note:
 * - pop/push are MPMC-safe.
 * - take_all_unsynchronized/check_chain are NOT concurrent with pop/push.
 */

#ifndef LFPOOL_FREE_LIST_HPP_
#define LFPOOL_FREE_LIST_HPP_

#include <atomic>
#include <type_traits>
#include <utility>

#include "basic_types.h"        // reg, reg_ptr
#include "lfpool_spin.hpp"      // ::lfpool::spin::relax
#include "lfpool_tools.hpp"

namespace lfpool {

enum class head_state : unsigned {
    empty,
    locked,
    occupied
};

struct default_orders {
    static constexpr std::memory_order observe = std::memory_order_relaxed; // plain polls of head
    static constexpr std::memory_order lock    = std::memory_order_acquire; // CAS front -> locked
    static constexpr std::memory_order unlock  = std::memory_order_release; // store successor
    static constexpr std::memory_order publish = std::memory_order_release; // CAS head -> pushed node
};

namespace detail {

constexpr bool valid_load_order(std::memory_order mo) {
    return mo == std::memory_order_relaxed || mo == std::memory_order_consume ||
           mo == std::memory_order_acquire || mo == std::memory_order_seq_cst;
}

constexpr bool valid_store_order(std::memory_order mo) {
    return mo == std::memory_order_relaxed || mo == std::memory_order_release ||
           mo == std::memory_order_seq_cst;
}

constexpr bool is_acquire_like(std::memory_order mo) {
    return mo == std::memory_order_acquire || mo == std::memory_order_acq_rel ||
           mo == std::memory_order_seq_cst;
}

constexpr bool is_release_like(std::memory_order mo) {
    return mo == std::memory_order_release || mo == std::memory_order_acq_rel ||
           mo == std::memory_order_seq_cst;
}

} // namespace detail

/* =======================================================================
 * free_list_head<Node, Orders>
 * ======================================================================= */
template <class Node, class Orders = default_orders>
class free_list_head {
public:
    using node_type = Node;
    using pointer = Node *;
    using size_type = reg;
    using orders_type = Orders;

    static_assert(std::is_same_v<decltype(std::declval<Node &>().next), std::atomic<Node *>>,
                  "[lfpool::free_list_head]: Node must expose 'std::atomic<Node*> next'.");
    static_assert(alignof(Node) > 1u,
                  "[lfpool::free_list_head]: Node alignment must exclude the locked sentinel address.");
    static_assert(detail::valid_load_order(Orders::observe),
                  "[lfpool::free_list_head]: invalid observe memory_order");
    static_assert(detail::valid_store_order(Orders::unlock),
                  "[lfpool::free_list_head]: invalid unlock memory_order");
    static_assert(detail::is_acquire_like(Orders::lock),
                  "[lfpool::free_list_head]: lock must be at least acquire");
    static_assert(detail::is_release_like(Orders::publish),
                  "[lfpool::free_list_head]: publish must be at least release");
    static_assert(detail::is_release_like(Orders::unlock),
                  "[lfpool::free_list_head]: unlock must be at least release");

#if LFPOOL_REQUIRE_LOCK_FREE
    static_assert(std::atomic<pointer>::is_always_lock_free,
                  "[lfpool::free_list_head]: std::atomic<Node*> is not always lock-free on this target");
#endif /* LFPOOL_REQUIRE_LOCK_FREE */

    free_list_head() noexcept = default;

    free_list_head(const free_list_head &) = delete;
    free_list_head &operator=(const free_list_head &) = delete;
    free_list_head(free_list_head &&) = delete;
    free_list_head &operator=(free_list_head &&) = delete;

    // ------------------------------------------------------------------------------------------
    // State machine
    // ------------------------------------------------------------------------------------------

    // All-ones address: odd, so never a valid Node*, and never nullptr.
    [[nodiscard]] static pointer locked_sentinel() noexcept {
        return reinterpret_cast<pointer>(~reg_ptr{0});
    }

    [[nodiscard]] static head_state classify(const Node *p) noexcept {
        if (p == nullptr) {
            return head_state::empty;
        }
        if (p == locked_sentinel()) {
            return head_state::locked;
        }
        return head_state::occupied;
    }

    // Snapshot only; may be stale by the time the caller looks at it.
    [[nodiscard]] head_state state() const noexcept {
        return classify(head_.load(Orders::observe));
    }

    // ------------------------------------------------------------------------------------------
    // Concurrent operations
    // ------------------------------------------------------------------------------------------

    // Detaches the front node, or returns nullptr when the list is empty.
    [[nodiscard]] pointer pop() noexcept {
        return pop([](pointer) noexcept {});
    }

    // Same as pop(), but runs on_locked(front) while the list is locked,
    // between the claim and the unlock. on_locked must not touch this list.
    template <class OnLocked>
    [[nodiscard]] pointer pop(OnLocked &&on_locked) noexcept(
        noexcept(std::forward<OnLocked>(on_locked)(std::declval<pointer>()))) {
        pointer front = head_.load(Orders::observe);
        while (front != nullptr) {
            if (RB_UNLIKELY(front == locked_sentinel())) {
                ::lfpool::spin::relax();
                front = head_.load(Orders::observe);
                continue;
            }

            if (head_.compare_exchange_weak(front, locked_sentinel(), Orders::lock,
                                            std::memory_order_relaxed)) {
                // Locked: front is detached and exclusively ours.
                pointer const next = front->next.load(std::memory_order_relaxed);
                std::forward<OnLocked>(on_locked)(front);
                unlock_(next);
                return front;
            }
            // CAS failed: 'front' now holds the freshly observed head.
        }
        return nullptr;
    }

    void push(pointer n) noexcept {
        LFPOOL_ASSERT(n != nullptr && "free_list_head::push(): null node");
        LFPOOL_ASSERT(n != locked_sentinel() && "free_list_head::push(): sentinel is not a node");

        pointer head = head_.load(Orders::observe);
        for (;;) {
            if (RB_UNLIKELY(head == locked_sentinel())) {
                ::lfpool::spin::relax();
                head = head_.load(Orders::observe);
                continue;
            }

            // Not published yet: n is still exclusively ours.
            n->next.store(head, std::memory_order_relaxed);

            if (head_.compare_exchange_weak(head, n, Orders::publish,
                                            std::memory_order_relaxed)) {
                return;
            }
        }
    }

    // ------------------------------------------------------------------------------------------
    // Quiescent-only operations (no concurrent pop/push)
    // ------------------------------------------------------------------------------------------

    // Detaches the whole chain and leaves the list empty.
    [[nodiscard]] pointer take_all_unsynchronized() noexcept {
        pointer const first = head_.load(std::memory_order_acquire);
        LFPOOL_ASSERT(first != locked_sentinel() &&
                      "free_list_head::take_all_unsynchronized(): list is locked");
        head_.store(nullptr, std::memory_order_relaxed);
        return (first == locked_sentinel()) ? nullptr : first;
    }

    // Walks the chain. Returns false if the list is locked or cyclic;
    // otherwise stores the number of reachable nodes in *out_nodes.
    [[nodiscard]] bool check_chain(size_type *out_nodes = nullptr) const noexcept {
        pointer const first = head_.load(std::memory_order_acquire);
        if (first == locked_sentinel()) {
            return false;
        }

        size_type count = 0u;
        pointer slow = first;
        pointer fast = first;
        while (fast != nullptr) {
            fast = fast->next.load(std::memory_order_relaxed);
            ++count;
            if (fast == nullptr) {
                break;
            }
            if (RB_UNLIKELY(fast == locked_sentinel())) {
                return false;
            }
            fast = fast->next.load(std::memory_order_relaxed);
            ++count;
            slow = slow->next.load(std::memory_order_relaxed);
            if (RB_UNLIKELY(fast == slow && fast != nullptr)) {
                return false;
            }
            if (RB_UNLIKELY(fast == locked_sentinel())) {
                return false;
            }
        }

        if (out_nodes) {
            *out_nodes = count;
        }
        return true;
    }

private:
    void unlock_(pointer next) noexcept {
        LFPOOL_ASSERT(head_.load(std::memory_order_relaxed) == locked_sentinel() &&
                      "free_list_head::unlock(): list is not locked");
        head_.store(next, Orders::unlock);
    }

    std::atomic<pointer> head_{nullptr};
};

} // namespace lfpool

#endif /* LFPOOL_FREE_LIST_HPP_ */
