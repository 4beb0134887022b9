/*
 * basic_types.h — project-wide integer aliases
 *
 * Only the aliases the pool headers actually use live here:
 *
 * ────────────────────────────────────────────────────────────────────────
 *  Alias    │ Meaning                               │ Underlying type
 * ──────────┼───────────────────────────────────────┼─────────────────────
 *  reg      │ native unsigned word (counts, sizes)  │ std::size_t
 *  sreg     │ native signed word (differences)      │ std::ptrdiff_t
 *  reg_ptr  │ pointer <-> integer round-trip        │ std::uintptr_t
 *  usize    │ API-facing size                       │ std::size_t
 *  u32/u64  │ exact-width unsigned                  │ std::uint32_t/64_t
 * ────────────────────────────────────────────────────────────────────────
 *
 * The locked sentinel of the free list is built from reg_ptr, so the
 * round-trip alias must be exactly pointer-sized.
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#include <cstddef>
#include <cstdint>

using u32 = std::uint32_t;
using u64 = std::uint64_t;

/* Native register-size types (match pointer size) */
using reg  = std::size_t;
using sreg = std::ptrdiff_t;

/* Pointer-sized integer alias (pointer -> integer -> pointer) */
using reg_ptr = std::uintptr_t;

using usize = std::size_t;

/* ------------------------------ Sanity checks ------------------------------- */
static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");
static_assert(sizeof(reg) == sizeof(void*), "reg must match pointer size");
static_assert(sizeof(reg_ptr) == sizeof(void*), "reg_ptr must match pointer size");

#endif /* BASIC_TYPES_H_ */
