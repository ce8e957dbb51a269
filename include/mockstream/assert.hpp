#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define MOCKSTREAM_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define MOCKSTREAM_LIKELY(x) (x)
#endif

namespace mockstream::detail {

[[noreturn]] void contract_fail(char const* kind, char const* expr, char const* msg,
                                char const* file, int line, char const* func) noexcept;

}  // namespace mockstream::detail

#define MOCKSTREAM_CONTRACT_SELECTOR(_1, _2, NAME, ...) NAME

#define MOCKSTREAM_CONTRACT_1(kind, expr)                                                 \
  (MOCKSTREAM_LIKELY(expr) ? (void)0                                                      \
                           : ::mockstream::detail::contract_fail(kind, #expr, nullptr, \
                                                                 __FILE__, __LINE__, __func__))

#define MOCKSTREAM_CONTRACT_2(kind, expr, msg)                                              \
  (MOCKSTREAM_LIKELY(expr) ? (void)0                                                        \
                           : ::mockstream::detail::contract_fail(kind, #expr, msg, __FILE__, \
                                                                 __LINE__, __func__))

// -------------------- ASSERT (debug builds only) --------------------
#if !defined(NDEBUG)
#define MOCKSTREAM_ASSERT(...)                                                      \
  MOCKSTREAM_CONTRACT_SELECTOR(__VA_ARGS__, MOCKSTREAM_CONTRACT_2, MOCKSTREAM_CONTRACT_1) \
  ("ASSERT", __VA_ARGS__)
#else
#define MOCKSTREAM_ASSERT(...) ((void)0)
#endif

// -------------------- ENSURE (always checked) --------------------
#define MOCKSTREAM_ENSURE(...)                                                      \
  MOCKSTREAM_CONTRACT_SELECTOR(__VA_ARGS__, MOCKSTREAM_CONTRACT_2, MOCKSTREAM_CONTRACT_1) \
  ("ENSURE", __VA_ARGS__)
