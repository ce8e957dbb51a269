#include <mockstream/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace mockstream::detail {

inline void contract_fail(char const* kind, char const* expr, char const* msg, char const* file,
                          int line, char const* func) noexcept {
  std::fprintf(stderr,
               "[mockstream] %s failure\n"
               "  expression: %s\n",
               kind, expr ? expr : "(none)");
  if (msg) {
    std::fprintf(stderr, "  message   : %s\n", msg);
  }
  std::fprintf(stderr,
               "  location  : %s:%d\n"
               "  function  : %s\n",
               file, line, func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace mockstream::detail
