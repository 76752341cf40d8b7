#ifndef B769E96C_A1EE_4951_A68B_1522FB2BA354
#define B769E96C_A1EE_4951_A68B_1522FB2BA354

#include "linalg.hpp"
#include <spdlog/fmt/fmt.h>

template <class T, int M> struct fmt::formatter<linalg::vec<T, M>> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && *it != '}')
      throw format_error("invalid format");
    return it;
  }

  template <typename FormatContext> auto format(const linalg::vec<T, M> &vec, FormatContext &ctx) const -> decltype(ctx.out()) {
    auto out = fmt::format_to(ctx.out(), "{{");
    for (int i = 0; i < M; i++) {
      if (i > 0)
        out = fmt::format_to(out, ", ");
      out = fmt::format_to(out, "{}", vec[i]);
    }
    return fmt::format_to(out, "}}");
  }
};

#endif /* B769E96C_A1EE_4951_A68B_1522FB2BA354 */
