#pragma once
#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>
#include <glm/glm.hpp>
#include <spdlog/fmt/fmt.h>

// Prints a pose one row per line.
template <>
struct fmt::formatter<glm::mat4> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const glm::mat4& mat, FormatContext& ctx) const {
        for (int r = 0; r < 4; r++) {
            fmt::format_to(ctx.out(), "[{: .6f}, {: .6f}, {: .6f}, {: .6f}]{}",
                           mat[0][r], mat[1][r], mat[2][r], mat[3][r],
                           (r == 3 ? "" : "\n"));
        }
        return ctx.out();
    }
};

template <>
struct fmt::formatter<glm::vec3> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const glm::vec3& v, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "({:.4f}, {:.4f}, {:.4f})", v.x, v.y, v.z);
    }
};

namespace nerfgrid::util {

template <typename T>
std::string VectorSliceToString(const std::vector<T>& v,
                                size_t begin, size_t end) {
  std::ostringstream oss;
  oss << '[';
  if (begin >= v.size()) return oss.str() + ']';

  end = std::min(end, v.size());
  for (size_t i = begin; i < end; ++i) {
    if constexpr (std::is_same_v<T, uint8_t>)
      oss << static_cast<int>(v[i]);
    else
      oss << v[i];
    if (i + 1 < end) oss << ", ";
  }
  oss << ']';
  return oss.str();
}

}  // namespace nerfgrid::util
