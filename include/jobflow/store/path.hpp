#pragma once

#include <string>
#include <string_view>

namespace jobflow::path {

// "/a/b/" -> "/a/b"; the root stays "/".
[[nodiscard]] inline auto normalize(std::string_view p) -> std::string {
  while (p.size() > 1 && p.back() == '/') {
    p.remove_suffix(1);
  }
  return std::string{p};
}

// Prefix shared by every descendant of `p`.
[[nodiscard]] inline auto child_prefix(std::string_view p) -> std::string {
  auto n = normalize(p);
  if (n != "/") {
    n.push_back('/');
  }
  return n;
}

// First segment of `full` below `prefix` (which must end with '/').
[[nodiscard]] inline auto first_segment(std::string_view full,
                                        std::string_view prefix)
    -> std::string_view {
  auto rest = full.substr(prefix.size());
  auto slash = rest.find('/');
  return slash == std::string_view::npos ? rest : rest.substr(0, slash);
}

[[nodiscard]] inline auto join(std::string_view parent, std::string_view name)
    -> std::string {
  auto out = child_prefix(parent);
  out.append(name);
  return out;
}

}  // namespace jobflow::path
