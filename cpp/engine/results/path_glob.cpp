#include "engine/results/path_glob.hpp"

namespace rascheck::results {
namespace {

bool segment_match(std::string_view p, std::string_view s) {
  std::size_t pi = 0;
  std::size_t si = 0;
  std::size_t star = std::string_view::npos;
  std::size_t mark = 0;
  while (si < s.size()) {
    if (pi < p.size() && (p[pi] == '?' || p[pi] == s[si])) {
      ++pi;
      ++si;
    } else if (pi < p.size() && p[pi] == '*') {
      star = pi++;
      mark = si;
    } else if (star != std::string_view::npos) {
      pi = star + 1;
      si = ++mark;
    } else {
      return false;
    }
  }
  while (pi < p.size() && p[pi] == '*') ++pi;
  return pi == p.size();
}

bool match_from(const std::vector<std::string>& pat, std::size_t pi,
                const std::vector<std::string>& path, std::size_t si) {
  while (pi < pat.size()) {
    if (pat[pi] == "**") {
      for (std::size_t k = si; k <= path.size(); ++k) {
        if (match_from(pat, pi + 1, path, k)) return true;
      }
      return false;
    }
    if (si >= path.size() || !segment_match(pat[pi], path[si])) return false;
    ++pi;
    ++si;
  }
  return si == path.size();
}

} // namespace

std::vector<std::string> path_segments(std::string_view path) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= path.size()) {
    std::size_t slash = path.find('/', start);
    if (slash == std::string_view::npos) slash = path.size();
    if (slash > start) out.emplace_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return out;
}

bool glob_match(std::string_view pattern, std::string_view path) {
  return match_from(path_segments(pattern), 0, path_segments(path), 0);
}

} // namespace rascheck::results
