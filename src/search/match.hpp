#ifndef MATCH_HPP
#define MATCH_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <tuple>

namespace search {

// A search hit: the term that was found and its byte range [start, end) in
// the searched text
struct Match {
  std::string term;
  size_t start = 0;
  size_t end = 0;
};

inline bool operator==(const Match &a, const Match &b) {
  return a.term == b.term && a.start == b.start && a.end == b.end;
}

inline bool operator!=(const Match &a, const Match &b) { return !(a == b); }

inline bool operator<(const Match &a, const Match &b) {
  return std::tie(a.start, a.end, a.term) < std::tie(b.start, b.end, b.term);
}

inline std::ostream &operator<<(std::ostream &os, const Match &match) {
  return os << "{\"" << match.term << "\", [" << match.start << ", "
            << match.end << ")}";
}

} // namespace search

#endif // MATCH_HPP
