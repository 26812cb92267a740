#ifndef TERM_LOADER_HPP
#define TERM_LOADER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

// Gathers search terms from literal arguments and term files before they
// reach the automaton. Case folding, when enabled, happens here.
class TermLoader {
public:
  explicit TermLoader(bool case_insensitive = false);

  // Trims the term; blank terms are dropped. Returns whether it was kept
  bool add_literal(std::string_view term);

  // Term files hold whitespace separated words, one term per word.
  // Throws std::runtime_error when the file cannot be opened or read
  size_t load_term_file(const std::string &filepath);
  size_t load_term_stream(std::istream &in, const std::string &source_name);

  const std::vector<std::string> &terms() const { return terms_; }
  bool empty() const { return terms_.empty(); }

private:
  std::string normalize(std::string_view term) const;

  bool case_insensitive_;
  std::vector<std::string> terms_;
};

#endif // TERM_LOADER_HPP
