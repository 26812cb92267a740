#ifndef SEARCHER_HPP
#define SEARCHER_HPP

#include "io/rune_readers/base_rune_reader.hpp"
#include "match_stream.hpp"

#include <memory>
#include <string>

namespace search {

// Something that can search a text for a growing set of search terms
class ISearcher {
public:
  virtual ~ISearcher() = default;

  // Must not run concurrently with searches or with other insertions
  virtual void add_search_term(const std::string &term) = 0;

  // Starts a search over `reader`. The searcher must outlive the stream
  virtual MatchStream search(std::unique_ptr<IRuneReader> reader) const = 0;
};

} // namespace search

#endif // SEARCHER_HPP
