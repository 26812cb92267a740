#ifndef SEARCH_RUNNER_HPP
#define SEARCH_RUNNER_HPP

#include "core/config.hpp"
#include "io/match_writer.hpp"
#include "io/rune_readers/base_rune_reader.hpp"
#include "search/searcher.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

struct RunSummary {
  uint64_t files_searched = 0;
  uint64_t files_failed = 0;
  uint64_t matches = 0;
};

// Runs searches over standard input, a single file, or every file in a
// directory and hands the results to a MatchWriter. Directory entries are
// spread over a pool of worker threads; a single writer thread owns the
// output.
class SearchRunner {
public:
  static constexpr size_t OUTPUT_QUEUE_CAPACITY = 16;

  SearchRunner(const search::ISearcher &searcher,
               const Config::AppConfig &config, MatchWriter &writer);

  // Searches the configured path, or `default_input` when there is none.
  // Throws std::runtime_error when the search path does not exist or a
  // single search file cannot be opened
  RunSummary run(std::unique_ptr<IRuneReader> default_input);

  RunSummary search_reader(std::unique_ptr<IRuneReader> reader);
  RunSummary search_directory(const std::filesystem::path &directory);

  std::vector<std::filesystem::path>
  collect_files(const std::filesystem::path &directory, RunSummary &summary);

private:
  std::unique_ptr<IRuneReader>
  prepare_reader(std::unique_ptr<IRuneReader> reader) const;

  const search::ISearcher &searcher_;
  const Config::AppConfig &config_;
  MatchWriter &writer_;
};

#endif // SEARCH_RUNNER_HPP
