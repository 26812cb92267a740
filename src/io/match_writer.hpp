#ifndef MATCH_WRITER_HPP
#define MATCH_WRITER_HPP

#include "core/config.hpp"
#include "search/match.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// Formats matches as TSV or JSON lines and writes them to a stream. Lines are
// written whole, one call per line; callers on several threads must funnel
// their lines through a single writer thread.
class MatchWriter {
public:
  MatchWriter(std::ostream &out, Config::OutputFormat format);

  // Column header for searches without a path column; empty for JSON
  std::string header() const;
  std::string
  format_line(const search::Match &match,
              std::optional<std::string_view> path = std::nullopt) const;

  void write(const std::string &line);
  void flush();

  uint64_t lines_written() const { return lines_written_; }
  Config::OutputFormat format() const { return format_; }

private:
  std::ostream &out_;
  Config::OutputFormat format_;
  uint64_t lines_written_ = 0;
};

// Creates a new output file. Throws std::runtime_error if the path already
// exists, is a directory, or cannot be created
std::unique_ptr<std::ofstream> open_new_output_file(const std::string &path);

#endif // MATCH_WRITER_HPP
