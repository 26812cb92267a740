#include "match_writer.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

MatchWriter::MatchWriter(std::ostream &out, Config::OutputFormat format)
    : out_(out), format_(format) {}

std::string MatchWriter::header() const {
  if (format_ == Config::OutputFormat::JSON)
    return "";
  return "Term\tStart\tEnd";
}

std::string MatchWriter::format_line(const search::Match &match,
                                     std::optional<std::string_view> path) const {
  if (format_ == Config::OutputFormat::JSON)
    return JsonFormatter::format_match_to_json(match, path);

  std::ostringstream oss;
  if (path)
    oss << *path << '\t';
  oss << match.term << '\t' << match.start << '\t' << match.end;
  return oss.str();
}

void MatchWriter::write(const std::string &line) {
  out_ << line << '\n';
  lines_written_++;
  if (!out_)
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Output stream failed after " << lines_written_ << " lines");
}

void MatchWriter::flush() { out_.flush(); }

std::unique_ptr<std::ofstream> open_new_output_file(const std::string &path) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (std::filesystem::exists(status)) {
    if (std::filesystem::is_directory(status))
      throw std::runtime_error("output file \"" + path + "\" is a directory");
    throw std::runtime_error("output file \"" + path + "\" already exists");
  }

  auto out = std::make_unique<std::ofstream>(path, std::ios::binary);
  if (!out->is_open())
    throw std::runtime_error("opening output file \"" + path + "\" failed");

  LOG(LogLevel::INFO, LogComponent::IO_WRITER,
      "Writing results to " << path);
  return out;
}
