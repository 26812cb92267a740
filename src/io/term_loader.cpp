#include "term_loader.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

TermLoader::TermLoader(bool case_insensitive)
    : case_insensitive_(case_insensitive) {}

std::string TermLoader::normalize(std::string_view term) const {
  std::string trimmed = Utils::trim_copy(term);
  if (case_insensitive_)
    return Utils::to_lower_utf8(trimmed);
  return trimmed;
}

bool TermLoader::add_literal(std::string_view term) {
  std::string normalized = normalize(term);
  if (normalized.empty())
    return false;
  terms_.push_back(std::move(normalized));
  return true;
}

size_t TermLoader::load_term_file(const std::string &filepath) {
  std::ifstream term_file(filepath);
  if (!term_file.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Could not open term file: " << filepath);
    throw std::runtime_error("opening term file \"" + filepath + "\" failed");
  }
  return load_term_stream(term_file, filepath);
}

size_t TermLoader::load_term_stream(std::istream &in,
                                    const std::string &source_name) {
  size_t loaded = 0;
  std::string line;
  while (std::getline(in, line)) {
    for (const auto &word : Utils::split_whitespace(line))
      if (add_literal(word))
        loaded++;
  }

  if (in.bad()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Read error in term file: " << source_name);
    throw std::runtime_error("reading term file \"" + source_name +
                             "\" failed");
  }

  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Loaded " << loaded << " terms from " << source_name);
  return loaded;
}
