#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.writer", LogComponent::IO_WRITER},
    {"io.walker", LogComponent::IO_WALKER},
    {"search.build", LogComponent::SEARCH_BUILD},
    {"search.insert", LogComponent::SEARCH_INSERT},
    {"search.match", LogComponent::SEARCH_MATCH}};

AppConfig::AppConfig() {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

bool string_to_output_format(const std::string &format_str_raw,
                             OutputFormat &format) {
  std::string format_str = Utils::trim_copy(format_str_raw);
  std::transform(format_str.begin(), format_str.end(), format_str.begin(),
                 ::tolower);
  if (format_str == "tsv") {
    format = OutputFormat::TSV;
    return true;
  }
  if (format_str == "json") {
    format = OutputFormat::JSON;
    return true;
  }
  return false;
}

const char *output_format_to_string(OutputFormat format) {
  switch (format) {
  case OutputFormat::TSV:
    return "tsv";
  case OutputFormat::JSON:
    return "json";
  }
  return "tsv";
}

static std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> items;
  for (auto &item : Utils::split_string(value, ',')) {
    std::string trimmed = Utils::trim_copy(item);
    if (!trimmed.empty())
      items.push_back(std::move(trimmed));
  }
  return items;
}

// Validation functions for configuration parameters
bool validate_search_config(const SearchConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.match_buffer_capacity < 1 ||
      config.match_buffer_capacity > 1024) {
    errors.push_back("Match buffer capacity must be between 1 and 1024");
    valid = false;
  }

  if (config.worker_threads < 1 || config.worker_threads > 256) {
    errors.push_back("Worker thread count must be between 1 and 256");
    valid = false;
  }

  if (config.recursive && config.search_path.empty()) {
    errors.push_back("Recursive search requires a search path");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_search_config(config.search, errors))
    valid = false;

  for (const auto &term_file : config.term_files) {
    if (term_file.empty()) {
      errors.push_back("Term file paths must not be empty");
      valid = false;
      break;
    }
  }

  if (!config.output.output_path.empty() &&
      config.output.output_path == config.search.search_path) {
    errors.push_back("Output path must differ from the search path");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::cerr << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::SEARCH_PATH)
        config.search.search_path = value;
      else if (key == Keys::RECURSIVE)
        config.search.recursive = string_to_bool(value);
      else if (key == Keys::CASE_INSENSITIVE)
        config.search.case_insensitive = string_to_bool(value);
      else if (key == Keys::OUTPUT_PATH)
        config.output.output_path = value;
      else if (key == Keys::OUTPUT_FORMAT) {
        if (!string_to_output_format(value, config.output.format))
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown output format '" << value
                    << "', keeping " << output_format_to_string(
                                            config.output.format)
                    << std::endl;
      } else if (key == Keys::TERM_FILES)
        config.term_files = split_list(value);
      else if (key == Keys::TERMS)
        config.terms = split_list(value);
      else if (key == Keys::MATCH_BUFFER_CAPACITY)
        config.search.match_buffer_capacity =
            Utils::string_to_number<size_t>(value).value_or(
                config.search.match_buffer_capacity);
      else if (key == Keys::WORKER_THREADS)
        config.search.worker_threads =
            Utils::string_to_number<size_t>(value).value_or(
                config.search.worker_threads);
      else if (key == Keys::DUMP_AUTOMATON)
        config.dump_automaton = string_to_bool(value);
      else
        config.custom_settings[key] = value;

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "search.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        } else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
      }
    } else {
      config.custom_settings[current_section + "." + key] = value;
    }
  }

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  if (!update_configuration(*new_config))
    return false;

  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated successfully from "
          << config_filepath_);
  return true;
}

bool ConfigManager::update_configuration(const AppConfig &config) {
  std::vector<std::string> validation_errors;
  if (!validate_app_config(config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  auto new_config = std::make_shared<const AppConfig>(config);
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
