#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *SEARCH_PATH = "search_path";
constexpr const char *RECURSIVE = "recursive";
constexpr const char *CASE_INSENSITIVE = "case_insensitive";
constexpr const char *OUTPUT_PATH = "output_path";
constexpr const char *OUTPUT_FORMAT = "output_format";
constexpr const char *TERM_FILES = "term_files";
constexpr const char *TERMS = "terms";
constexpr const char *MATCH_BUFFER_CAPACITY = "match_buffer_capacity";
constexpr const char *WORKER_THREADS = "worker_threads";
constexpr const char *DUMP_AUTOMATON = "dump_automaton";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

} // namespace Keys

enum class OutputFormat { TSV, JSON };

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct SearchConfig {
  // Empty means standard input
  std::string search_path;
  bool recursive = false;
  bool case_insensitive = false;

  // Matches buffered between a search and its consumer
  size_t match_buffer_capacity = 2;
  size_t worker_threads = 4;
};

struct OutputConfig {
  // Empty means standard output
  std::string output_path;
  OutputFormat format = OutputFormat::TSV;
};

struct AppConfig {
  std::vector<std::string> term_files;
  std::vector<std::string> terms;
  bool dump_automaton = false;

  SearchConfig search;
  OutputConfig output;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

LogLevel string_to_log_level(const std::string &level_str_raw);
bool string_to_bool(const std::string &val_str_raw);
bool string_to_output_format(const std::string &format_str_raw,
                             OutputFormat &format);
const char *output_format_to_string(OutputFormat format);

// Validation functions for configuration parameters
bool validate_search_config(const SearchConfig &config,
                            std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);

  // Validates and installs a configuration built in memory, e.g. one with
  // command line overrides applied on top of the loaded file
  bool update_configuration(const AppConfig &config);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
