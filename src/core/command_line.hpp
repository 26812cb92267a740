#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "config.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Settings given on the command line. They override the config file
struct CommandLine {
  std::optional<std::string> config_path;
  std::vector<std::string> term_files;
  std::optional<std::string> search_path;
  std::optional<std::string> output_path;
  std::optional<Config::OutputFormat> format;
  bool recursive = false;
  bool case_insensitive = false;
  bool dump_automaton = false;
  bool help = false;
  std::vector<std::string> terms;
};

void print_usage(std::ostream &out);

// Flags come first. The first argument that is not a flag, and everything
// after it, are search terms; "--" ends the flags explicitly. On failure
// `error` describes the offending argument
bool parse_command_line(int argc, const char *const argv[], CommandLine &cl,
                        std::string &error);

// Lists from the command line extend those of the config file; everything
// else replaces the file's value when given
void apply_command_line(const CommandLine &cl, Config::AppConfig &config);

#endif // COMMAND_LINE_HPP
