#include "core/command_line.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "io/match_writer.hpp"
#include "io/rune_readers/utf8_rune_reader.hpp"
#include "io/search_runner.hpp"
#include "io/term_loader.hpp"
#include "search/automaton.hpp"
#include "utils/json_formatter.hpp"

#include <chrono>
#include <clocale>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

int main(int argc, char *argv[]) {
  // Case folding outside ASCII follows the user's locale
  std::setlocale(LC_CTYPE, "");

  CommandLine cl;
  std::string error;
  if (!parse_command_line(argc, argv, cl, error)) {
    std::cerr << error << "\n\n";
    print_usage(std::cerr);
    return 1;
  }
  if (cl.help) {
    print_usage(std::cout);
    return 0;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (cl.config_path && !config_manager.load_configuration(*cl.config_path))
    return 1;

  Config::AppConfig merged = *config_manager.get_config();
  apply_command_line(cl, merged);
  if (!config_manager.update_configuration(merged))
    return 1;
  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE, "Multisearch starting up...");

  // --- Gather Search Terms ---
  TermLoader term_loader(current_config->search.case_insensitive);
  try {
    for (const auto &term_file : current_config->term_files)
      term_loader.load_term_file(term_file);
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  for (const auto &term : current_config->terms)
    term_loader.add_literal(term);

  if (term_loader.empty()) {
    std::cerr << "no search terms specified" << std::endl;
    print_usage(std::cerr);
    return 1;
  }

  auto time_start = std::chrono::steady_clock::now();

  search::Automaton automaton(term_loader.terms());
  automaton.set_match_buffer_capacity(
      current_config->search.match_buffer_capacity);
  if (current_config->dump_automaton)
    std::cerr << JsonFormatter::format_automaton_to_json(automaton)
              << std::endl;

  // --- Output ---
  std::unique_ptr<std::ofstream> output_file;
  if (!current_config->output.output_path.empty()) {
    try {
      output_file = open_new_output_file(current_config->output.output_path);
    } catch (const std::exception &e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
  }
  std::ostream &out = output_file ? *output_file : std::cout;
  MatchWriter writer(out, current_config->output.format);

  // --- Search ---
  SearchRunner runner(automaton, *current_config, writer);
  RunSummary summary;
  try {
    summary = runner.run(std::make_unique<FdRuneReader>(STDIN_FILENO));
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, e.what());
    std::cerr << e.what() << std::endl;
    return 1;
  }

  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - time_start)
                         .count();

  LOG(LogLevel::INFO, LogComponent::CORE, "---Search Summary---");
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Files searched: " << summary.files_searched);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Files skipped: " << summary.files_failed);
  LOG(LogLevel::INFO, LogComponent::CORE, "Matches: " << summary.matches);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Total search time: " << duration_ms << " ms");
  return 0;
}
