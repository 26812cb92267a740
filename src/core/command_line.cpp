#include "command_line.hpp"

void print_usage(std::ostream &out) {
  out << "Multisearch searches for multiple terms in some text.\n\n"
      << "Usage:\n\n"
      << "    multisearch [--config path] [--termfile path]... "
         "[--searchpath path [-r]] [-i] [search_term...]\n\n"
      << "Options:\n\n"
      << "  --config path      INI file with default settings\n"
      << "  --termfile path    File containing search terms, one per line. "
         "May be specified multiple times.\n"
      << "  --searchpath path  File in which to search. If a directory, "
         "contained files are searched.\n"
      << "  --output path      File where results are written. Defaults to "
         "stdout.\n"
      << "  --format tsv|json  Result format. Defaults to tsv.\n"
      << "  -r                 Search all subdirectories of searchpath.\n"
      << "  -i                 Perform a case-insensitive search.\n"
      << "  --dump             Print the search automaton as JSON to stderr.\n"
      << "  --help             Print this help text and exit.\n";
}

// Accepts "-name value", "--name value" and "--name=value"
bool parse_command_line(int argc, const char *const argv[], CommandLine &cl,
                        std::string &error) {
  bool options_done = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
      options_done = true;
      cl.terms.push_back(arg);
      continue;
    }
    if (arg == "--") {
      options_done = true;
      continue;
    }

    std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
    std::optional<std::string> inline_value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      inline_value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }

    auto take_value = [&](std::string &value) {
      if (inline_value) {
        value = *inline_value;
        return true;
      }
      if (i + 1 >= argc) {
        error = "flag needs an argument: -" + name;
        return false;
      }
      value = argv[++i];
      return true;
    };

    std::string value;
    if (name == "help" || name == "h") {
      cl.help = true;
    } else if (name == "r") {
      cl.recursive = true;
    } else if (name == "i") {
      cl.case_insensitive = true;
    } else if (name == "dump") {
      cl.dump_automaton = true;
    } else if (name == "config") {
      if (!take_value(value))
        return false;
      cl.config_path = value;
    } else if (name == "termfile") {
      if (!take_value(value))
        return false;
      cl.term_files.push_back(value);
    } else if (name == "searchpath") {
      if (!take_value(value))
        return false;
      cl.search_path = value;
    } else if (name == "output") {
      if (!take_value(value))
        return false;
      cl.output_path = value;
    } else if (name == "format") {
      if (!take_value(value))
        return false;
      Config::OutputFormat format;
      if (!Config::string_to_output_format(value, format)) {
        error = "invalid value \"" + value + "\" for flag -format";
        return false;
      }
      cl.format = format;
    } else {
      error = "flag provided but not defined: " + arg;
      return false;
    }
  }
  return true;
}

void apply_command_line(const CommandLine &cl, Config::AppConfig &config) {
  config.term_files.insert(config.term_files.end(), cl.term_files.begin(),
                           cl.term_files.end());
  config.terms.insert(config.terms.end(), cl.terms.begin(), cl.terms.end());
  if (cl.search_path)
    config.search.search_path = *cl.search_path;
  if (cl.output_path)
    config.output.output_path = *cl.output_path;
  if (cl.format)
    config.output.format = *cl.format;
  config.search.recursive = config.search.recursive || cl.recursive;
  config.search.case_insensitive =
      config.search.case_insensitive || cl.case_insensitive;
  config.dump_automaton = config.dump_automaton || cl.dump_automaton;
}
