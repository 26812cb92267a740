#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace JsonFormatter {

namespace {

// Terms may carry invalid UTF-8, which nlohmann::json refuses to serialize
// unless told to substitute it
std::string dump(const nlohmann::json &j, int indent) {
  return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json node_to_json_object(const search::Automaton &automaton,
                                   search::NodeId id) {
  const search::Node &node = automaton.node(id);
  nlohmann::json j;
  j["id"] = id;

  // Links to the root are implied
  if (node.failure_link && *node.failure_link != search::Automaton::ROOT)
    j["lps"] = *node.failure_link;

  if (node.is_word)
    j["isWord"] = true;

  std::vector<std::string> outputs;
  outputs.reserve(node.output_set.size());
  for (search::TermId term : node.output_set)
    outputs.push_back(automaton.term(term));
  std::sort(outputs.begin(), outputs.end());
  j["ot"] = outputs;

  nlohmann::json children = nlohmann::json::object();
  for (auto const &[ch, child] : node.children)
    children[Utils::encode_utf8(ch)] = node_to_json_object(automaton, child);
  j["children"] = children;

  return j;
}

} // namespace

nlohmann::json automaton_to_json_object(const search::Automaton &automaton) {
  return node_to_json_object(automaton, search::Automaton::ROOT);
}

std::string format_automaton_to_json(const search::Automaton &automaton,
                                     int indent) {
  return dump(automaton_to_json_object(automaton), indent);
}

nlohmann::json match_to_json_object(const search::Match &match,
                                    std::optional<std::string_view> path) {
  nlohmann::json j;
  if (path)
    j["path"] = std::string(*path);
  j["term"] = match.term;
  j["start"] = match.start;
  j["end"] = match.end;
  return j;
}

std::string format_match_to_json(const search::Match &match,
                                 std::optional<std::string_view> path) {
  return dump(match_to_json_object(match, path), -1);
}

} // namespace JsonFormatter
