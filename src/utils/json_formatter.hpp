#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "nlohmann/json.hpp"
#include "search/automaton.hpp"
#include "search/match.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace JsonFormatter {

// Debug view of the whole trie, rooted at the root node. Not meant to be
// read back
nlohmann::json automaton_to_json_object(const search::Automaton &automaton);
std::string format_automaton_to_json(const search::Automaton &automaton,
                                     int indent = 2);

nlohmann::json
match_to_json_object(const search::Match &match,
                     std::optional<std::string_view> path = std::nullopt);
std::string
format_match_to_json(const search::Match &match,
                     std::optional<std::string_view> path = std::nullopt);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
