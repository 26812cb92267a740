#include "io/rune_readers/utf8_rune_reader.hpp"
#include "search/automaton.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

using search::Automaton;
using search::Match;
using search::NodeId;

namespace {

std::vector<Match> search_all(const Automaton &automaton,
                              const std::string &text) {
  std::vector<Match> matches;
  for (const auto &match :
       automaton.search(std::make_unique<StringRuneReader>(text)))
    matches.push_back(match);
  std::sort(matches.begin(), matches.end());
  return matches;
}

// Every byte-level occurrence of every distinct term
std::vector<Match> naive_search(const std::vector<std::string> &terms,
                                const std::string &text) {
  std::set<std::string> distinct(terms.begin(), terms.end());
  std::vector<Match> matches;
  for (const auto &term : distinct) {
    if (term.empty())
      continue;
    for (size_t pos = text.find(term); pos != std::string::npos;
         pos = text.find(term, pos + 1))
      matches.push_back(Match{term, pos, pos + term.size()});
  }
  std::sort(matches.begin(), matches.end());
  return matches;
}

void expect_invariants(const Automaton &automaton) {
  std::vector<std::string> errors;
  EXPECT_TRUE(automaton.check_invariants(errors));
  for (const auto &error : errors)
    ADD_FAILURE() << error;
}

// Node paths keyed by their UTF-8 spelling
std::map<std::string, NodeId> paths_of(const Automaton &automaton) {
  std::map<std::string, NodeId> paths;
  std::vector<std::pair<NodeId, std::string>> pending{{Automaton::ROOT, ""}};
  while (!pending.empty()) {
    auto [id, path] = pending.back();
    pending.pop_back();
    paths[path] = id;
    for (auto const &[c, child] : automaton.node(id).children)
      pending.emplace_back(child, path + Utils::encode_utf8(c));
  }
  return paths;
}

struct NodeView {
  bool is_word = false;
  std::string failure;
  std::set<std::string> inverse;
  std::set<std::string> outputs;

  bool operator==(const NodeView &other) const {
    return is_word == other.is_word && failure == other.failure &&
           inverse == other.inverse && outputs == other.outputs;
  }
};

// Describes the automaton without node ids so that two automata built in
// different orders can be compared
std::map<std::string, NodeView> describe(const Automaton &automaton) {
  auto paths = paths_of(automaton);
  std::map<NodeId, std::string> names;
  for (auto const &[path, id] : paths)
    names[id] = path;

  std::map<std::string, NodeView> view;
  for (auto const &[path, id] : paths) {
    const search::Node &node = automaton.node(id);
    NodeView &v = view[path];
    v.is_word = node.is_word;
    v.failure = node.failure_link ? names[*node.failure_link] : "<none>";
    for (NodeId x : node.inverse_failure_links)
      v.inverse.insert(names[x]);
    for (search::TermId t : node.output_set)
      v.outputs.insert(automaton.term(t));
  }
  return view;
}

} // namespace

TEST(AutomatonTest, WorkedScenarioWithIncrementalInsertion) {
  Automaton automaton({"a", "can"});
  automaton.add_search_term("an");
  expect_invariants(automaton);

  std::vector<Match> expected = {
      {"can", 4, 7}, {"a", 5, 6}, {"an", 5, 7}};
  EXPECT_EQ(search_all(automaton, "you can do it!"), expected);
}

TEST(AutomatonTest, OverlappingTerms) {
  Automaton automaton({"he", "she", "his", "hers"});
  expect_invariants(automaton);

  std::vector<Match> expected = {{"she", 1, 4}, {"he", 2, 4}, {"hers", 2, 6}};
  EXPECT_EQ(search_all(automaton, "ushers"), expected);
}

TEST(AutomatonTest, FailureLinksOfBatchBuild) {
  Automaton automaton({"he", "she", "his", "hers"});

  auto she = automaton.find_node("she");
  auto he = automaton.find_node("he");
  auto h = automaton.find_node("h");
  auto s = automaton.find_node("s");
  ASSERT_TRUE(she && he && h && s);

  EXPECT_EQ(automaton.node(*she).failure_link, he);
  EXPECT_EQ(automaton.node(*h).failure_link, Automaton::ROOT);
  EXPECT_FALSE(automaton.node(Automaton::ROOT).failure_link.has_value());

  // Depth one nodes are registered under the root
  const auto &root_inverse =
      automaton.node(Automaton::ROOT).inverse_failure_links;
  EXPECT_EQ(root_inverse.count(*h), 1u);
  EXPECT_EQ(root_inverse.count(*s), 1u);
}

TEST(AutomatonTest, InvariantsHoldAfterEveryInsertion) {
  Automaton automaton;
  for (const std::string term :
       {"ushers", "hers", "she", "he", "s", "rs", "his", "is", "h", "hehe"}) {
    automaton.add_search_term(term);
    SCOPED_TRACE("after inserting " + term);
    expect_invariants(automaton);
  }
  EXPECT_EQ(automaton.term_count(), 10u);
}

TEST(AutomatonTest, NewPrefixRedirectsDeeperNodes) {
  // "xab" fails to the root until "ab" exists
  Automaton automaton({"xab"});
  auto xab = automaton.find_node("xab");
  ASSERT_TRUE(xab);
  EXPECT_EQ(automaton.node(*xab).failure_link, Automaton::ROOT);

  automaton.add_search_term("ab");
  expect_invariants(automaton);
  EXPECT_EQ(automaton.node(*xab).failure_link, automaton.find_node("ab"));

  std::vector<Match> expected = {{"xab", 0, 3}, {"ab", 1, 3}};
  EXPECT_EQ(search_all(automaton, "xab"), expected);
}

TEST(AutomatonTest, EmptyTermIsIgnored) {
  Automaton automaton({"", "x"});
  EXPECT_EQ(automaton.term_count(), 1u);
  size_t nodes = automaton.node_count();

  automaton.add_search_term("");
  EXPECT_EQ(automaton.node_count(), nodes);
  EXPECT_EQ(automaton.term_count(), 1u);
  EXPECT_FALSE(automaton.contains_term(""));
  expect_invariants(automaton);

  std::vector<Match> expected = {{"x", 1, 2}};
  EXPECT_EQ(search_all(automaton, "ax"), expected);
}

TEST(AutomatonTest, RepeatedCharacterTerms) {
  Automaton automaton;
  std::string term;
  for (int i = 0; i < 6; ++i) {
    term += 'a';
    automaton.add_search_term(term);
    automaton.add_search_term("a");
    SCOPED_TRACE("after inserting " + term);
    expect_invariants(automaton);
  }

  Automaton small({"a", "aa"});
  auto matches = search_all(small, "aaaa");
  EXPECT_EQ(matches.size(), 7u);
  EXPECT_EQ(std::count(matches.begin(), matches.end(), Match{"aa", 2, 4}), 1);
}

TEST(AutomatonTest, IncrementalBuildEqualsBatchBuild) {
  const std::vector<std::string> terms = {"he",  "she", "his", "hers",
                                          "a",   "can", "an",  "nana",
                                          "ana", "banana", "s", "ers"};
  Automaton batch(terms);

  Automaton incremental;
  for (const auto &term : terms)
    incremental.add_search_term(term);

  expect_invariants(batch);
  expect_invariants(incremental);
  EXPECT_TRUE(describe(batch) == describe(incremental));
}

TEST(AutomatonTest, InsertionOrderDoesNotMatter) {
  std::vector<std::string> terms = {"abab", "bab", "ab", "b",
                                    "aab",  "ba",  "bbb"};
  const auto reference = describe(Automaton(terms));

  std::mt19937 rng(12345);
  for (int round = 0; round < 20; ++round) {
    std::shuffle(terms.begin(), terms.end(), rng);
    Automaton automaton;
    for (const auto &term : terms)
      automaton.add_search_term(term);
    expect_invariants(automaton);
    EXPECT_TRUE(describe(automaton) == reference) << "round " << round;
  }
}

TEST(AutomatonTest, MatchesAgreeWithNaiveSearch) {
  std::mt19937 rng(2024);
  std::uniform_int_distribution<int> letter(0, 2);
  std::uniform_int_distribution<int> length(1, 4);

  for (int round = 0; round < 10; ++round) {
    std::vector<std::string> initial;
    std::vector<std::string> added;
    for (int i = 0; i < 6; ++i) {
      std::string term;
      for (int n = length(rng); n > 0; --n)
        term += static_cast<char>('a' + letter(rng));
      (i % 2 == 0 ? initial : added).push_back(term);
    }
    std::string text;
    for (int i = 0; i < 64; ++i)
      text += static_cast<char>('a' + letter(rng));

    Automaton automaton(initial);
    for (const auto &term : added)
      automaton.add_search_term(term);
    expect_invariants(automaton);

    std::vector<std::string> all = initial;
    all.insert(all.end(), added.begin(), added.end());
    EXPECT_EQ(search_all(automaton, text), naive_search(all, text))
        << "round " << round << " text " << text;
  }
}

TEST(AutomatonTest, NoTermsProducesNoMatches) {
  Automaton automaton;
  EXPECT_EQ(automaton.node_count(), 1u);
  EXPECT_TRUE(search_all(automaton, "anything at all").empty());

  Automaton from_empty_list(std::vector<std::string>{});
  EXPECT_TRUE(search_all(from_empty_list, "text").empty());
}

TEST(AutomatonTest, ReinsertionIsIdempotent) {
  Automaton automaton({"a", "can"});
  auto before = describe(automaton);
  size_t nodes = automaton.node_count();

  automaton.add_search_term("can");
  automaton.add_search_term("a");
  EXPECT_EQ(automaton.node_count(), nodes);
  EXPECT_EQ(automaton.term_count(), 2u);
  EXPECT_TRUE(describe(automaton) == before);

  Automaton duplicated({"can", "can"});
  EXPECT_EQ(duplicated.term_count(), 1u);
  EXPECT_EQ(search_all(duplicated, "can").size(), 1u);
}

TEST(AutomatonTest, TermAddedAsPrefixOfExistingPath) {
  Automaton automaton({"hers"});
  automaton.add_search_term("her");
  expect_invariants(automaton);
  EXPECT_TRUE(automaton.contains_term("her"));
  EXPECT_FALSE(automaton.contains_term("he"));

  std::vector<Match> expected = {{"her", 0, 3}, {"hers", 0, 4}};
  EXPECT_EQ(search_all(automaton, "hers"), expected);
}

TEST(AutomatonTest, OffsetsCountBytesOfMultibyteText) {
  Automaton automaton({"\xC3\xA9", "caf\xC3\xA9"}); // "é", "café"
  expect_invariants(automaton);

  std::vector<Match> expected = {{"caf\xC3\xA9", 0, 5},
                                 {"\xC3\xA9", 3, 5},
                                 {"\xC3\xA9", 6, 8}};
  EXPECT_EQ(search_all(automaton, "caf\xC3\xA9 \xC3\xA9"), expected);
}

TEST(AutomatonTest, InvalidBytesNeverMatchTermCharacters) {
  Automaton automaton({"ab"});
  std::vector<Match> expected = {{"ab", 2, 4}};
  EXPECT_EQ(search_all(automaton, "a\xFF" "ab"), expected);
}

namespace {

// Reports every code point with a width of one byte
class NarrowRuneReader : public IRuneReader {
public:
  explicit NarrowRuneReader(std::u32string text) : text_(std::move(text)) {}

  std::optional<Utils::DecodedRune> read_rune() override {
    if (position_ >= text_.size())
      return std::nullopt;
    return Utils::DecodedRune{text_[position_++], 1};
  }

private:
  std::u32string text_;
  size_t position_ = 0;
};

} // namespace

TEST(AutomatonTest, StartIsClampedWhenTermIsWiderThanText) {
  Automaton automaton({"\xC3\xA9"});
  std::vector<Match> matches;
  for (const auto &match :
       automaton.search(std::make_unique<NarrowRuneReader>(U"é")))
    matches.push_back(match);

  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].start, 0u);
  EXPECT_EQ(matches[0].end, 1u);
}

TEST(AutomatonTest, JsonDumpDescribesTrie) {
  Automaton automaton({"a", "ab", "b"});
  nlohmann::json dump = JsonFormatter::automaton_to_json_object(automaton);

  EXPECT_EQ(dump["id"], Automaton::ROOT);
  EXPECT_FALSE(dump.contains("lps"));
  EXPECT_FALSE(dump.contains("isWord"));

  const auto &a = dump["children"]["a"];
  const auto &ab = a["children"]["b"];
  const auto &b = dump["children"]["b"];
  EXPECT_EQ(a["isWord"], true);
  EXPECT_FALSE(a.contains("lps"));
  EXPECT_EQ(ab["lps"], b["id"]);
  EXPECT_EQ(ab["ot"], nlohmann::json::array({"ab", "b"}));
  EXPECT_TRUE(b["children"].empty());

  std::string text = JsonFormatter::format_automaton_to_json(automaton);
  EXPECT_EQ(nlohmann::json::parse(text), dump);
}
