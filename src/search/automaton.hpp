#ifndef AUTOMATON_HPP
#define AUTOMATON_HPP

#include "match_stream.hpp"
#include "searcher.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace search {

// Index of a node in the automaton's arena. Assigned in creation order and
// never reused, so it doubles as the node's stable identifier
using NodeId = size_t;
// Index of a term in the automaton's term table
using TermId = size_t;

struct Node {
  char32_t character = 0; // label of the incoming edge, unused for the root
  bool is_word = false;
  TermId term = 0; // meaningful only when is_word

  std::unordered_map<char32_t, NodeId> children;

  // Longest proper suffix that is also a path from the root. Empty for the
  // root only
  std::optional<NodeId> failure_link;
  // Nodes whose failure link is this node
  std::unordered_set<NodeId> inverse_failure_links;
  // Terms ending here or anywhere along the failure chain
  std::set<TermId> output_set;
};

// Aho-Corasick automaton that accepts new search terms after it has been
// built and searched. Failure links, their inverse and the output sets are
// kept in the state a from-scratch build over all terms would produce.
//
// Searches only read the automaton. Insertions must not overlap with each
// other or with a running search.
class Automaton : public ISearcher {
public:
  static constexpr NodeId ROOT = 0;
  static constexpr size_t DEFAULT_MATCH_BUFFER_CAPACITY = 2;

  Automaton();
  // Builds the trie first and computes the failure function breadth first
  explicit Automaton(const std::vector<std::string> &terms);

  void add_search_term(const std::string &term) override;
  MatchStream search(std::unique_ptr<IRuneReader> reader) const override;

  void set_match_buffer_capacity(size_t capacity);
  size_t match_buffer_capacity() const { return match_buffer_capacity_; }

  // --- Structural introspection ---
  size_t node_count() const { return nodes_.size(); }
  const Node &node(NodeId id) const { return nodes_.at(id); }
  std::optional<NodeId> find_node(std::string_view path) const;

  size_t term_count() const { return terms_.size(); }
  const std::string &term(TermId id) const { return terms_.at(id); }
  bool contains_term(std::string_view term) const;

  // Verifies the trie, failure, inverse failure and output invariants.
  // Appends a description of every violation to `errors`
  bool check_invariants(std::vector<std::string> &errors) const;

private:
  NodeId append_node(NodeId parent, char32_t character);
  NodeId create_child(NodeId parent, char32_t character);
  void mark_word(NodeId node, const std::string &term);

  NodeId find_failure_target(NodeId parent, char32_t character) const;
  void link_failure(NodeId node, NodeId target);
  void relink_failure(NodeId node, NodeId target);
  void redirect_dependents(NodeId parent, NodeId child, char32_t character);
  void propagate_output(NodeId node, TermId term);

  void build_failure_function();
  void run_search(IRuneReader &reader, MatchStream::Queue &queue) const;

  std::vector<Node> nodes_;
  std::vector<std::string> terms_;
  size_t match_buffer_capacity_ = DEFAULT_MATCH_BUFFER_CAPACITY;
};

} // namespace search

#endif // AUTOMATON_HPP
