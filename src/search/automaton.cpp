#include "automaton.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <exception>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace search {

namespace {

std::string path_to_string(const std::u32string &path) {
  std::string out;
  for (char32_t c : path)
    out += Utils::encode_utf8(c);
  return out;
}

} // namespace

Automaton::Automaton() { nodes_.emplace_back(); }

Automaton::Automaton(const std::vector<std::string> &terms) : Automaton() {
  // --- Trie ---
  for (const auto &term : terms) {
    if (term.empty()) {
      LOG(LogLevel::WARN, LogComponent::SEARCH_BUILD,
          "Ignoring empty search term");
      continue;
    }

    NodeId current = ROOT;
    for (char32_t c : Utils::decode_utf8_string(term)) {
      auto it = nodes_[current].children.find(c);
      current =
          it != nodes_[current].children.end() ? it->second
                                                : append_node(current, c);
    }
    if (!nodes_[current].is_word) {
      nodes_[current].is_word = true;
      nodes_[current].term = terms_.size();
      nodes_[current].output_set.insert(terms_.size());
      terms_.push_back(term);
    }
  }

  // --- Failure function ---
  build_failure_function();

  LOG(LogLevel::INFO, LogComponent::SEARCH_BUILD,
      "Built automaton with " << terms_.size() << " terms and "
                              << nodes_.size() << " nodes");
}

void Automaton::set_match_buffer_capacity(size_t capacity) {
  match_buffer_capacity_ = std::max<size_t>(capacity, 1);
}

NodeId Automaton::append_node(NodeId parent, char32_t character) {
  NodeId id = nodes_.size();
  nodes_.emplace_back();
  nodes_[id].character = character;
  nodes_[parent].children.emplace(character, id);
  return id;
}

// Nodes are processed in order of non-decreasing depth, so the failure link
// of every parent is final before its children are linked.
void Automaton::build_failure_function() {
  std::queue<NodeId> q;
  for (auto const &[ch, child] : nodes_[ROOT].children) {
    link_failure(child, ROOT);
    q.push(child);
  }

  while (!q.empty()) {
    NodeId u = q.front();
    q.pop();

    for (auto const &[ch, v] : nodes_[u].children) {
      link_failure(v, find_failure_target(u, ch));
      q.push(v);
    }
  }
}

// Follows the failure chain of `parent` to the first node with a child
// labelled `character`. Falls back to the root.
NodeId Automaton::find_failure_target(NodeId parent,
                                      char32_t character) const {
  if (parent == ROOT)
    return ROOT;

  NodeId m = parent;
  do {
    m = *nodes_[m].failure_link;
    auto it = nodes_[m].children.find(character);
    if (it != nodes_[m].children.end())
      return it->second;
  } while (m != ROOT);

  return ROOT;
}

void Automaton::link_failure(NodeId node, NodeId target) {
  nodes_[node].failure_link = target;
  nodes_[target].inverse_failure_links.insert(node);

  const auto &inherited = nodes_[target].output_set;
  nodes_[node].output_set.insert(inherited.begin(), inherited.end());
}

// The node's output set is already a superset of the new target's, so only
// the links move.
void Automaton::relink_failure(NodeId node, NodeId target) {
  NodeId previous = *nodes_[node].failure_link;
  nodes_[previous].inverse_failure_links.erase(node);
  nodes_[node].failure_link = target;
  nodes_[target].inverse_failure_links.insert(node);
}

void Automaton::add_search_term(const std::string &term) {
  if (term.empty()) {
    LOG(LogLevel::WARN, LogComponent::SEARCH_INSERT,
        "Ignoring empty search term");
    return;
  }

  size_t created = 0;
  NodeId current = ROOT;
  for (char32_t c : Utils::decode_utf8_string(term)) {
    auto it = nodes_[current].children.find(c);
    if (it != nodes_[current].children.end()) {
      current = it->second;
    } else {
      current = create_child(current, c);
      created++;
    }
  }

  if (nodes_[current].is_word) {
    LOG(LogLevel::DEBUG, LogComponent::SEARCH_INSERT,
        "Term '" << term << "' is already present");
    return;
  }

  mark_word(current, term);
  LOG(LogLevel::DEBUG, LogComponent::SEARCH_INSERT,
      "Inserted term '" << term << "', " << created << " new nodes, "
                        << nodes_.size() << " total");
}

// Creates the child and completes its failure function right away, so that
// the automaton stays searchable without a rebuild.
NodeId Automaton::create_child(NodeId parent, char32_t character) {
  NodeId child = append_node(parent, character);
  link_failure(child, find_failure_target(parent, character));
  redirect_dependents(parent, child, character);
  return child;
}

// Any node whose failure chain reaches `parent` without passing a node that
// already has a `character` child used to fail its own `character` child to
// something shorter than `child`. Those children now fail to `child`.
//
// The inverse set of `parent` is read as it was before any relinking: a node
// moved out of it may still have dependents that need redirecting.
void Automaton::redirect_dependents(NodeId parent, NodeId child,
                                    char32_t character) {
  const auto &direct = nodes_[parent].inverse_failure_links;
  std::vector<NodeId> pending(direct.begin(), direct.end());

  while (!pending.empty()) {
    NodeId x = pending.back();
    pending.pop_back();
    if (x == child)
      continue;

    auto it = nodes_[x].children.find(character);
    if (it != nodes_[x].children.end()) {
      relink_failure(it->second, child);
    } else {
      const auto &dependents = nodes_[x].inverse_failure_links;
      pending.insert(pending.end(), dependents.begin(), dependents.end());
    }
  }
}

void Automaton::mark_word(NodeId node, const std::string &term) {
  TermId id = terms_.size();
  terms_.push_back(term);
  nodes_[node].is_word = true;
  nodes_[node].term = id;
  propagate_output(node, id);
}

// Output sets are closed under the failure relation, so a node that already
// holds the term has it in its whole inverse subtree too.
void Automaton::propagate_output(NodeId node, TermId term) {
  std::vector<NodeId> pending{node};
  while (!pending.empty()) {
    NodeId n = pending.back();
    pending.pop_back();
    if (!nodes_[n].output_set.insert(term).second)
      continue;
    const auto &dependents = nodes_[n].inverse_failure_links;
    pending.insert(pending.end(), dependents.begin(), dependents.end());
  }
}

MatchStream Automaton::search(std::unique_ptr<IRuneReader> reader) const {
  auto queue = std::make_shared<MatchStream::Queue>(match_buffer_capacity_);
  if (!reader) {
    LOG(LogLevel::WARN, LogComponent::SEARCH_MATCH,
        "Search started without a reader, producing no matches");
    queue->shutdown();
    return MatchStream(std::move(queue), std::thread());
  }

  // Shared with the stream so that abandoning it can wake a blocked read
  std::shared_ptr<IRuneReader> source(std::move(reader));
  std::thread producer([this, queue, source]() {
    try {
      run_search(*source, *queue);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::SEARCH_MATCH,
          "Search aborted: " << e.what());
    }
    queue->shutdown();
  });
  return MatchStream(std::move(queue), std::move(producer), std::move(source));
}

void Automaton::run_search(IRuneReader &reader,
                           MatchStream::Queue &queue) const {
  NodeId cursor = ROOT;
  size_t offset = 0;
  size_t emitted = 0;

  while (auto decoded = reader.read_rune()) {
    offset += decoded->width;
    const char32_t c = decoded->rune;

    while (cursor != ROOT && nodes_[cursor].children.count(c) == 0)
      cursor = *nodes_[cursor].failure_link;
    const auto &children = nodes_[cursor].children;
    auto it = children.find(c);
    cursor = it != children.end() ? it->second : ROOT;

    for (TermId id : nodes_[cursor].output_set) {
      const std::string &t = terms_[id];
      // Case folding can make a term's encoding longer than the text it
      // matched
      size_t start = offset >= t.size() ? offset - t.size() : 0;
      if (!queue.push(Match{t, start, offset})) {
        LOG(LogLevel::DEBUG, LogComponent::SEARCH_MATCH,
            "Search abandoned by consumer after " << emitted << " matches");
        return;
      }
      emitted++;
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::SEARCH_MATCH,
      "Search finished at byte " << offset << " with " << emitted
                                 << " matches"
                                 << (reader.has_error() ? " (read error)"
                                                        : ""));
}

std::optional<NodeId> Automaton::find_node(std::string_view path) const {
  NodeId current = ROOT;
  for (char32_t c : Utils::decode_utf8_string(path)) {
    auto it = nodes_[current].children.find(c);
    if (it == nodes_[current].children.end())
      return std::nullopt;
    current = it->second;
  }
  return current;
}

bool Automaton::contains_term(std::string_view term) const {
  if (term.empty())
    return false;
  auto id = find_node(term);
  return id && nodes_[*id].is_word;
}

bool Automaton::check_invariants(std::vector<std::string> &errors) const {
  bool valid = true;
  auto report = [&](const std::string &message) {
    errors.push_back(message);
    valid = false;
  };

  // Every node must be reachable from the root exactly once
  std::vector<std::u32string> paths(nodes_.size());
  std::vector<bool> reached(nodes_.size(), false);
  std::unordered_map<std::u32string, NodeId> by_path;
  std::vector<NodeId> pending{ROOT};
  reached[ROOT] = true;
  by_path.emplace(U"", ROOT);

  while (!pending.empty()) {
    NodeId n = pending.back();
    pending.pop_back();
    for (auto const &[c, child] : nodes_[n].children) {
      if (child >= nodes_.size() || child == ROOT) {
        report("node " + std::to_string(n) + " has an invalid child " +
               std::to_string(child));
        continue;
      }
      if (reached[child]) {
        report("node " + std::to_string(child) + " is reachable twice");
        continue;
      }
      if (nodes_[child].character != c)
        report("node " + std::to_string(child) +
               " is labelled differently from its edge");
      reached[child] = true;
      paths[child] = paths[n] + c;
      by_path.emplace(paths[child], child);
      pending.push_back(child);
    }
  }
  for (NodeId id = 0; id < nodes_.size(); ++id)
    if (!reached[id])
      report("node " + std::to_string(id) + " is unreachable");
  if (!valid)
    return false;

  auto describe = [&](NodeId id) {
    return "node " + std::to_string(id) + " (\"" + path_to_string(paths[id]) +
           "\")";
  };

  // --- Failure links ---
  if (nodes_[ROOT].failure_link)
    report("root has a failure link");

  for (NodeId id = 1; id < nodes_.size(); ++id) {
    const Node &n = nodes_[id];
    if (!n.failure_link) {
      report(describe(id) + " has no failure link");
      continue;
    }
    NodeId f = *n.failure_link;
    if (f >= nodes_.size()) {
      report(describe(id) + " fails to a missing node");
      continue;
    }
    if (paths[f].size() >= paths[id].size())
      report(describe(id) + " fails to " + describe(f) +
             " which is not shallower");

    NodeId expected = ROOT;
    const std::u32string &path = paths[id];
    for (size_t len = path.size() - 1; len > 0; --len) {
      auto it = by_path.find(path.substr(path.size() - len));
      if (it != by_path.end()) {
        expected = it->second;
        break;
      }
    }
    if (f != expected)
      report(describe(id) + " fails to " + describe(f) +
             " instead of its longest suffix " + describe(expected));

    if (nodes_[f].inverse_failure_links.count(id) == 0)
      report(describe(id) + " is missing from the inverse links of " +
             describe(f));
  }

  // --- Inverse failure links ---
  for (NodeId id = 0; id < nodes_.size(); ++id) {
    for (NodeId x : nodes_[id].inverse_failure_links) {
      if (x >= nodes_.size() || nodes_[x].failure_link != id)
        report(describe(id) + " lists node " + std::to_string(x) +
               " as inverse link but it fails elsewhere");
    }
  }

  // --- Output sets ---
  for (NodeId id = 0; id < nodes_.size(); ++id) {
    const Node &n = nodes_[id];
    if (n.is_word) {
      if (n.term >= terms_.size())
        report(describe(id) + " refers to a missing term");
      else if (Utils::decode_utf8_string(terms_[n.term]) !=
               std::vector<char32_t>(paths[id].begin(), paths[id].end()))
        report(describe(id) + " holds term '" + terms_[n.term] + "'");
    }

    std::set<TermId> expected;
    NodeId m = id;
    for (size_t steps = 0; steps <= nodes_.size(); ++steps) {
      if (nodes_[m].is_word)
        expected.insert(nodes_[m].term);
      if (!nodes_[m].failure_link)
        break;
      m = *nodes_[m].failure_link;
    }
    if (expected != n.output_set) {
      std::ostringstream oss;
      oss << describe(id) << " outputs " << n.output_set.size()
          << " terms, its suffixes spell " << expected.size();
      report(oss.str());
    }
  }

  return valid;
}

} // namespace search
