// ----------------------------------------------------------------------------
// word_graph.cpp
//
// Forest labeling and ladder search over one-letter-edit word graphs.
//
//  - Words are bucketed by length; each bucket is a SameLengthGraph.
//  - explore_all_components() runs one BFS per forest. Adjacency of a node is
//    computed by brute-force comparison when the node is dequeued for labeling.
//  - shortest_path() runs a second BFS over the frozen adjacency, starting at
//    the destination so that following parent links yields w1 .. w2 directly.
//  - LengthPartitionedGraph::explore_forests() hands whole buckets to worker
//    threads; buckets share no state, so no synchronization beyond the work
//    counter is needed.
// ----------------------------------------------------------------------------

#include "ladder/word_graph.hpp"

#include "ladder/word_filter.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <limits>
#include <stdexcept>
#include <thread>
#include <unordered_set>

namespace ladder {

std::size_t hamming_distance(std::string_view a, std::string_view b) {
    const std::size_t n = std::min(a.size(), b.size());
    std::size_t d = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (a[i] != b[i]) ++d;
    }
    return d;
}

bool are_neighbors(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    bool found_change = false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) {
            if (found_change) return false; // second difference
            found_change = true;
        }
    }
    return found_change;
}

// ---------------- SameLengthGraph ----------------

SameLengthGraph::SameLengthGraph(std::size_t word_length) : word_length_(word_length) {}

void SameLengthGraph::add_word(const std::string& word) {
    if (word.size() != word_length_) {
        throw std::logic_error("word '" + word + "' of length " + std::to_string(word.size()) +
                               " added to subgraph of length " + std::to_string(word_length_));
    }
    nodes_[word] = WordNode{word, 0, {}};
}

std::vector<std::string> SameLengthGraph::compute_neighbors(const WordNode& node) const {
    std::vector<std::string> out;
    for (const auto& [word, other] : nodes_) {
        if (hamming_distance(node.word, word) == 1) {
            out.push_back(word);
        }
    }
    return out;
}

std::size_t SameLengthGraph::explore_component(std::string_view seed_word) {
    WordNode* seed = find_mutable(seed_word);
    return seed ? explore_component(*seed) : 0;
}

std::size_t SameLengthGraph::explore_component(WordNode& seed) {
    std::size_t labeled = 0;
    std::deque<WordNode*> frontier;
    frontier.push_back(&seed);

    while (!frontier.empty()) {
        WordNode* node = frontier.front();
        frontier.pop_front();

        // A node can be queued once per neighbor before it is reached.
        if (node->label > 0) continue;

        ++labeled;
        node->label = next_label_;
        node->neighbors = compute_neighbors(*node);

        for (const auto& w : node->neighbors) {
            if (WordNode* next = find_mutable(w)) frontier.push_back(next);
        }
    }
    return labeled;
}

void SameLengthGraph::explore_all_components() {
    for (auto& [word, node] : nodes_) {
        if (node.label > 0) continue;
        explore_component(node);
        ++next_label_;
    }
}

bool SameLengthGraph::are_connected(std::string_view w1, std::string_view w2) const {
    const WordNode* a = find(w1);
    const WordNode* b = find(w2);
    if (!a || !b) return false;
    // Label 0 means unexplored, not a shared forest.
    return a->label != 0 && a->label == b->label;
}

std::optional<Ladder> SameLengthGraph::shortest_path(std::string_view w1, std::string_view w2) const {
    if (!are_connected(w1, w2)) return std::nullopt;

    // Search backwards from w2: the parent chain of w1 then reads w1 .. w2.
    struct Step {
        const WordNode* node;
        std::size_t parent;
    };
    constexpr std::size_t kRoot = std::numeric_limits<std::size_t>::max();

    std::vector<Step> steps;
    std::deque<std::size_t> frontier;
    std::unordered_set<std::string_view> visited;

    const WordNode* root = find(w2);
    steps.push_back(Step{root, kRoot});
    visited.insert(root->word);
    frontier.push_back(0);

    while (!frontier.empty()) {
        const std::size_t idx = frontier.front();
        frontier.pop_front();
        const WordNode* node = steps[idx].node;

        if (node->word == w1) {
            Ladder path;
            for (std::size_t i = idx; i != kRoot; i = steps[i].parent) {
                path.push_back(steps[i].node->word);
            }
            return path;
        }

        for (const auto& w : node->neighbors) {
            if (!visited.insert(w).second) continue; // marked on enqueue
            const WordNode* next = find(w);
            if (!next) continue;
            steps.push_back(Step{next, idx});
            frontier.push_back(steps.size() - 1);
        }
    }

    // Unreachable when labels and adjacency agree; a damaged snapshot can get here.
    return std::nullopt;
}

const WordNode* SameLengthGraph::find(std::string_view word) const {
    auto it = nodes_.find(std::string(word));
    return it == nodes_.end() ? nullptr : &it->second;
}

WordNode* SameLengthGraph::find_mutable(std::string_view word) {
    auto it = nodes_.find(std::string(word));
    return it == nodes_.end() ? nullptr : &it->second;
}

unsigned SameLengthGraph::forest_count() const {
    std::unordered_set<unsigned> labels;
    for (const auto& [word, node] : nodes_) {
        if (node.label > 0) labels.insert(node.label);
    }
    return static_cast<unsigned>(labels.size());
}

std::vector<std::size_t> SameLengthGraph::forest_sizes() const {
    std::vector<std::size_t> counts(next_label_, 0);
    for (const auto& [word, node] : nodes_) {
        if (node.label >= counts.size()) counts.resize(node.label + 1u, 0);
        ++counts[node.label];
    }
    std::vector<std::size_t> sizes;
    sizes.reserve(counts.size());
    // Label 0 counts unexplored words, which are not a forest.
    for (std::size_t l = 1; l < counts.size(); ++l) {
        if (counts[l] != 0) sizes.push_back(counts[l]);
    }
    return sizes;
}

void SameLengthGraph::restore_node(const std::string& word, unsigned label, std::vector<std::string> neighbors) {
    if (word.size() != word_length_) {
        throw std::invalid_argument("restored word '" + word + "' does not have length " +
                                    std::to_string(word_length_));
    }
    if (!WordFilter{}.accepts(word)) {
        throw std::invalid_argument("restored word '" + word + "' is not a lowercase a..z word");
    }
    if (label == 0) {
        throw std::invalid_argument("restored word '" + word + "' has no forest label");
    }
    if (nodes_.count(word) != 0) {
        throw std::invalid_argument("word '" + word + "' restored twice");
    }
    nodes_[word] = WordNode{word, label, std::move(neighbors)};
    if (label >= next_label_) next_label_ = label + 1;
}

void SameLengthGraph::check_invariants() const {
    const std::string where = "length " + std::to_string(word_length_) + ": ";
    for (const auto& [word, node] : nodes_) {
        if (node.word != word) {
            throw std::runtime_error(where + "node keyed '" + word + "' holds '" + node.word + "'");
        }
        if (node.label == 0 || node.label >= next_label_) {
            throw std::runtime_error(where + "word '" + word + "' has invalid label " +
                                     std::to_string(node.label));
        }
        for (const auto& n : node.neighbors) {
            const WordNode* other = find(n);
            if (!other) {
                throw std::runtime_error(where + "word '" + word + "' lists unknown neighbor '" + n + "'");
            }
            if (!are_neighbors(word, n)) {
                throw std::runtime_error(where + "'" + word + "' and '" + n + "' are not one letter apart");
            }
            if (other->label != node.label) {
                throw std::runtime_error(where + "neighbors '" + word + "' and '" + n + "' carry different labels");
            }
            if (std::find(other->neighbors.begin(), other->neighbors.end(), word) == other->neighbors.end()) {
                throw std::runtime_error(where + "adjacency '" + word + "' -> '" + n + "' is not symmetric");
            }
        }
    }
}

// ---------------- LengthPartitionedGraph ----------------

void LengthPartitionedGraph::add_word(const std::string& word) {
    subgraph_for(word.size()).add_word(word);
}

void LengthPartitionedGraph::explore_forests() {
    const unsigned hw = std::thread::hardware_concurrency();
    explore_forests(std::max(1u, hw ? hw : 1u));
}

void LengthPartitionedGraph::explore_forests(unsigned num_threads) {
    if (num_threads == 0)
        throw std::invalid_argument("num_threads must be > 0");

    std::vector<SameLengthGraph*> work;
    work.reserve(graphs_.size());
    for (auto& [len, g] : graphs_) work.push_back(&g);

    const unsigned t = static_cast<unsigned>(std::min<std::size_t>(num_threads, work.size()));
    if (t <= 1) {
        for (auto* g : work) g->explore_all_components();
        return;
    }

    // Largest buckets first so one long bucket does not start last.
    std::sort(work.begin(), work.end(), [](const SameLengthGraph* a, const SameLengthGraph* b) {
        return a->word_count() > b->word_count();
    });

    std::atomic<std::size_t> next{0};
    std::vector<std::exception_ptr> errors(t);
    std::vector<std::thread> pool;
    pool.reserve(t);
    try {
        for (unsigned tid = 0; tid < t; ++tid) {
            pool.emplace_back([&, tid]() {
                try {
                    for (std::size_t i = next.fetch_add(1); i < work.size(); i = next.fetch_add(1)) {
                        work[i]->explore_all_components();
                    }
                } catch (...) {
                    errors[tid] = std::current_exception();
                }
            });
        }
    } catch (...) {
        // Thread creation failed: the workers already running drain the queue.
        for (auto& th : pool) th.join();
        throw;
    }
    for (auto& th : pool) th.join();
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

bool LengthPartitionedGraph::are_connected(std::string_view w1, std::string_view w2) const {
    if (w1.size() != w2.size()) return false;
    const SameLengthGraph* g = subgraph(w1.size());
    return g && g->are_connected(w1, w2);
}

std::optional<Ladder> LengthPartitionedGraph::shortest_path(std::string_view w1, std::string_view w2) const {
    if (w1.size() != w2.size()) return std::nullopt;
    const SameLengthGraph* g = subgraph(w1.size());
    if (!g) return std::nullopt;
    return g->shortest_path(w1, w2);
}

std::size_t LengthPartitionedGraph::total_words() const {
    std::size_t total = 0;
    for (const auto& [len, g] : graphs_) total += g.word_count();
    return total;
}

std::size_t LengthPartitionedGraph::total_forests() const {
    std::size_t total = 0;
    for (const auto& [len, g] : graphs_) total += g.forest_count();
    return total;
}

const SameLengthGraph* LengthPartitionedGraph::subgraph(std::size_t word_length) const {
    auto it = graphs_.find(word_length);
    return it == graphs_.end() ? nullptr : &it->second;
}

SameLengthGraph& LengthPartitionedGraph::subgraph_for(std::size_t word_length) {
    auto it = graphs_.find(word_length);
    if (it == graphs_.end()) {
        it = graphs_.emplace(word_length, SameLengthGraph(word_length)).first;
    }
    return it->second;
}

void LengthPartitionedGraph::check_invariants() const {
    for (const auto& [len, g] : graphs_) {
        if (g.word_length() != len) {
            throw std::runtime_error("subgraph keyed " + std::to_string(len) + " holds words of length " +
                                     std::to_string(g.word_length()));
        }
        g.check_invariants();
    }
}

} // namespace ladder
