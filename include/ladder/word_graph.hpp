#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ladder {

using Ladder = std::vector<std::string>;

// Number of positions at which two equal-length words differ.
// Callers guarantee equal length; extra characters of the longer word are not counted.
std::size_t hamming_distance(std::string_view a, std::string_view b);

// True when a and b have the same length and differ in exactly one position.
bool are_neighbors(std::string_view a, std::string_view b);

// A word and its place in the forest partition.
//  - label == 0: not yet visited by the component labeler.
//  - label  > 0: forest id, unique only within one word length.
// neighbors is filled once, when the node is labeled, and never changes afterwards.
struct WordNode {
    std::string word;
    unsigned label = 0;
    std::vector<std::string> neighbors;
};

// All words of a single length together with their one-letter adjacency.
//
// Neighbors are discovered by comparing a word against every other word of the
// subgraph, so labeling a whole subgraph costs O(n^2 * length). Adjacency is a
// by-product of labeling: explore_all_components() is what fills it in.
//
// Forest labels depend on unordered_map iteration order; only label equality is
// meaningful, never the numeric value.
class SameLengthGraph {
public:
    explicit SameLengthGraph(std::size_t word_length);

    std::size_t word_length() const { return word_length_; }

    // Insert word as a fresh, unlabeled node (replacing any previous entry).
    // Throws std::logic_error if word.size() != word_length(); upstream bucketing
    // makes that unreachable unless there is a bug.
    void add_word(const std::string& word);

    // Words at Hamming distance exactly 1 from node.word, in map iteration order.
    std::vector<std::string> compute_neighbors(const WordNode& node) const;

    // BFS from seed_word, assigning the current label to every reachable
    // unlabeled node and freezing its adjacency. Returns the number of nodes
    // labeled (0 for an unknown or already labeled seed).
    std::size_t explore_component(std::string_view seed_word);

    // Label every component; each gets a label distinct from all others.
    void explore_all_components();

    // True when both words are present and share a nonzero label.
    bool are_connected(std::string_view w1, std::string_view w2) const;

    // Shortest ladder w1 -> w2 (inclusive of both ends), or nullopt when the
    // words are absent, unexplored or not in the same forest.
    std::optional<Ladder> shortest_path(std::string_view w1, std::string_view w2) const;

    // Node lookup; nullptr when the word is not in this subgraph.
    const WordNode* find(std::string_view word) const;

    std::size_t word_count() const { return nodes_.size(); }
    // Distinct nonzero labels present.
    unsigned forest_count() const;

    // Number of words in each forest (no particular order).
    std::vector<std::size_t> forest_sizes() const;

    const std::unordered_map<std::string, WordNode>& nodes() const { return nodes_; }

    // Re-insert an already labeled node read back from a snapshot.
    // Throws std::invalid_argument on length mismatch, a word outside a..z,
    // a zero label, or a word that was already restored.
    void restore_node(const std::string& word, unsigned label, std::vector<std::string> neighbors);

    // Verify labels and adjacency of a fully explored subgraph.
    // Throws std::runtime_error naming the first violation found.
    void check_invariants() const;

private:
    std::size_t explore_component(WordNode& seed);
    WordNode* find_mutable(std::string_view word);

    std::size_t word_length_;
    unsigned next_label_ = 1; // label handed to the next forest explored
    std::unordered_map<std::string, WordNode> nodes_;
};

// Words of every length, one SameLengthGraph per length. No edge ever crosses
// lengths, so this is only an aggregate: all graph work happens per subgraph.
class LengthPartitionedGraph {
public:
    LengthPartitionedGraph() = default;

    // Route word into the subgraph of its length, creating it on first use.
    void add_word(const std::string& word);

    // Label every subgraph. Subgraphs share nothing, so they are spread over
    // num_threads workers; a single subgraph is always handled by one thread.
    // Throws std::invalid_argument if num_threads == 0.
    void explore_forests(unsigned num_threads);

    // Same as above with std::thread::hardware_concurrency() workers.
    void explore_forests();

    // Mismatched lengths and unknown words are ordinary "no" answers.
    bool are_connected(std::string_view w1, std::string_view w2) const;
    std::optional<Ladder> shortest_path(std::string_view w1, std::string_view w2) const;

    std::size_t total_words() const;
    std::size_t total_forests() const;
    std::size_t distinct_lengths() const { return graphs_.size(); }

    const SameLengthGraph* subgraph(std::size_t word_length) const;
    SameLengthGraph& subgraph_for(std::size_t word_length);
    const std::map<std::size_t, SameLengthGraph>& subgraphs() const { return graphs_; }

    void check_invariants() const;

private:
    std::map<std::size_t, SameLengthGraph> graphs_;
};

} // namespace ladder
