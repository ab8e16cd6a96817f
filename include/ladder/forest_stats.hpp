#pragma once
// Per-length summaries of the forest partition, for reporting.

#include <cstddef>
#include <vector>

#include "ladder/word_graph.hpp"

namespace ladder {

/**
 * Forest statistics for one word length.
 *
 *  - words:      number of words of this length.
 *  - forests:    number of forests (connected components).
 *  - largest:    size of the biggest forest (0 when there are no words).
 *  - singletons: forests made of a single word with no neighbors.
 *  - edges:      undirected one-letter edges (sum of adjacency sizes / 2).
 */
struct ForestSummary {
    std::size_t length = 0;
    std::size_t words = 0;
    std::size_t forests = 0;
    std::size_t largest = 0;
    std::size_t singletons = 0;
    std::size_t edges = 0;
};

ForestSummary summarize_forests(const SameLengthGraph& graph);

// One summary per word length, shortest length first.
std::vector<ForestSummary> summarize_forests(const LengthPartitionedGraph& graph);

} // namespace ladder
