#include "ladder/forest_stats.hpp"

#include <algorithm>

namespace ladder {

ForestSummary summarize_forests(const SameLengthGraph& graph) {
    ForestSummary s;
    s.length = graph.word_length();
    s.words = graph.word_count();

    const std::vector<std::size_t> sizes = graph.forest_sizes();
    s.forests = sizes.size();
    if (!sizes.empty()) s.largest = *std::max_element(sizes.begin(), sizes.end());
    s.singletons = static_cast<std::size_t>(std::count(sizes.begin(), sizes.end(), std::size_t{1}));

    std::size_t degree_sum = 0;
    for (const auto& [word, node] : graph.nodes()) degree_sum += node.neighbors.size();
    s.edges = degree_sum / 2;
    return s;
}

std::vector<ForestSummary> summarize_forests(const LengthPartitionedGraph& graph) {
    std::vector<ForestSummary> out;
    out.reserve(graph.distinct_lengths());
    for (const auto& [len, g] : graph.subgraphs()) out.push_back(summarize_forests(g));
    return out;
}

} // namespace ladder
