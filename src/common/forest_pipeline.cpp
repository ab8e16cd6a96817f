#include "ladder/forest_pipeline.hpp"

#include <algorithm>
#include <thread>

#include "ladder/timer.hpp"

namespace ladder {

static unsigned resolve_threads(unsigned requested) {
    if (requested != PipelineConfig::kAutoThreads) return requested;
    const unsigned hw = std::thread::hardware_concurrency();
    return std::max(1u, hw ? hw : 1u);
}

std::size_t admit_words(LengthPartitionedGraph& graph, const std::vector<std::string>& words,
                        const WordFilter& filter) {
    std::size_t admitted = 0;
    for (const auto& w : words) {
        if (!filter(w)) continue;
        graph.add_word(w);
        ++admitted;
    }
    return admitted;
}

LengthPartitionedGraph build_graph(const std::vector<std::string>& words, const WordFilter& filter,
                                   unsigned threads) {
    filter.validate();
    LengthPartitionedGraph graph;
    admit_words(graph, words, filter);
    graph.explore_forests(resolve_threads(threads));
    return graph;
}

LoadResult load_or_build(GraphStore& store, const WordSource& source, const PipelineConfig& config,
                         std::ostream& log) {
    config.filter.validate();
    LoadResult result;
    Timer t;

    if (!config.rebuild) {
        if (auto restored = store.try_load()) {
            result.graph = std::move(*restored);
            result.from_store = true;
            result.sec_load = t.lap_sec();
            log << "Loaded pre-processed forest graph. " << result.graph.distinct_lengths()
                << " distinct word lengths in graph.\n";
            for (const auto& [len, g] : result.graph.subgraphs()) {
                log << "There are " << g.word_count() << " words of size " << len << ".\n";
            }
            return result;
        }
    }

    const std::vector<std::string> words = source();
    result.candidates = words.size();
    admit_words(result.graph, words, config.filter);
    result.sec_load = t.lap_sec();

    log << "Assigning forests and analyzing neighbors. There are " << result.graph.distinct_lengths()
        << " distinct word lengths.\n";
    result.graph.explore_forests(resolve_threads(config.threads));
    result.sec_explore = t.lap_sec();
    log << "Assigned " << result.graph.total_words() << " words into " << result.graph.total_forests()
        << " forests.\n";

    store.save(result.graph);
    result.sec_save = t.lap_sec();
    return result;
}

} // namespace ladder
