#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "ladder/cli.hpp"
#include "ladder/csv.hpp"
#include "ladder/dictionary.hpp"
#include "ladder/forest_pipeline.hpp"
#include "ladder/graph_store.hpp"
#include "ladder/timer.hpp"
#include "ladder/word_filter.hpp"

using WordPair = std::pair<std::string, std::string>;

static const std::vector<WordPair> kDemoPairs = {
    {"cat", "dog"}, {"ape", "man"}, {"pig", "sty"}, {"pen", "ink"}, {"one", "two"}, {"bat", "cry"},
    {"goat", "fish"}, {"bake", "farm"}, {"lawn", "brat"},
    {"snake", "cards"}, {"plant", "graph"}};

// Query pairs from a CSV file of "from,to" rows; a "from,to" header row is skipped.
static std::vector<WordPair> read_pairs(const std::string& path) {
    ladder::CSVReader reader(path);
    if (!reader.is_open()) throw std::runtime_error("could not open query file '" + path + "'");
    std::vector<WordPair> pairs;
    std::vector<std::string> cells;
    while (reader.next(cells)) {
        if (cells.size() != 2) {
            throw std::runtime_error(path + ":" + std::to_string(reader.line_number()) +
                                     ": expected 2 cells, got " + std::to_string(cells.size()));
        }
        if (pairs.empty() && cells[0] == "from" && cells[1] == "to") continue;
        pairs.emplace_back(cells[0], cells[1]);
    }
    return pairs;
}

static std::string format_ladder(const std::optional<ladder::Ladder>& path) {
    if (!path) return "none";
    std::string out = "[";
    for (std::size_t i = 0; i < path->size(); ++i) {
        if (i) out += ' ';
        out += (*path)[i];
    }
    return out + "]";
}

int main(int argc, char** argv) {
    using namespace ladder;
    ArgParser cli("Group a word list into one-letter-edit forests and find word ladders.");
    cli.add_option(OptionSpec{.longName = "dict", .shortName = 'd', .type = ArgType::String, .valueName = "FILE|-", .help = "Word list, one word per line, or '-' for stdin", .required = false, .defaultValue = PipelineConfig::kDefaultDictionary});
    cli.add_option(OptionSpec{.longName = "graph", .shortName = 'g', .type = ArgType::String, .valueName = "FILE", .help = "Forest snapshot to reuse, or to create after a build", .required = false, .defaultValue = CsvGraphStore::kDefaultPath});
    cli.add_option(OptionSpec{.longName = "min-len", .shortName = '\0', .type = ArgType::Size, .valueName = "N", .help = "Shortest word admitted", .required = false, .defaultValue = std::to_string(WordFilter::kDefaultMinLength)});
    cli.add_option(OptionSpec{.longName = "max-len", .shortName = '\0', .type = ArgType::Size, .valueName = "N|inf", .help = "Longest word admitted; 'inf' for no limit", .required = false, .defaultValue = "inf", .allowInfToken = true});
    cli.add_option(OptionSpec{.longName = "threads", .shortName = 't', .type = ArgType::Size, .valueName = "N", .help = "Worker threads for forest labeling (0=auto)", .required = false, .defaultValue = "0"});
    cli.add_option(OptionSpec{.longName = "queries", .shortName = 'q', .type = ArgType::String, .valueName = "FILE", .help = "CSV of from,to word pairs to query", .required = false});
    cli.add_flag("rebuild", '\0', "Ignore an existing snapshot and rebuild from the word list");
    cli.allow_positionals("FROM TO ...", "Word pairs to query; without pairs or --queries a built-in set is used");

    bool proceed = true;
    PipelineConfig config;
    std::vector<WordPair> pairs;
    try {
        proceed = cli.parse(argc, argv);
        if (proceed) {
            config.filter.min_length = cli.get_size("min-len");
            config.filter.max_length = cli.get_size("max-len");
            config.filter.validate();
            config.threads = static_cast<unsigned>(cli.get_size("threads"));
            config.rebuild = cli.get_flag("rebuild");

            const auto& words = cli.positionals();
            if (words.size() % 2 != 0) throw std::runtime_error("query words must come in pairs");
            for (std::size_t i = 0; i + 1 < words.size(); i += 2) pairs.emplace_back(words[i], words[i + 1]);
            if (cli.provided("queries")) {
                auto more = read_pairs(cli.get_string("queries"));
                pairs.insert(pairs.end(), more.begin(), more.end());
            }
            if (pairs.empty()) pairs = kDemoPairs;
        }
    } catch (const std::exception& e) {
        std::cerr << cli.usage(argv[0]) << "\n" << e.what() << "\n";
        return 1;
    }
    if (!proceed) {
        std::cout << cli.help(argv[0]);
        return 0;
    }

    const std::string dict_path = cli.get_string("dict");
    CsvGraphStore store(cli.get_string("graph"));
    const WordSource source = [&dict_path]() {
        std::cout << "Loading words from " << dict_path << ".\n";
        return read_words(dict_path);
    };

    Timer t_total;
    LoadResult loaded;
    try {
        if (!config.rebuild) std::cout << "Looking for pre-processed graph in " << store.path() << ".\n";
        loaded = load_or_build(store, source, config, std::cout);
    } catch (const DictionaryError& e) {
        std::cerr << "Failed to read word list: " << e.what() << "\n";
        return 2;
    } catch (const SnapshotError& e) {
        std::cerr << "Failed to save forest graph: " << e.what() << "\n";
        return 3;
    }
    const LengthPartitionedGraph& graph = loaded.graph;

    Timer t_query;
    for (const auto& [s1, s2] : pairs) {
        std::cout << s1 << " -> " << s2 << ": " << std::boolalpha << graph.are_connected(s1, s2) << "\n";
        std::cout << s2 << " -> " << s1 << ": " << std::boolalpha << graph.are_connected(s2, s1) << "\n";
    }
    std::cout << "\n";
    for (const auto& [s1, s2] : pairs) {
        std::cout << s1 << " -> " << s2 << ": " << format_ladder(graph.shortest_path(s1, s2)) << "\n";
        std::cout << s2 << " -> " << s1 << ": " << format_ladder(graph.shortest_path(s2, s1)) << "\n";
    }
    const double sec_query = t_query.sec();

    std::cout << "words=" << graph.total_words()
              << " forests=" << graph.total_forests()
              << " lengths=" << graph.distinct_lengths()
              << " source=" << (loaded.from_store ? "snapshot" : "dictionary")
              << " load_sec=" << loaded.sec_load
              << " explore_sec=" << loaded.sec_explore
              << " save_sec=" << loaded.sec_save
              << " query_sec=" << sec_query
              << " total_sec=" << t_total.sec()
              << " pairs=" << pairs.size()
              << "\n";
    return 0;
}
