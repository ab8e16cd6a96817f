#include <iostream>
#include <string>
#include "ladder/cli.hpp"
#include "ladder/csv.hpp"
#include "ladder/dictionary.hpp"
#include "ladder/forest_pipeline.hpp"
#include "ladder/forest_stats.hpp"
#include "ladder/graph_store.hpp"
#include "ladder/timer.hpp"

int main(int argc, char** argv) {
    using namespace ladder;
    ArgParser cli("Report forest statistics per word length.");
    cli.add_option(OptionSpec{.longName = "dict", .shortName = 'd', .type = ArgType::String, .valueName = "FILE|-", .help = "Word list, one word per line, or '-' for stdin", .required = false, .defaultValue = PipelineConfig::kDefaultDictionary});
    cli.add_option(OptionSpec{.longName = "graph", .shortName = 'g', .type = ArgType::String, .valueName = "FILE", .help = "Forest snapshot to reuse, or to create after a build", .required = false, .defaultValue = CsvGraphStore::kDefaultPath});
    cli.add_option(OptionSpec{.longName = "min-len", .shortName = '\0', .type = ArgType::Size, .valueName = "N", .help = "Shortest word admitted", .required = false, .defaultValue = std::to_string(WordFilter::kDefaultMinLength)});
    cli.add_option(OptionSpec{.longName = "max-len", .shortName = '\0', .type = ArgType::Size, .valueName = "N|inf", .help = "Longest word admitted; 'inf' for no limit", .required = false, .defaultValue = "inf", .allowInfToken = true});
    cli.add_option(OptionSpec{.longName = "threads", .shortName = 't', .type = ArgType::Size, .valueName = "N", .help = "Worker threads for forest labeling (0=auto)", .required = false, .defaultValue = "0"});
    cli.add_option(OptionSpec{.longName = "csv-out", .shortName = '\0', .type = ArgType::String, .valueName = "FILE", .help = "Write per-length statistics as CSV", .required = false});
    cli.add_flag("rebuild", '\0', "Ignore an existing snapshot and rebuild from the word list");
    cli.add_flag("check", '\0', "Verify labels and adjacency after loading");

    bool proceed = true;
    PipelineConfig config;
    try {
        proceed = cli.parse(argc, argv);
        if (proceed) {
            config.filter.min_length = cli.get_size("min-len");
            config.filter.max_length = cli.get_size("max-len");
            config.filter.validate();
            config.threads = static_cast<unsigned>(cli.get_size("threads"));
            config.rebuild = cli.get_flag("rebuild");
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

    Timer t_total;
    LoadResult loaded;
    try {
        loaded = load_or_build(store, [&dict_path]() { return read_words(dict_path); }, config, std::cerr);
    } catch (const DictionaryError& e) {
        std::cerr << "Failed to read word list: " << e.what() << "\n";
        return 2;
    } catch (const SnapshotError& e) {
        std::cerr << "Failed to save forest graph: " << e.what() << "\n";
        return 3;
    }

    if (cli.get_flag("check")) {
        try {
            loaded.graph.check_invariants();
        } catch (const std::exception& e) {
            std::cerr << "Forest graph is inconsistent: " << e.what() << "\n";
            return 4;
        }
    }

    const auto summaries = summarize_forests(loaded.graph);
    for (const auto& s : summaries) {
        std::cout << "length=" << s.length
                  << " words=" << s.words
                  << " forests=" << s.forests
                  << " largest=" << s.largest
                  << " singletons=" << s.singletons
                  << " edges=" << s.edges
                  << "\n";
    }

    if (cli.provided("csv-out")) {
        const std::string out_path = cli.get_string("csv-out");
        CSVWriter csv(out_path);
        if (!csv.is_open()) {
            std::cerr << "Failed to open output file: " << out_path << "\n";
            return 3;
        }
        csv.header("length", "words", "forests", "largest", "singletons", "edges");
        for (const auto& s : summaries) {
            csv.row(s.length, s.words, s.forests, s.largest, s.singletons, s.edges);
        }
        if (!csv.close()) {
            std::cerr << "Failed to write output file: " << out_path << "\n";
            return 3;
        }
    }

    std::cout << "words=" << loaded.graph.total_words()
              << " forests=" << loaded.graph.total_forests()
              << " lengths=" << loaded.graph.distinct_lengths()
              << " source=" << (loaded.from_store ? "snapshot" : "dictionary")
              << " total_sec=" << t_total.sec()
              << "\n";
    return 0;
}
