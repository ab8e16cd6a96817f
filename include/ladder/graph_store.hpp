#pragma once

#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

#include "ladder/word_graph.hpp"

namespace ladder {

// A snapshot could not be written.
class SnapshotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persistence for a fully explored LengthPartitionedGraph.
// A graph returned by try_load() is trusted as-is: no filtering or labeling is
// re-run on it, so implementations must hand back an already labeled graph.
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // nullopt when there is nothing usable to load.
    virtual std::optional<LengthPartitionedGraph> try_load() = 0;

    // Throws SnapshotError if the snapshot cannot be written.
    virtual void save(const LengthPartitionedGraph& graph) = 0;
};

// Snapshot kept in a single CSV file:
//
//   length,word,label,neighbors
//   3,cat,1,cot cag
//
// One row per word; neighbors are space separated inside the last cell and the
// cell is empty for isolated words. Rows are grouped by length and sorted by
// word so that snapshots of the same graph compare equal.
class CsvGraphStore : public GraphStore {
public:
    static constexpr const char* kDefaultPath = "wordForest.csv";

    explicit CsvGraphStore(std::string path = kDefaultPath);

    const std::string& path() const { return path_; }

    // Missing file -> nullopt. A file that cannot be parsed or fails the
    // invariant check is reported on std::cerr and also yields nullopt, so the
    // caller rebuilds and overwrites it.
    std::optional<LengthPartitionedGraph> try_load() override;

    void save(const LengthPartitionedGraph& graph) override;

    // Parse a snapshot; throws std::runtime_error describing the first problem.
    static LengthPartitionedGraph parse(std::istream& in);

private:
    std::string path_;
};

} // namespace ladder
