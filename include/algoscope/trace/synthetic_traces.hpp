/**
 * @file synthetic_traces.hpp
 * @brief Reference trace generators keyed by algorithm id
 *
 * Each generator replays a trusted reference implementation of a catalog
 * algorithm and records one step per comparison, swap, probe or queue
 * operation. Generators are pure functions of their input.
 *
 * **Catalog**:
 * | id             | input                                   | default                 |
 * |----------------|-----------------------------------------|-------------------------|
 * | bubble-sort    | number[]                                | [5,1,4,2,8]             |
 * | insertion-sort | number[]                                | [5,1,4,2,8]             |
 * | selection-sort | number[]                                | [5,1,4,2,8]             |
 * | binary-search  | sorted number[] or {array, target}      | [1,3,5,7,9,11], 7       |
 * | bfs            | {graph: {node: [neighbors]}, start}     | 5-node graph, start 0   |
 *
 * The element cap applies to array length and to graph node count. A graph
 * also may not list more than cap² neighbor entries, and every neighbor must
 * be one of its nodes.
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/types.hpp"
#include "algoscope/trace/trace_builder.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace algoscope {
namespace trace {

/// Adjacency lists keyed by node id
using Graph = std::map<int, std::vector<int>>;

// ============================================================================
// GENERATORS
// ============================================================================

std::vector<core::TraceStep> BubbleSortTrace(std::vector<double> values);
std::vector<core::TraceStep> InsertionSortTrace(std::vector<double> values);
std::vector<core::TraceStep> SelectionSortTrace(std::vector<double> values);

/**
 * @brief Binary search probes over a sorted array
 * @throws TraceInputError if @p values is not sorted
 */
std::vector<core::TraceStep> BinarySearchTrace(const std::vector<double>& values, double target);

/**
 * @brief Breadth-first traversal; snapshots show the queue
 */
std::vector<core::TraceStep> BfsTrace(const Graph& graph, int start);

// ============================================================================
// CATALOG
// ============================================================================

/// Generator entry point: (input or null, element cap) -> steps
using SyntheticGenerator =
    std::function<std::vector<core::TraceStep>(const nlohmann::json& input, std::size_t max_elements)>;

/**
 * @struct SyntheticAlgorithm
 * @brief Catalog entry
 */
struct SyntheticAlgorithm {
    std::string id;            ///< Wire id, e.g. "bubble-sort"
    std::string name;          ///< Display name
    std::string category;      ///< "sorting", "searching", "graph"
    SyntheticGenerator generator;
};

/**
 * @class SyntheticTraceCatalog
 * @brief Immutable-after-construction mapping id -> generator
 */
class SyntheticTraceCatalog {
public:
    /// Catalog with every built-in generator
    static SyntheticTraceCatalog CreateDefault();

    void Register(SyntheticAlgorithm algorithm);

    bool Contains(const std::string& id) const;
    const SyntheticAlgorithm* Find(const std::string& id) const;
    std::vector<std::string> Ids() const;

    /**
     * @brief Run the generator registered under @p id
     *
     * @throws std::out_of_range if @p id is unknown
     * @throws TraceInputError if @p input does not fit the generator
     */
    std::vector<core::TraceStep> Generate(const std::string& id,
                                          const nlohmann::json& input,
                                          std::size_t max_elements) const;

    const std::map<std::string, SyntheticAlgorithm>& Algorithms() const { return algorithms_; }

private:
    std::map<std::string, SyntheticAlgorithm> algorithms_;
};

} // namespace trace
} // namespace algoscope
