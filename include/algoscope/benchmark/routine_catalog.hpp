/**
 * @file routine_catalog.hpp
 * @brief Vetted native routines that can be benchmarked by id
 *
 * @date 2025
 */

#pragma once

#include "algoscope/benchmark/benchmark_harness.hpp"

#include <map>
#include <string>
#include <vector>

namespace algoscope {
namespace benchmark {

/**
 * @struct BenchmarkRoutine
 * @brief Catalog entry: input generator + routine + default sizes
 */
struct BenchmarkRoutine {
    std::string id;                          ///< Wire id, e.g. "bubble-sort"
    std::string name;                        ///< Display name
    std::string complexity;                  ///< Expected growth, e.g. "O(n^2)"
    InputGenerator generator;
    Routine routine;
    std::vector<std::size_t> default_sizes;
};

/// Sizes used when a request names none
const std::vector<std::size_t>& DefaultBenchmarkSizes();

/**
 * @class RoutineCatalog
 * @brief Closed mapping id -> BenchmarkRoutine
 */
class RoutineCatalog {
public:
    /// bubble-sort, insertion-sort, selection-sort, binary-search
    static RoutineCatalog CreateDefault();

    void Register(BenchmarkRoutine routine);

    bool Contains(const std::string& id) const;
    const BenchmarkRoutine* Find(const std::string& id) const;
    std::vector<std::string> Ids() const;

    const std::map<std::string, BenchmarkRoutine>& Routines() const { return routines_; }

private:
    std::map<std::string, BenchmarkRoutine> routines_;
};

} // namespace benchmark
} // namespace algoscope
