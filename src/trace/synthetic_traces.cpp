/**
 * @file synthetic_traces.cpp
 * @brief Reference trace generators and the default catalog
 *
 * Line numbers recorded in steps refer to the reference listings of each
 * algorithm (comparison, swap, probe, enqueue lines), so a player can align
 * the playback with the listing it shows next to the array.
 *
 * @date 2025
 */

#include "algoscope/trace/synthetic_traces.hpp"
#include "algoscope/trace/trace_builder.hpp"
#include "algoscope/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <limits>
#include <optional>
#include <set>
#include <utility>

using json = nlohmann::json;

namespace algoscope {
namespace trace {

using utils::StringUtils;

namespace {

const std::vector<double> kDefaultSortInput = {5, 1, 4, 2, 8};
const std::vector<double> kDefaultSearchInput = {1, 3, 5, 7, 9, 11};
constexpr double kDefaultSearchTarget = 7;
constexpr int kDefaultBfsStart = 0;

Graph DefaultBfsGraph() {
    return Graph{
        {0, {1, 2}},
        {1, {0, 3}},
        {2, {0, 3}},
        {3, {1, 2, 4}},
        {4, {3}},
    };
}

std::string Num(double value) {
    return StringUtils::FormatNumber(value);
}

std::vector<double> ToSnapshot(const std::deque<int>& queue) {
    return std::vector<double>(queue.begin(), queue.end());
}

// ============================================================================
// INPUT DECODING
// ============================================================================

std::vector<double> DecodeNumbers(const json& value, const std::string& id, std::size_t max_elements) {
    if (!value.is_array()) {
        throw TraceInputError("input for '" + id + "' must be an array of numbers");
    }
    if (value.size() > max_elements) {
        throw TraceInputError("input for '" + id + "' has " + std::to_string(value.size()) +
                              " elements, limit is " + std::to_string(max_elements));
    }

    std::vector<double> numbers;
    numbers.reserve(value.size());
    for (const auto& element : value) {
        if (!element.is_number()) {
            throw TraceInputError("input for '" + id + "' must contain only numbers");
        }
        numbers.push_back(element.get<double>());
    }
    return numbers;
}

int DecodeNodeId(const std::string& text, const std::string& id) {
    std::size_t consumed = 0;
    int node = 0;
    try {
        node = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        throw TraceInputError("graph node '" + text + "' for '" + id + "' is not an integer");
    }
    return node;
}

int DecodeNodeValue(const json& value, const std::string& what, const std::string& id) {
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return value.get<int>();
        }
    } else if (value.is_number_integer()) {
        const auto number = value.get<std::int64_t>();
        if (number >= std::numeric_limits<int>::min() && number <= std::numeric_limits<int>::max()) {
            return static_cast<int>(number);
        }
    } else {
        throw TraceInputError(what + " for '" + id + "' must be an integer");
    }
    throw TraceInputError(what + " for '" + id + "' is out of range");
}

std::vector<int> DecodeNeighbors(const json& value, const std::string& id) {
    if (!value.is_array()) {
        throw TraceInputError("graph adjacency lists for '" + id + "' must be arrays");
    }
    std::vector<int> neighbors;
    neighbors.reserve(value.size());
    for (const auto& element : value) {
        neighbors.push_back(DecodeNodeValue(element, "graph neighbor", id));
    }
    return neighbors;
}

std::vector<core::TraceStep> GenerateSort(
    const json& input, std::size_t max_elements, const std::string& id,
    std::vector<core::TraceStep> (*generator)(std::vector<double>)) {

    if (input.is_null()) {
        return generator(kDefaultSortInput);
    }
    if (input.is_object() && input.contains("array")) {
        return generator(DecodeNumbers(input.at("array"), id, max_elements));
    }
    return generator(DecodeNumbers(input, id, max_elements));
}

std::vector<core::TraceStep> GenerateBinarySearch(const json& input, std::size_t max_elements) {
    const std::string id = "binary-search";

    if (input.is_null()) {
        return BinarySearchTrace(kDefaultSearchInput, kDefaultSearchTarget);
    }

    std::vector<double> values;
    std::optional<double> target;

    if (input.is_object()) {
        if (!input.contains("array")) {
            throw TraceInputError("input for 'binary-search' needs an 'array' field");
        }
        values = DecodeNumbers(input.at("array"), id, max_elements);
        if (input.contains("target")) {
            if (!input.at("target").is_number()) {
                throw TraceInputError("'target' for 'binary-search' must be a number");
            }
            target = input.at("target").get<double>();
        }
    } else {
        values = DecodeNumbers(input, id, max_elements);
    }

    if (!target) {
        target = values.empty() ? kDefaultSearchTarget : values[values.size() / 2];
    }
    return BinarySearchTrace(values, *target);
}

std::vector<core::TraceStep> GenerateBfs(const json& input, std::size_t max_elements) {
    const std::string id = "bfs";

    if (input.is_null()) {
        return BfsTrace(DefaultBfsGraph(), kDefaultBfsStart);
    }
    if (!input.is_object() || !input.contains("graph")) {
        throw TraceInputError("input for 'bfs' must be an object with a 'graph' field");
    }

    const auto& graph_value = input.at("graph");
    Graph graph;
    if (graph_value.is_object()) {
        for (const auto& [key, neighbors] : graph_value.items()) {
            graph[DecodeNodeId(key, id)] = DecodeNeighbors(neighbors, id);
        }
    } else if (graph_value.is_array()) {
        int node = 0;
        for (const auto& neighbors : graph_value) {
            graph[node++] = DecodeNeighbors(neighbors, id);
        }
    } else {
        throw TraceInputError("'graph' for 'bfs' must be an object or an array of adjacency lists");
    }

    if (graph.size() > max_elements) {
        throw TraceInputError("graph for 'bfs' has " + std::to_string(graph.size()) +
                              " nodes, limit is " + std::to_string(max_elements));
    }

    std::size_t edges = 0;
    for (const auto& [node, neighbors] : graph) {
        edges += neighbors.size();
        for (int neighbor : neighbors) {
            if (graph.count(neighbor) == 0) {
                throw TraceInputError("neighbor " + std::to_string(neighbor) + " of node " +
                                      std::to_string(node) + " for 'bfs' is not a graph node");
            }
        }
    }
    if (edges > max_elements * max_elements) {
        throw TraceInputError("graph for 'bfs' has " + std::to_string(edges) +
                              " neighbor entries, limit is " + std::to_string(max_elements * max_elements));
    }

    int start = kDefaultBfsStart;
    if (input.contains("start")) {
        start = DecodeNodeValue(input.at("start"), "'start'", id);
    }

    return BfsTrace(graph, start);
}

} // namespace

// ============================================================================
// SORTING
// ============================================================================

std::vector<core::TraceStep> BubbleSortTrace(std::vector<double> arr) {
    TraceBuilder builder;
    const int n = static_cast<int>(arr.size());

    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n - i - 1; ++j) {
            builder.AddArrayStep(4,
                "Compare arr[" + std::to_string(j) + "] = " + Num(arr[j]) +
                " and arr[" + std::to_string(j + 1) + "] = " + Num(arr[j + 1]),
                arr, {j, j + 1});

            if (arr[j] > arr[j + 1]) {
                std::swap(arr[j], arr[j + 1]);
                builder.AddArrayStep(6,
                    "Swap indices " + std::to_string(j) + " and " + std::to_string(j + 1),
                    arr, {j, j + 1});
            }
        }

        builder.AddArrayStep(2, "End of outer loop iteration i = " + std::to_string(i), arr, {});
    }

    builder.AddArrayStep(0, "Array fully sorted.", arr, {});
    return builder.Build();
}

std::vector<core::TraceStep> InsertionSortTrace(std::vector<double> arr) {
    TraceBuilder builder;
    const int n = static_cast<int>(arr.size());

    for (int i = 1; i < n; ++i) {
        const double key = arr[i];
        builder.AddArrayStep(3, "Pick key arr[" + std::to_string(i) + "] = " + Num(key), arr, {i});

        int j = i - 1;
        while (j >= 0 && arr[j] > key) {
            arr[j + 1] = arr[j];
            builder.AddArrayStep(6,
                "arr[" + std::to_string(j) + "] = " + Num(arr[j]) + " > " + Num(key) +
                " → shift it to index " + std::to_string(j + 1),
                arr, {j, j + 1});
            --j;
        }

        arr[j + 1] = key;
        builder.AddArrayStep(9, "Insert " + Num(key) + " at index " + std::to_string(j + 1),
                             arr, {j + 1});
    }

    builder.AddArrayStep(0, "Array fully sorted.", arr, {});
    return builder.Build();
}

std::vector<core::TraceStep> SelectionSortTrace(std::vector<double> arr) {
    TraceBuilder builder;
    const int n = static_cast<int>(arr.size());

    for (int i = 0; i + 1 < n; ++i) {
        int min_index = i;
        builder.AddArrayStep(3,
            "Start pass " + std::to_string(i) + ": assume arr[" + std::to_string(i) + "] = " +
            Num(arr[i]) + " is the minimum",
            arr, {i});

        for (int j = i + 1; j < n; ++j) {
            builder.AddArrayStep(5,
                "Compare arr[" + std::to_string(j) + "] = " + Num(arr[j]) +
                " with current minimum arr[" + std::to_string(min_index) + "] = " + Num(arr[min_index]),
                arr, {min_index, j});

            if (arr[j] < arr[min_index]) {
                min_index = j;
                builder.AddArrayStep(6, "New minimum arr[" + std::to_string(j) + "] = " + Num(arr[j]),
                                     arr, {j});
            }
        }

        if (min_index != i) {
            std::swap(arr[i], arr[min_index]);
            builder.AddArrayStep(9,
                "Swap indices " + std::to_string(i) + " and " + std::to_string(min_index),
                arr, {i, min_index});
        }
    }

    builder.AddArrayStep(0, "Array fully sorted.", arr, {});
    return builder.Build();
}

// ============================================================================
// SEARCHING
// ============================================================================

std::vector<core::TraceStep> BinarySearchTrace(const std::vector<double>& arr, double target) {
    if (!std::is_sorted(arr.begin(), arr.end())) {
        throw TraceInputError("input for 'binary-search' must be sorted in ascending order");
    }

    TraceBuilder builder;
    int lo = 0;
    int hi = static_cast<int>(arr.size()) - 1;

    while (lo <= hi) {
        const int mid = lo + (hi - lo) / 2;
        const double mid_value = arr[mid];

        builder.AddArrayStep(5,
            "lo = " + std::to_string(lo) + ", hi = " + std::to_string(hi) +
            ", mid = " + std::to_string(mid) + ", arr[mid] = " + Num(mid_value),
            arr, {lo, mid, hi});

        if (mid_value == target) {
            builder.AddArrayStep(9,
                "Found target " + Num(target) + " at index " + std::to_string(mid) + ".",
                arr, {mid});
            return builder.Build();
        }

        if (mid_value < target) {
            lo = mid + 1;
            builder.AddArrayStep(11,
                "arr[mid] < target → move lo to mid + 1 (" + std::to_string(lo) + ").",
                arr, {mid});
        } else {
            hi = mid - 1;
            builder.AddArrayStep(13,
                "arr[mid] > target → move hi to mid - 1 (" + std::to_string(hi) + ").",
                arr, {mid});
        }
    }

    builder.AddArrayStep(17, "Target " + Num(target) + " not found. Returning -1.", arr, {});
    return builder.Build();
}

// ============================================================================
// GRAPHS
// ============================================================================

std::vector<core::TraceStep> BfsTrace(const Graph& graph, int start) {
    TraceBuilder builder;
    std::set<int> visited;
    std::deque<int> queue;

    visited.insert(start);
    queue.push_back(start);

    builder.AddArrayStep(1,
        "Start BFS from node " + std::to_string(start) + ". Enqueue " + std::to_string(start) + ".",
        ToSnapshot(queue), {0});

    while (!queue.empty()) {
        builder.AddArrayStep(5, "Dequeue node " + std::to_string(queue.front()) + " from queue.",
                             ToSnapshot(queue), {0});

        const int node = queue.front();
        queue.pop_front();

        builder.AddArrayStep(6, "Visit node " + std::to_string(node) + ".",
                             {static_cast<double>(node)}, {0});

        auto it = graph.find(node);
        if (it != graph.end()) {
            for (int neighbor : it->second) {
                if (visited.insert(neighbor).second) {
                    queue.push_back(neighbor);
                    builder.AddArrayStep(8,
                        "Discover neighbor " + std::to_string(neighbor) + " of node " +
                        std::to_string(node) + ". Enqueue " + std::to_string(neighbor) + ".",
                        ToSnapshot(queue), {static_cast<int>(queue.size()) - 1});
                }
            }
        }

        std::vector<std::string> queued;
        for (int queued_node : queue) {
            queued.push_back(std::to_string(queued_node));
        }
        builder.AddArrayStep(10,
            "Queue after processing node " + std::to_string(node) + ": [" +
            StringUtils::Join(queued, ", ") + "].",
            ToSnapshot(queue), {});
    }

    builder.AddArrayStep(12, "BFS complete. Queue is empty and all reachable nodes visited.", {}, {});
    return builder.Build();
}

// ============================================================================
// CATALOG
// ============================================================================

SyntheticTraceCatalog SyntheticTraceCatalog::CreateDefault() {
    SyntheticTraceCatalog catalog;

    catalog.Register({"bubble-sort", "Bubble Sort", "sorting",
        [](const json& input, std::size_t max_elements) {
            return GenerateSort(input, max_elements, "bubble-sort", &BubbleSortTrace);
        }});
    catalog.Register({"insertion-sort", "Insertion Sort", "sorting",
        [](const json& input, std::size_t max_elements) {
            return GenerateSort(input, max_elements, "insertion-sort", &InsertionSortTrace);
        }});
    catalog.Register({"selection-sort", "Selection Sort", "sorting",
        [](const json& input, std::size_t max_elements) {
            return GenerateSort(input, max_elements, "selection-sort", &SelectionSortTrace);
        }});
    catalog.Register({"binary-search", "Binary Search", "searching", &GenerateBinarySearch});
    catalog.Register({"bfs", "Breadth-First Search", "graph", &GenerateBfs});

    return catalog;
}

void SyntheticTraceCatalog::Register(SyntheticAlgorithm algorithm) {
    if (algorithms_.count(algorithm.id) > 0) {
        spdlog::warn("Replacing synthetic trace generator '{}'", algorithm.id);
    }
    auto id = algorithm.id;
    algorithms_[id] = std::move(algorithm);
}

bool SyntheticTraceCatalog::Contains(const std::string& id) const {
    return algorithms_.count(id) > 0;
}

const SyntheticAlgorithm* SyntheticTraceCatalog::Find(const std::string& id) const {
    auto it = algorithms_.find(id);
    return it == algorithms_.end() ? nullptr : &it->second;
}

std::vector<std::string> SyntheticTraceCatalog::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(algorithms_.size());
    for (const auto& entry : algorithms_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<core::TraceStep> SyntheticTraceCatalog::Generate(const std::string& id,
                                                             const json& input,
                                                             std::size_t max_elements) const {
    const auto* algorithm = Find(id);
    if (algorithm == nullptr) {
        throw std::out_of_range("no synthetic trace generator for '" + id + "'");
    }
    return algorithm->generator(input, max_elements);
}

} // namespace trace
} // namespace algoscope
