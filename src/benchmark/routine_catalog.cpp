/**
 * @file routine_catalog.cpp
 * @brief Reference routines and their input generators
 *
 * @date 2025
 */

#include "algoscope/benchmark/routine_catalog.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace algoscope {
namespace benchmark {

namespace {

// Values in [0, size * 10), like the playground's random arrays
BenchmarkInput RandomArray(std::size_t size, std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, static_cast<int>(size * 10) - 1);

    BenchmarkInput input;
    input.values.resize(size);
    for (auto& value : input.values) {
        value = dist(rng);
    }
    return input;
}

BenchmarkInput SortedArrayWithProbe(std::size_t size, std::mt19937& rng) {
    auto input = RandomArray(size, rng);
    std::sort(input.values.begin(), input.values.end());
    std::uniform_int_distribution<std::size_t> pick(0, size - 1);
    input.probe = input.values[pick(rng)];
    return input;
}

// ============================================================================
// ROUTINES
// ============================================================================

void BubbleSort(BenchmarkInput& input) {
    auto& arr = input.values;
    const std::size_t n = arr.size();
    for (std::size_t i = 0; i < n; ++i) {
        bool swapped = false;
        for (std::size_t j = 0; j + 1 < n - i; ++j) {
            if (arr[j] > arr[j + 1]) {
                std::swap(arr[j], arr[j + 1]);
                swapped = true;
            }
        }
        if (!swapped) {
            break;
        }
    }
}

void InsertionSort(BenchmarkInput& input) {
    auto& arr = input.values;
    for (std::size_t i = 1; i < arr.size(); ++i) {
        int key = arr[i];
        std::size_t j = i;
        while (j > 0 && arr[j - 1] > key) {
            arr[j] = arr[j - 1];
            --j;
        }
        arr[j] = key;
    }
}

void SelectionSort(BenchmarkInput& input) {
    auto& arr = input.values;
    const std::size_t n = arr.size();
    for (std::size_t i = 0; i + 1 < n; ++i) {
        std::size_t min_index = i;
        for (std::size_t j = i + 1; j < n; ++j) {
            if (arr[j] < arr[min_index]) {
                min_index = j;
            }
        }
        if (min_index != i) {
            std::swap(arr[i], arr[min_index]);
        }
    }
}

void BinarySearch(BenchmarkInput& input) {
    const auto& arr = input.values;
    std::ptrdiff_t lo = 0;
    std::ptrdiff_t hi = static_cast<std::ptrdiff_t>(arr.size()) - 1;
    std::ptrdiff_t found = -1;
    while (lo <= hi) {
        auto mid = lo + (hi - lo) / 2;
        if (arr[mid] == input.probe) {
            found = mid;
            break;
        }
        if (arr[mid] < input.probe) {
            lo = mid + 1;
        } else {
            hi = mid - 1;
        }
    }
    input.probe = static_cast<int>(found);
}

} // namespace

const std::vector<std::size_t>& DefaultBenchmarkSizes() {
    static const std::vector<std::size_t> sizes = {32, 64, 128, 256, 512, 1024};
    return sizes;
}

RoutineCatalog RoutineCatalog::CreateDefault() {
    RoutineCatalog catalog;
    catalog.Register({"bubble-sort", "Bubble Sort", "O(n^2)", &RandomArray, &BubbleSort, DefaultBenchmarkSizes()});
    catalog.Register({"insertion-sort", "Insertion Sort", "O(n^2)", &RandomArray, &InsertionSort, DefaultBenchmarkSizes()});
    catalog.Register({"selection-sort", "Selection Sort", "O(n^2)", &RandomArray, &SelectionSort, DefaultBenchmarkSizes()});
    catalog.Register({"binary-search", "Binary Search", "O(log n)", &SortedArrayWithProbe, &BinarySearch, DefaultBenchmarkSizes()});
    return catalog;
}

void RoutineCatalog::Register(BenchmarkRoutine routine) {
    if (routines_.count(routine.id) > 0) {
        spdlog::warn("Replacing benchmark routine '{}'", routine.id);
    }
    auto id = routine.id;
    routines_[id] = std::move(routine);
}

bool RoutineCatalog::Contains(const std::string& id) const {
    return routines_.count(id) > 0;
}

const BenchmarkRoutine* RoutineCatalog::Find(const std::string& id) const {
    auto it = routines_.find(id);
    return it == routines_.end() ? nullptr : &it->second;
}

std::vector<std::string> RoutineCatalog::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(routines_.size());
    for (const auto& entry : routines_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace benchmark
} // namespace algoscope
