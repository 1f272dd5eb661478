#include <iostream>
#include <vector>
#include <chrono>
#include <unordered_set>
#include <random>
#include <string>
#include <utility>
#include "scalarset/set.hpp"

using namespace scalarset;

// Insertion-ordered set built from standard containers for comparison
class VectorIndexSet {
private:
    std::unordered_set<Scalar> index_;
    std::vector<Scalar> order_;

public:
    void add(const Scalar& value) {
        if (index_.insert(value).second) {
            order_.push_back(value);
        }
    }

    void remove(const Scalar& value) {
        if (index_.erase(value) > 0) {
            for (auto it = order_.begin(); it != order_.end(); ++it) {
                if (*it == value) {
                    order_.erase(it);
                    break;
                }
            }
        }
    }

    bool contains(const Scalar& value) const {
        return index_.count(value) > 0;
    }

    size_t size() const {
        return order_.size();
    }
};

std::vector<Scalar> generate_values(int count, int range) {
    std::vector<Scalar> values;
    values.reserve(count);

    std::mt19937 gen(42);
    std::uniform_int_distribution<> value_dist(1, range);
    std::uniform_int_distribution<> kind_dist(0, 1);

    for (int i = 0; i < count; ++i) {
        int value = value_dist(gen);
        if (kind_dist(gen) == 0) {
            values.emplace_back(value);
        } else {
            values.emplace_back("key" + std::to_string(value));
        }
    }
    return values;
}

template<typename SetType>
void benchmark_set_throughput(const std::string& name, int operations, int read_percentage) {
    SetType set;

    // Pre-generate all random data to avoid RNG during timing
    std::vector<Scalar> values = generate_values(operations, operations / 2);
    std::vector<int> ops(operations);
    std::mt19937 gen(7);
    std::uniform_int_distribution<> op_dist(0, 99);
    for (int i = 0; i < operations; ++i) {
        ops[i] = op_dist(gen);
    }

    std::cout << "Benchmarking " << name << " - " << operations << " ops, "
              << read_percentage << "% reads\n";

    size_t hits = 0;
    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < operations; ++i) {
        const Scalar& value = values[i];
        int op = ops[i];

        if (op < read_percentage) {
            hits += set.contains(value) ? 1 : 0;
        } else if (op < read_percentage + (100 - read_percentage) / 2) {
            set.add(value);
        } else {
            set.remove(value);
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    double throughput = (operations * 1000000.0) / (duration.count() > 0 ? duration.count() : 1);

    std::cout << "  Time: " << duration.count() << " us\n";
    std::cout << "  Throughput: " << static_cast<long>(throughput) << " ops/sec\n";
    std::cout << "  Hits: " << hits << ", final set size: " << set.size() << "\n\n";
}

void benchmark_read_heavy_workload() {
    std::cout << "=== Read-Heavy Workload (80% contains) ===\n\n";

    benchmark_set_throughput<Set>("Ordered Set", 20000, 80);
    benchmark_set_throughput<VectorIndexSet>("Vector+Index Set", 20000, 80);
}

void benchmark_write_heavy_workload() {
    std::cout << "=== Write-Heavy Workload (20% contains) ===\n\n";

    benchmark_set_throughput<Set>("Ordered Set", 20000, 20);
    benchmark_set_throughput<VectorIndexSet>("Vector+Index Set", 20000, 20);
}

void benchmark_algebra() {
    std::cout << "=== Set Algebra ===\n\n";

    std::vector<int> sizes = {1000, 10000, 100000};

    for (int size : sizes) {
        std::cout << "--- " << size << " elements ---\n";

        Set a(generate_values(size, size));
        Set b(generate_values(size, size * 2));

        auto start_time = std::chrono::high_resolution_clock::now();
        Set all = Set::union_all(a, b);
        auto union_time = std::chrono::high_resolution_clock::now();
        Set both = Set::intersect(a, b);
        auto intersect_time = std::chrono::high_resolution_clock::now();
        Set only_a(a);
        only_a.remove_all(b);
        auto difference_time = std::chrono::high_resolution_clock::now();
        bool same = all.equals(Set::union_all(only_a, b));
        auto equals_time = std::chrono::high_resolution_clock::now();

        auto micros = [](auto from, auto to) {
            return std::chrono::duration_cast<std::chrono::microseconds>(to - from).count();
        };

        std::cout << "  union_all:  " << micros(start_time, union_time) << " us (" << all.size() << " elements)\n";
        std::cout << "  intersect:  " << micros(union_time, intersect_time) << " us (" << both.size() << " elements)\n";
        std::cout << "  remove_all: " << micros(intersect_time, difference_time) << " us (" << only_a.size() << " elements)\n";
        std::cout << "  equals:     " << micros(difference_time, equals_time) << " us (" << same << ")\n\n";
    }
}

void benchmark_key_mapping_round_trip() {
    std::cout << "=== Key Mapping Round Trip ===\n\n";

    Set set(generate_values(100000, 100000));

    auto start_time = std::chrono::high_resolution_clock::now();
    Set copied = Set::from_array_keys(set.to_array_keys());
    auto copy_time = std::chrono::high_resolution_clock::now();
    Set adopted = Set::from_array_keys(set.take_array_keys());
    auto adopt_time = std::chrono::high_resolution_clock::now();

    std::cout << "  Copy (" << copied.size() << " elements): "
              << std::chrono::duration_cast<std::chrono::microseconds>(copy_time - start_time).count() << " us\n";
    std::cout << "  Adopt (" << adopted.size() << " elements): "
              << std::chrono::duration_cast<std::chrono::microseconds>(adopt_time - copy_time).count() << " us\n\n";
}

int main() {
    std::cout << "Set Performance Benchmark\n";
    std::cout << "========================\n\n";

    benchmark_read_heavy_workload();
    benchmark_write_heavy_workload();
    benchmark_algebra();
    benchmark_key_mapping_round_trip();

    return 0;
}
