#include <iostream>
#include <vector>
#include <string>
#include <utility>
#include "scalarset/scalarset.hpp"

using namespace scalarset;

void demo_basic_set_operations() {
    std::cout << "=== Basic Set Operations ===\n";

    Set set;

    std::cout << "Initial state - empty: " << set.is_empty()
              << ", size: " << set.size() << "\n";

    // Add elements
    std::cout << "Adding elements...\n";
    set.add(5);
    set.add("five");
    set.add(8);
    set.add("eight");

    std::cout << "After additions - size: " << set.size() << "\n";

    // Duplicate additions are ignored
    set.add(5);
    std::cout << "After adding 5 again - size: " << set.size() << "\n";

    // Integers and numeric-looking strings stay distinct
    set.add("5");
    std::cout << "After adding \"5\" - size: " << set.size() << "\n";

    std::cout << "\nTesting membership:\n";
    std::vector<Scalar> probes = {5, "5", "five", 9, "nine"};
    for (const auto& probe : probes) {
        std::cout << "  " << probe << " -> " << (set.contains(probe) ? "in set" : "not in set") << "\n";
    }

    std::cout << "Contents: " << set << "\n\n";
}

void demo_set_algebra() {
    std::cout << "=== Set Algebra ===\n";

    Set set1;
    Set set2;

    for (int i = 1; i <= 10; ++i) {
        set1.add(i);
    }
    for (int i = 6; i <= 15; ++i) {
        set2.add(i);
    }

    std::cout << "Set1: " << set1 << "\n";
    std::cout << "Set2: " << set2 << "\n";

    Set all = Set::union_all(set1, set2);
    std::cout << "Union: " << all << "\n";

    Set both = Set::intersect(set1, set2);
    std::cout << "Intersection: " << both << "\n";

    Set only_first(set1);
    only_first.remove_all(set2);
    std::cout << "Difference: " << only_first << "\n";

    Set subset{2, 4, 6};
    std::cout << "Set1 contains all of " << subset << ": " << set1.contains_all(subset) << "\n";
    std::cout << "Set2 contains all of " << subset << ": " << set2.contains_all(subset) << "\n";

    // Restoring the removed elements gives back the original set
    only_first.add_all(both);
    std::cout << "Difference plus intersection equals set1: " << (only_first == set1) << "\n\n";
}

void demo_unique_elements_filter() {
    std::cout << "=== Unique Elements Filter ===\n";

    std::vector<Scalar> data_stream = {
        "b", 3, "a", 3, "b", 1, "c", 1, 7, "a"
    };

    std::cout << "Input: ";
    for (const auto& value : data_stream) {
        std::cout << value << " ";
    }
    std::cout << "\n";

    // Duplicates collapse, first occurrence decides the order
    Set unique(data_stream);
    std::cout << "Unique values in arrival order: ";
    for (const auto& value : unique.to_array()) {
        std::cout << value << " ";
    }
    std::cout << "\n";
    std::cout << "Total unique values: " << unique.size() << "\n\n";
}

void demo_indexed_access() {
    std::cout << "=== Indexed Access ===\n";

    Set flags;
    flags["verbose"] = true;
    flags["color"] = true;
    flags[404] = true;
    flags["color"] = false;

    std::cout << "Flags: " << flags << "\n";
    std::cout << "  verbose -> " << static_cast<bool>(flags["verbose"]) << "\n";
    std::cout << "  color -> " << static_cast<bool>(flags["color"]) << "\n";

    try {
        flags["verbose"].unset();
    } catch (const NotSupported& e) {
        std::cout << "  unset(): " << e.what() << "\n";
    }
    std::cout << "\n";
}

void demo_iteration() {
    std::cout << "=== Set Iteration ===\n";

    Set set{"foo", "bar", "baz", 9000};

    std::cout << "Range-based for:\n";
    for (auto it = set.begin(); it != set.end(); ++it) {
        std::cout << "  [" << it.position() << "] " << *it << "\n";
    }

    std::cout << "Restartable cursor, two passes:\n";
    auto cursor = set.key_iterator();
    for (int pass = 0; pass < 2; ++pass) {
        std::cout << "  pass " << pass << ":";
        for (; cursor.valid(); cursor.advance()) {
            std::cout << " " << cursor.current();
        }
        std::cout << "\n";
        cursor.restart();
    }
    std::cout << "\n";
}

void demo_key_mapping() {
    std::cout << "=== Key Mapping Round Trip ===\n";

    Set set{"apple", "banana", 42};

    // Hand the mapping to another owner without touching the elements
    Set::mapping_type keys = set.take_array_keys();
    std::cout << "Mapping size: " << keys.size() << ", source now empty: " << set.is_empty() << "\n";

    Set restored = Set::from_array_keys(std::move(keys));
    std::cout << "Restored: " << restored << "\n\n";
}

void demo_invalid_input() {
    std::cout << "=== Invalid Input ===\n";

    try {
        Set set(3.14);
        std::cout << "Unexpected: " << set << "\n";
    } catch (const InvalidInput& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }

    Set set{1, 2};
    std::cout << "equals(3.14): " << set.equals(3.14) << "\n\n";
}

int main() {
    std::cout << "Scalar Set Example\n";
    std::cout << "==================\n\n";

    demo_basic_set_operations();
    demo_set_algebra();
    demo_unique_elements_filter();
    demo_indexed_access();
    demo_iteration();
    demo_key_mapping();
    demo_invalid_input();

    std::cout << "All Set demos completed!\n";
    std::cout << "\nNote: This Set keeps insertion order and stores its members\n";
    std::cout << "as the keys of an ordered hash map, so set algebra runs in linear time.\n";

    return 0;
}
