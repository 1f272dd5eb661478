#include <iostream>
#include <vector>
#include <cassert>
#include <string>
#include <utility>
#include "scalarset/ordered_hashmap.hpp"

using namespace scalarset;

void test_basic_hashmap_operations() {
    std::cout << "Testing basic hashmap operations...\n";

    OrderedHashMap<int, std::string> map;

    assert(map.empty());
    assert(map.size() == 0);
    assert(map.bucket_count() > 0);
    assert(map.load_factor() == 0.0);

    // Test insert
    assert(map.insert(1, "one"));
    assert(map.insert(2, "two"));
    assert(map.insert(3, "three"));

    assert(!map.empty());
    assert(map.size() == 3);
    assert(map.load_factor() > 0.0);

    // Test duplicate insert
    assert(!map.insert(2, "TWO"));
    assert(map.size() == 3);

    // Test find
    std::string value;
    assert(map.find(1, value));
    assert(value == "one");

    assert(map.find(2, value));
    assert(value == "two");

    const std::string* found = map.find(3);
    assert(found != nullptr);
    assert(*found == "three");

    // Test find non-existent
    assert(!map.find(4, value));
    assert(map.find(0) == nullptr);
    assert(!map.contains(4));

    std::cout << "Basic hashmap operations test passed!\n";
}

void test_insertion_order() {
    std::cout << "Testing insertion order...\n";

    OrderedHashMap<std::string, int> map;

    std::vector<std::string> words = {"zebra", "apple", "mango", "banana", "cherry"};
    for (size_t i = 0; i < words.size(); ++i) {
        assert(map.insert(words[i], static_cast<int>(i)));
    }

    assert(map.keys() == words);

    std::vector<std::string> iterated;
    for (auto it = map.begin(); it != map.end(); ++it) {
        auto [key, value] = *it;
        assert(value == static_cast<int>(iterated.size()));
        iterated.push_back(key);
    }
    assert(iterated == words);

    std::cout << "Insertion order test passed!\n";
}

void test_insert_or_assign() {
    std::cout << "Testing insert_or_assign...\n";

    OrderedHashMap<std::string, int> map;

    assert(map.insert_or_assign("first", 1));
    assert(map.insert_or_assign("second", 2));

    // Overwrites the value, keeps the position
    assert(!map.insert_or_assign("first", 100));
    assert(map.size() == 2);

    int value = 0;
    assert(map.find("first", value));
    assert(value == 100);

    std::vector<std::string> expected = {"first", "second"};
    assert(map.keys() == expected);

    std::cout << "insert_or_assign test passed!\n";
}

void test_erase_operations() {
    std::cout << "Testing erase operations...\n";

    OrderedHashMap<int, int> map;
    for (int i = 1; i <= 10; ++i) {
        map.insert(i, i * i);
    }

    assert(map.size() == 10);

    // Middle, head and tail
    assert(map.erase(5));
    assert(map.erase(1));
    assert(map.erase(10));
    assert(map.size() == 7);

    // Erase non-existent keys
    assert(!map.erase(5));
    assert(!map.erase(15));
    assert(map.size() == 7);

    std::vector<int> expected = {2, 3, 4, 6, 7, 8, 9};
    assert(map.keys() == expected);

    // Re-inserting an erased key appends it
    assert(map.insert(1, 1));
    expected.push_back(1);
    assert(map.keys() == expected);

    // Erase everything one by one
    for (int key : expected) {
        assert(map.erase(key));
    }
    assert(map.empty());
    assert(map.begin() == map.end());

    std::cout << "Erase operations test passed!\n";
}

void test_erase_if() {
    std::cout << "Testing erase_if...\n";

    OrderedHashMap<int, std::string> map;
    for (int i = 1; i <= 20; ++i) {
        map.insert(i, std::to_string(i));
    }

    size_t removed = map.erase_if([](const int& key, const std::string&) { return key % 3 == 0; });
    assert(removed == 6);  // 3, 6, 9, 12, 15, 18
    assert(map.size() == 14);

    for (auto it = map.begin(); it != map.end(); ++it) {
        assert(it.key() % 3 != 0);
        assert(it.value() == std::to_string(it.key()));
    }

    // Predicate may read the map being filtered
    removed = map.erase_if([&map](const int& key, const std::string&) { return map.contains(key + 1); });
    std::vector<int> expected = {2, 5, 8, 11, 14, 17, 20};
    assert(map.keys() == expected);
    assert(removed == 7);

    // Remove all
    removed = map.erase_if([](const int&, const std::string&) { return true; });
    assert(removed == 7);
    assert(map.empty());

    std::cout << "erase_if test passed!\n";
}

void test_resize() {
    std::cout << "Testing bucket growth...\n";

    OrderedHashMap<int, int> map(4);
    assert(map.bucket_count() == 4);

    constexpr int count = 1000;
    for (int i = 0; i < count; ++i) {
        assert(map.insert(i, -i));
    }

    assert(map.size() == count);
    assert(map.bucket_count() > 4);
    assert(map.load_factor() <= 0.75);

    // Growth rebuilds the chains but not the order
    int expected = 0;
    for (auto it = map.begin(); it != map.end(); ++it) {
        assert(it.key() == expected);
        assert(it.value() == -expected);
        ++expected;
    }

    for (int i = 0; i < count; ++i) {
        assert(map.contains(i));
    }

    // Zero buckets is treated as one
    OrderedHashMap<int, int> tiny(0);
    assert(tiny.bucket_count() == 1);
    assert(tiny.insert(7, 7));
    assert(tiny.contains(7));

    std::cout << "Bucket growth test passed!\n";
}

void test_clear() {
    std::cout << "Testing clear...\n";

    OrderedHashMap<std::string, int> map;
    map.insert("a", 1);
    map.insert("b", 2);

    size_t buckets = map.bucket_count();
    map.clear();

    assert(map.empty());
    assert(map.size() == 0);
    assert(!map.contains("a"));
    assert(map.bucket_count() == buckets);
    assert(map.begin() == map.end());

    assert(map.insert("c", 3));
    assert(map.keys() == std::vector<std::string>{"c"});

    std::cout << "Clear test passed!\n";
}

void test_copy_semantics() {
    std::cout << "Testing copy semantics...\n";

    OrderedHashMap<std::string, int> original;
    original.insert("x", 1);
    original.insert("y", 2);
    original.insert("z", 3);

    OrderedHashMap<std::string, int> copy(original);
    assert(copy.keys() == original.keys());

    // Copies are independent
    copy.erase("y");
    copy.insert("w", 4);
    assert(original.size() == 3);
    assert(original.contains("y"));
    assert(!original.contains("w"));

    OrderedHashMap<std::string, int> assigned;
    assigned.insert("old", 0);
    assigned = original;
    assert(assigned.keys() == original.keys());
    assert(!assigned.contains("old"));

    // Self assignment is harmless
    assigned = static_cast<const OrderedHashMap<std::string, int>&>(assigned);
    assert(assigned.size() == 3);

    std::cout << "Copy semantics test passed!\n";
}

void test_move_semantics() {
    std::cout << "Testing move semantics...\n";

    OrderedHashMap<std::string, int> source;
    source.insert("alpha", 1);
    source.insert("beta", 2);

    auto it = source.begin();

    OrderedHashMap<std::string, int> target(std::move(source));
    assert(target.size() == 2);
    assert(target.contains("alpha"));

    // Iterators follow the nodes
    assert(it.key() == "alpha");
    ++it;
    assert(it.key() == "beta");
    ++it;
    assert(it == target.end());

    // Moved-from map is empty and usable
    assert(source.empty());
    assert(!source.contains("alpha"));
    assert(!source.erase("alpha"));
    assert(source.load_factor() == 0.0);
    assert(source.insert("gamma", 3));
    assert(source.contains("gamma"));
    assert(source.bucket_count() > 0);

    OrderedHashMap<std::string, int> assigned;
    assigned.insert("stale", 0);
    assigned = std::move(target);
    assert(assigned.keys() == (std::vector<std::string>{"alpha", "beta"}));

    std::cout << "Move semantics test passed!\n";
}

void test_emplace_operations() {
    std::cout << "Testing emplace operations...\n";

    OrderedHashMap<int, std::pair<int, std::string>> map;

    assert(map.emplace(1, 10, "ten"));
    assert(map.emplace(2, 20, "twenty"));
    assert(!map.emplace(1, 99, "ignored"));

    std::pair<int, std::string> value;
    assert(map.find(1, value));
    assert(value.first == 10);
    assert(value.second == "ten");

    std::cout << "Emplace operations test passed!\n";
}

int main() {
    std::cout << "OrderedHashMap Tests\n";
    std::cout << "====================\n\n";

    test_basic_hashmap_operations();
    test_insertion_order();
    test_insert_or_assign();
    test_erase_operations();
    test_erase_if();
    test_resize();
    test_clear();
    test_copy_semantics();
    test_move_semantics();
    test_emplace_operations();

    std::cout << "\nAll hashmap tests passed!\n";

    return 0;
}
