#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace scalarset {

/**
 * @brief A hash map that remembers the order in which keys were first inserted.
 *
 * The table uses separate chaining for collision resolution. Every node is
 * additionally threaded onto a doubly linked list in insertion order, so
 * iteration visits keys in the order they were added while lookups, inserts
 * and erases stay O(1) on average.
 *
 * This is the key-presence mapping behind BasicSet, but it is a general
 * purpose container and can be used on its own.
 *
 * @tparam Key The type of keys. Must be hashable and comparable.
 * @tparam Value The type of values stored. Must be copy constructible.
 * @tparam Hash Hash function for keys. Defaults to std::hash<Key>.
 * @tparam KeyEqual Equality comparison for keys. Defaults to std::equal_to<Key>.
 *
 * Key Features:
 * - Insertion order: iteration follows first insertion, re-assigning a value keeps the position
 * - Dynamic sizing: bucket array doubles once the load factor passes 75%
 * - Value semantics: deep copy preserves order, move leaves the source empty but usable
 * - Bulk filtering: erase_if removes every entry matching a predicate in one pass
 *
 * Performance Characteristics:
 * - Insert: O(1) average, O(n) worst case (hash collisions)
 * - Find: O(1) average, O(n) worst case (hash collisions)
 * - Erase: O(1) average, O(n) worst case (hash collisions)
 * - Iteration: O(n), independent of bucket count
 * - Memory: O(n + m) where n is key-value pairs, m is bucket count
 *
 * Usage Example:
 * @code
 * scalarset::OrderedHashMap<std::string, int> map;
 *
 * map.insert("zebra", 1);
 * map.insert("apple", 2);
 * map.insert_or_assign("zebra", 3);   // keeps "zebra" first
 *
 * for (auto it = map.begin(); it != map.end(); ++it) {
 *     auto [key, value] = *it;
 *     std::cout << key << " -> " << value << std::endl;   // zebra -> 3, apple -> 2
 * }
 * @endcode
 *
 * @note Not thread-safe. Guard a shared instance with an external mutex.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
class OrderedHashMap {
private:
    /**
     * @brief Internal node structure for key-value pairs.
     *
     * Each node sits in exactly one bucket chain and in the insertion-order list.
     */
    struct Node {
        Key key;                        ///< The stored key
        Value value;                    ///< The stored value
        Node* bucket_next;              ///< Next node in the same bucket chain
        Node* prev;                     ///< Previous node in insertion order
        Node* next;                     ///< Next node in insertion order

        Node(const Key& k, const Value& v)
            : key(k), value(v), bucket_next(nullptr), prev(nullptr), next(nullptr) {}

        Node(Key&& k, Value&& v)
            : key(std::move(k)), value(std::move(v)), bucket_next(nullptr), prev(nullptr), next(nullptr) {}
    };

    static constexpr size_t INITIAL_BUCKET_COUNT = 16;
    static constexpr size_t MAX_LOAD_FACTOR_PERCENT = 75;

    std::vector<Node*> buckets_;            ///< Heads of the bucket chains
    Node* head_;                            ///< Oldest entry
    Node* tail_;                            ///< Newest entry
    size_t size_;                           ///< Number of key-value pairs
    Hash hasher_;                           ///< Hash function instance
    KeyEqual key_equal_;                    ///< Key equality comparison function instance

    size_t hash_key(const Key& key) const;

    /**
     * @brief Get bucket index for a key.
     * @param key The key to get bucket index for
     * @return Bucket index (0 to bucket_count-1), buckets_ must not be empty
     */
    size_t get_bucket_index(const Key& key) const;

    /**
     * @brief Find node with matching key.
     * @param key The key to search for
     * @return Pointer to matching node or nullptr if not found
     */
    Node* find_node(const Key& key) const;

    bool should_resize() const;

    /**
     * @brief Grow the bucket array when the next insertion would exceed the load factor.
     *
     * Also allocates the initial buckets of a moved-from map.
     */
    void resize_if_needed();

    /**
     * @brief Redistribute every node over new_bucket_count buckets.
     *
     * Insertion order is untouched, only bucket chains are rebuilt.
     */
    void rehash(size_t new_bucket_count);

    /**
     * @brief Link a freshly allocated node into its bucket and at the end of the order list.
     */
    void link_node(Node* node);

    /**
     * @brief Remove a node from its bucket chain and the order list, then free it.
     */
    void unlink_node(Node* node);

    void destroy_nodes();

public:
    /**
     * @brief Default constructor. Creates an empty map with the default bucket count.
     *
     * @complexity O(bucket_count)
     */
    OrderedHashMap();

    /**
     * @brief Constructor with custom initial bucket count.
     *
     * @param initial_bucket_count Number of buckets to start with (0 is treated as 1)
     * @complexity O(initial_bucket_count)
     */
    explicit OrderedHashMap(size_t initial_bucket_count);

    ~OrderedHashMap();

    /**
     * @brief Deep copy. The copy has the same keys, values and order.
     *
     * @complexity O(n + m)
     * @exception_safety Strong guarantee
     */
    OrderedHashMap(const OrderedHashMap& other);
    OrderedHashMap& operator=(const OrderedHashMap& other);

    /**
     * @brief Move. Steals the nodes in O(1); the source is left empty and usable.
     */
    OrderedHashMap(OrderedHashMap&& other) noexcept;
    OrderedHashMap& operator=(OrderedHashMap&& other) noexcept;

    void swap(OrderedHashMap& other) noexcept;

    /**
     * @brief Insert a key-value pair by copying.
     *
     * @param key The key to copy and insert
     * @param value The value to copy and associate with the key
     * @return true if the pair was inserted, false if the key already exists
     * @complexity O(1) average
     *
     * @note Does not update existing values - use insert_or_assign for that.
     */
    bool insert(const Key& key, const Value& value);

    /**
     * @brief Insert a key-value pair by moving.
     *
     * @param key The key to move and insert
     * @param value The value to move and associate with the key
     * @return true if the pair was inserted, false if the key already exists
     * @complexity O(1) average
     */
    bool insert(Key&& key, Value&& value);

    /**
     * @brief Insert a key-value pair, or overwrite the value of an existing key.
     *
     * An existing key keeps its position in the iteration order.
     *
     * @param key The key to insert or update
     * @param value The value to store
     * @return true if a new key was inserted, false if an existing value was overwritten
     * @complexity O(1) average
     */
    bool insert_or_assign(const Key& key, const Value& value);

    /**
     * @brief Construct a value in-place for the given key.
     *
     * @tparam Args Types of arguments for Value's constructor
     * @param key The key to associate with the constructed value
     * @param args Arguments to forward to Value's constructor
     * @return true if the pair was inserted, false if the key already exists
     */
    template<typename... Args>
    bool emplace(const Key& key, Args&&... args);

    /**
     * @brief Find the value associated with a key.
     *
     * @param key The key to search for
     * @param result Reference to store the found value
     * @return true if key was found and value copied to result, false otherwise
     * @complexity O(1) average
     */
    bool find(const Key& key, Value& result) const;

    /**
     * @brief Find the value associated with a key.
     *
     * @param key The key to search for
     * @return Pointer to the stored value, or nullptr if the key is absent.
     *         Invalidated by erasing that key or destroying the map.
     */
    const Value* find(const Key& key) const;

    bool contains(const Key& key) const;

    /**
     * @brief Remove a key-value pair.
     *
     * @param key The key to remove
     * @return true if the key was found and removed, false otherwise
     * @complexity O(1) average
     */
    bool erase(const Key& key);

    /**
     * @brief Remove every key-value pair for which the predicate holds.
     *
     * Entries are visited in insertion order. The predicate may query this
     * map (for example through a reference obtained before the call) but
     * must not modify it.
     *
     * @tparam Predicate Callable as bool(const Key&, const Value&)
     * @param pred Predicate selecting the entries to remove
     * @return Number of removed entries
     * @complexity O(n)
     */
    template<typename Predicate>
    size_t erase_if(Predicate pred);

    /**
     * @brief Remove all key-value pairs. The bucket count is kept.
     *
     * @complexity O(n + m)
     */
    void clear();

    bool empty() const;

    size_t size() const;

    size_t bucket_count() const;

    /**
     * @brief Get the current load factor of the hash table.
     *
     * @return Ratio of key-value pairs to buckets, 0.0 for a moved-from map
     */
    double load_factor() const;

    /**
     * @brief Keys in insertion order.
     *
     * @complexity O(n)
     */
    std::vector<Key> keys() const;

    /**
     * @brief Forward iterator over the key-value pairs in insertion order.
     *
     * The iterator only refers to nodes, so it stays valid across a move of
     * the map. Erasing the pointed-to key invalidates it.
     */
    class iterator {
    private:
        const Node* current_;           ///< Current node, nullptr at the end

    public:
        explicit iterator(const Node* node) : current_(node) {}

        /**
         * @brief Dereference operator to access current key-value pair.
         * @return Pair containing references to the current key and value
         */
        std::pair<const Key&, const Value&> operator*() const;

        const Key& key() const;

        const Value& value() const;

        iterator& operator++();

        bool operator==(const iterator& other) const;

        bool operator!=(const iterator& other) const;
    };

    using const_iterator = iterator;

    /**
     * @brief Iterator to the oldest key-value pair, or end() if the map is empty.
     *
     * @complexity O(1)
     */
    iterator begin() const;

    iterator end() const;
};

template<typename Key, typename Value, typename Hash, typename KeyEqual>
OrderedHashMap<Key, Value, Hash, KeyEqual>::OrderedHashMap() : OrderedHashMap(INITIAL_BUCKET_COUNT) {}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
OrderedHashMap<Key, Value, Hash, KeyEqual>::OrderedHashMap(size_t initial_bucket_count)
    : buckets_(initial_bucket_count == 0 ? 1 : initial_bucket_count, nullptr),
      head_(nullptr), tail_(nullptr), size_(0) {}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
OrderedHashMap<Key, Value, Hash, KeyEqual>::~OrderedHashMap() {
    destroy_nodes();
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
OrderedHashMap<Key, Value, Hash, KeyEqual>::OrderedHashMap(const OrderedHashMap& other)
    : buckets_(other.buckets_.empty() ? INITIAL_BUCKET_COUNT : other.buckets_.size(), nullptr),
      head_(nullptr), tail_(nullptr), size_(0),
      hasher_(other.hasher_), key_equal_(other.key_equal_) {
    try {
        for (const Node* current = other.head_; current; current = current->next) {
            link_node(new Node(current->key, current->value));
        }
    } catch (...) {
        destroy_nodes();
        throw;
    }
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
OrderedHashMap<Key, Value, Hash, KeyEqual>&
OrderedHashMap<Key, Value, Hash, KeyEqual>::operator=(const OrderedHashMap& other) {
    if (this != &other) {
        OrderedHashMap copy(other);
        swap(copy);
    }
    return *this;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
OrderedHashMap<Key, Value, Hash, KeyEqual>::OrderedHashMap(OrderedHashMap&& other) noexcept
    : buckets_(std::move(other.buckets_)),
      head_(std::exchange(other.head_, nullptr)),
      tail_(std::exchange(other.tail_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      hasher_(std::move(other.hasher_)),
      key_equal_(std::move(other.key_equal_)) {
    other.buckets_.clear();
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
OrderedHashMap<Key, Value, Hash, KeyEqual>&
OrderedHashMap<Key, Value, Hash, KeyEqual>::operator=(OrderedHashMap&& other) noexcept {
    if (this != &other) {
        destroy_nodes();
        buckets_ = std::move(other.buckets_);
        other.buckets_.clear();
        head_ = std::exchange(other.head_, nullptr);
        tail_ = std::exchange(other.tail_, nullptr);
        size_ = std::exchange(other.size_, 0);
        hasher_ = std::move(other.hasher_);
        key_equal_ = std::move(other.key_equal_);
    }
    return *this;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
void OrderedHashMap<Key, Value, Hash, KeyEqual>::swap(OrderedHashMap& other) noexcept {
    using std::swap;
    swap(buckets_, other.buckets_);
    swap(head_, other.head_);
    swap(tail_, other.tail_);
    swap(size_, other.size_);
    swap(hasher_, other.hasher_);
    swap(key_equal_, other.key_equal_);
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
size_t OrderedHashMap<Key, Value, Hash, KeyEqual>::hash_key(const Key& key) const {
    return hasher_(key);
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
size_t OrderedHashMap<Key, Value, Hash, KeyEqual>::get_bucket_index(const Key& key) const {
    return hash_key(key) % buckets_.size();
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
typename OrderedHashMap<Key, Value, Hash, KeyEqual>::Node*
OrderedHashMap<Key, Value, Hash, KeyEqual>::find_node(const Key& key) const {
    if (buckets_.empty()) {
        return nullptr;
    }

    Node* current = buckets_[get_bucket_index(key)];
    while (current) {
        if (key_equal_(current->key, key)) {
            return current;
        }
        current = current->bucket_next;
    }

    return nullptr;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::should_resize() const {
    return (size_ + 1) * 100 > buckets_.size() * MAX_LOAD_FACTOR_PERCENT;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
void OrderedHashMap<Key, Value, Hash, KeyEqual>::resize_if_needed() {
    if (buckets_.empty()) {
        buckets_.assign(INITIAL_BUCKET_COUNT, nullptr);
        return;
    }
    if (should_resize()) {
        rehash(buckets_.size() * 2);
    }
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
void OrderedHashMap<Key, Value, Hash, KeyEqual>::rehash(size_t new_bucket_count) {
    std::vector<Node*> buckets(new_bucket_count, nullptr);
    buckets_.swap(buckets);

    for (Node* current = head_; current; current = current->next) {
        size_t index = get_bucket_index(current->key);
        current->bucket_next = buckets_[index];
        buckets_[index] = current;
    }
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
void OrderedHashMap<Key, Value, Hash, KeyEqual>::link_node(Node* node) {
    size_t index = get_bucket_index(node->key);
    node->bucket_next = buckets_[index];
    buckets_[index] = node;

    node->prev = tail_;
    node->next = nullptr;
    if (tail_) {
        tail_->next = node;
    } else {
        head_ = node;
    }
    tail_ = node;

    ++size_;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
void OrderedHashMap<Key, Value, Hash, KeyEqual>::unlink_node(Node* node) {
    Node** link = &buckets_[get_bucket_index(node->key)];
    while (*link != node) {
        link = &(*link)->bucket_next;
    }
    *link = node->bucket_next;

    if (node->prev) {
        node->prev->next = node->next;
    } else {
        head_ = node->next;
    }
    if (node->next) {
        node->next->prev = node->prev;
    } else {
        tail_ = node->prev;
    }

    delete node;
    --size_;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
void OrderedHashMap<Key, Value, Hash, KeyEqual>::destroy_nodes() {
    Node* current = head_;
    while (current) {
        Node* next = current->next;
        delete current;
        current = next;
    }
    head_ = nullptr;
    tail_ = nullptr;
    size_ = 0;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::insert(const Key& key, const Value& value) {
    if (find_node(key) != nullptr) {
        return false;
    }

    resize_if_needed();
    link_node(new Node(key, value));
    return true;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::insert(Key&& key, Value&& value) {
    if (find_node(key) != nullptr) {
        return false;
    }

    resize_if_needed();
    link_node(new Node(std::move(key), std::move(value)));
    return true;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::insert_or_assign(const Key& key, const Value& value) {
    Node* node = find_node(key);
    if (node) {
        node->value = value;
        return false;
    }

    resize_if_needed();
    link_node(new Node(key, value));
    return true;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
template<typename... Args>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::emplace(const Key& key, Args&&... args) {
    if (find_node(key) != nullptr) {
        return false;
    }

    resize_if_needed();
    link_node(new Node(key, Value(std::forward<Args>(args)...)));
    return true;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::find(const Key& key, Value& result) const {
    const Node* node = find_node(key);
    if (node) {
        result = node->value;
        return true;
    }
    return false;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
const Value* OrderedHashMap<Key, Value, Hash, KeyEqual>::find(const Key& key) const {
    const Node* node = find_node(key);
    return node ? &node->value : nullptr;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::contains(const Key& key) const {
    return find_node(key) != nullptr;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::erase(const Key& key) {
    Node* node = find_node(key);
    if (node) {
        unlink_node(node);
        return true;
    }
    return false;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
template<typename Predicate>
size_t OrderedHashMap<Key, Value, Hash, KeyEqual>::erase_if(Predicate pred) {
    size_t removed = 0;
    Node* current = head_;
    while (current) {
        // Save the successor, unlink_node frees current
        Node* next = current->next;
        if (pred(static_cast<const Key&>(current->key), static_cast<const Value&>(current->value))) {
            unlink_node(current);
            ++removed;
        }
        current = next;
    }
    return removed;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
void OrderedHashMap<Key, Value, Hash, KeyEqual>::clear() {
    destroy_nodes();
    std::fill(buckets_.begin(), buckets_.end(), nullptr);
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::empty() const {
    return size_ == 0;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
size_t OrderedHashMap<Key, Value, Hash, KeyEqual>::size() const {
    return size_;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
size_t OrderedHashMap<Key, Value, Hash, KeyEqual>::bucket_count() const {
    return buckets_.size();
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
double OrderedHashMap<Key, Value, Hash, KeyEqual>::load_factor() const {
    size_t buckets = bucket_count();
    return buckets > 0 ? static_cast<double>(size_) / buckets : 0.0;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
std::vector<Key> OrderedHashMap<Key, Value, Hash, KeyEqual>::keys() const {
    std::vector<Key> result;
    result.reserve(size_);
    for (const Node* current = head_; current; current = current->next) {
        result.push_back(current->key);
    }
    return result;
}

// Iterator implementation

template<typename Key, typename Value, typename Hash, typename KeyEqual>
std::pair<const Key&, const Value&> OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator::operator*() const {
    return {current_->key, current_->value};
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
const Key& OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator::key() const {
    return current_->key;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
const Value& OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator::value() const {
    return current_->value;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
typename OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator&
OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator::operator++() {
    if (current_) {
        current_ = current_->next;
    }
    return *this;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator::operator==(const iterator& other) const {
    return current_ == other.current_;
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
bool OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator::operator!=(const iterator& other) const {
    return !(*this == other);
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
typename OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator OrderedHashMap<Key, Value, Hash, KeyEqual>::begin() const {
    return iterator(head_);
}

template<typename Key, typename Value, typename Hash, typename KeyEqual>
typename OrderedHashMap<Key, Value, Hash, KeyEqual>::iterator OrderedHashMap<Key, Value, Hash, KeyEqual>::end() const {
    return iterator(nullptr);
}

} // namespace scalarset
