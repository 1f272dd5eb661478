#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "scalarset/errors.hpp"
#include "scalarset/key_iterator.hpp"
#include "scalarset/ordered_hashmap.hpp"
#include "scalarset/scalar.hpp"

namespace scalarset {

namespace detail {

template<typename T, typename = void>
struct is_iterable : std::false_type {};

template<typename T>
struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                  decltype(std::end(std::declval<const T&>()))>>
    : std::true_type {};

/// A finite range whose values convert to Element.
template<typename Range, typename Element, bool = is_iterable<Range>::value>
struct is_element_range : std::false_type {};

template<typename Range, typename Element>
struct is_element_range<Range, Element, true>
    : std::is_constructible<Element, decltype(*std::begin(std::declval<const Range&>()))> {};

} // namespace detail

/**
 * @brief An insertion-ordered set of scalar values with set algebra and O(1)
 *        conversion to and from its key-presence mapping.
 *
 * The set is a thin layer over an OrderedHashMap from element to a presence
 * marker. A value is a member iff it is a key of that mapping; the marker is
 * never read. Iteration follows the order in which elements were first added.
 *
 * Bulk operations (add_all, remove_all, retain_all, contains_all, equals)
 * accept any source that can be normalized into a key-presence mapping:
 * another set, a mapping, or a finite range of values convertible to Element.
 * Anything else raises InvalidInput naming the rejected type, except in
 * equals(), which answers false instead.
 *
 * @tparam Element The element type. Defaults to Scalar (integer or string)
 *                 through scalarset::Set. Must be hashable and comparable.
 * @tparam Hash Hash function for elements. Defaults to std::hash<Element>.
 * @tparam KeyEqual Equality comparison for elements. Defaults to std::equal_to<Element>.
 *
 * Indexed access goes through a Subscript proxy:
 * - `bool b = set[e]`      is the same as   `set.contains(e)`
 * - `set[e] = true`        is the same as   `set.add(e)`
 * - `set[e] = false`       is the same as   `set.remove(e)`
 * - `set[e].exists()`      throws NotSupported
 * - `set[e].unset()`       throws NotSupported
 *
 * Performance Characteristics:
 * - add, remove, contains, size, to_array_keys: O(1) average
 * - add_all, remove_all, retain_all, contains_all, equals, to_array: O(n)
 * - from_array_keys on an rvalue mapping: O(1)
 *
 * Usage Example:
 * @code
 * scalarset::Set set{"a", "b"};
 * set.add(3);
 * set["c"] = true;
 * set["a"] = false;
 *
 * set.retain_all(std::vector<scalarset::Scalar>{"b", "c", "z"});
 * std::cout << set << std::endl;   // {b, c}
 *
 * auto copy = scalarset::Set::from_array_keys(set.to_array_keys());
 * assert(copy == set);
 * @endcode
 *
 * @note Not thread-safe. Each set exclusively owns its mapping.
 */
template<typename Element, typename Hash = std::hash<Element>, typename KeyEqual = std::equal_to<Element>>
class BasicSet {
public:
    using value_type = Element;
    using size_type = std::size_t;
    using mapping_type = OrderedHashMap<Element, bool, Hash, KeyEqual>;
    using key_iterator_type = OrderedKeyIterator<mapping_type>;

    /**
     * @brief Forward iterator over the elements in insertion order.
     *
     * Besides the element, the iterator exposes the synthetic 0-based
     * position of that element in the iteration.
     */
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Element;
        using difference_type = std::ptrdiff_t;
        using pointer = const Element*;
        using reference = const Element&;

        const_iterator(typename mapping_type::const_iterator it, size_type position)
            : it_(it), position_(position) {}

        reference operator*() const { return it_.key(); }
        pointer operator->() const { return &it_.key(); }

        size_type position() const { return position_; }

        const_iterator& operator++() {
            ++it_;
            ++position_;
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++*this;
            return previous;
        }

        bool operator==(const const_iterator& other) const { return it_ == other.it_; }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        typename mapping_type::const_iterator it_;
        size_type position_;
    };

    using iterator = const_iterator;

    /**
     * @brief Proxy returned by the non-const operator[].
     *
     * Reading converts to bool (membership), assigning a bool adds or
     * removes. exists() and unset() always throw NotSupported and leave the
     * set unchanged.
     */
    class Subscript {
    public:
        Subscript(BasicSet& set, const Element& key) : set_(set), key_(key) {}

        operator bool() const { return set_.contains(key_); }

        Subscript& operator=(bool present) {
            if (present) {
                set_.add(key_);
            } else {
                set_.remove(key_);
            }
            return *this;
        }

        Subscript& operator=(const Subscript& other) {
            return *this = static_cast<bool>(other);
        }

        /// @throws NotSupported always
        bool exists() const {
            throw NotSupported("BasicSet::Subscript::exists");
        }

        /// @throws NotSupported always
        void unset() {
            throw NotSupported("BasicSet::Subscript::unset");
        }

    private:
        BasicSet& set_;
        Element key_;
    };

    /**
     * @brief Default constructor. Creates an empty set.
     */
    BasicSet() = default;

    /**
     * @brief Create a set from a list of elements.
     *
     * Duplicates collapse to one entry, ordered by first occurrence.
     *
     * @complexity O(n)
     */
    BasicSet(std::initializer_list<Element> elements);

    /**
     * @brief Create a set from an iterator range, which is read once.
     *
     * @throws InvalidInput if Element rejects one of the values
     * @complexity O(n)
     */
    template<typename InputIt, typename = typename std::iterator_traits<InputIt>::iterator_category>
    BasicSet(InputIt first, InputIt last);

    /**
     * @brief Create a set from any source that normalizes into a key-presence mapping.
     *
     * Accepts a mapping_type (its keys are copied) or a finite range of
     * values convertible to Element.
     *
     * @param source The source to read
     * @throws InvalidInput if source is neither a mapping nor an element range,
     *                      or if Element rejects one of its values
     * @complexity O(n)
     */
    template<typename Source>
    explicit BasicSet(const Source& source);

    BasicSet(const BasicSet&) = default;
    BasicSet& operator=(const BasicSet&) = default;
    BasicSet(BasicSet&&) noexcept = default;
    BasicSet& operator=(BasicSet&&) noexcept = default;

    /**
     * @brief Create a set that adopts a pre-built key-presence mapping.
     *
     * `Set::from_array_keys(std::move(keys)).to_array_keys()` is the same
     * mapping that went in, without per-element work.
     *
     * @param keys The mapping to adopt; left empty
     * @complexity O(1)
     */
    static BasicSet from_array_keys(mapping_type&& keys);

    /**
     * @brief Create a set from a copy of a key-presence mapping.
     *
     * @complexity O(n)
     */
    static BasicSet from_array_keys(const mapping_type& keys);

    /**
     * @brief Union of any number of sources.
     *
     * @throws InvalidInput if a source cannot be normalized
     * @complexity O(total size of the sources)
     */
    template<typename... Sources>
    static BasicSet union_all(const Sources&... sources);

    /**
     * @brief Union of a runtime list of sources, e.g. a std::vector<Set>.
     *
     * @throws InvalidInput if sources is not iterable or one of its items
     *                      cannot be normalized
     */
    template<typename Range>
    static BasicSet union_all_of(const Range& sources);

    /**
     * @brief A copy of a retaining only the members also in b.
     *
     * @throws InvalidInput if a or b cannot be normalized
     */
    template<typename A, typename B>
    static BasicSet intersect(const A& a, const B& b);

    /**
     * @brief Add an element, if not already present.
     * @complexity O(1) average
     */
    void add(const Element& element);

    /**
     * @brief Remove an element, if present.
     * @complexity O(1) average
     */
    void remove(const Element& element);

    bool contains(const Element& element) const;

    bool is_empty() const;

    /// Alias of is_empty() for generic container code.
    bool empty() const;

    size_type size() const;

    /// Alias of size() for generic container code.
    size_type count() const;

    void clear();

    /**
     * @brief The elements in insertion order.
     * @complexity O(n)
     */
    std::vector<Element> to_array() const;

    /**
     * @brief The raw key-presence mapping.
     *
     * The mapped values are markers; do not depend on what they hold.
     *
     * @complexity O(1)
     */
    const mapping_type& to_array_keys() const;

    /**
     * @brief Move the key-presence mapping out, leaving this set empty.
     *
     * Together with from_array_keys(mapping_type&&) this gives an O(1)
     * round trip through the mapping.
     *
     * @complexity O(1)
     */
    mapping_type take_array_keys();

    /**
     * @brief Set union. Adds every element of source, if not already present.
     *
     * Elements already in the set keep their position; new ones are appended
     * in source order.
     *
     * @throws InvalidInput if source cannot be normalized
     * @complexity O(n)
     */
    template<typename Source>
    void add_all(const Source& source);

    /**
     * @brief Set difference. Removes every element of source, if present.
     *
     * @throws InvalidInput if source cannot be normalized
     * @complexity O(n)
     */
    template<typename Source>
    void remove_all(const Source& source);

    /**
     * @brief Set intersection. Removes every element that is not in source.
     *
     * @throws InvalidInput if source cannot be normalized
     * @complexity O(n)
     */
    template<typename Source>
    void retain_all(const Source& source);

    /**
     * @brief Whether every element of source is in this set.
     *
     * @throws InvalidInput if source cannot be normalized
     * @complexity O(n)
     */
    template<typename Source>
    bool contains_all(const Source& source) const;

    /**
     * @brief Whether this set holds exactly the elements of source, in any order.
     *
     * @return false also when source cannot be normalized into a set
     * @complexity O(n)
     */
    template<typename Source>
    bool equals(const Source& source) const;

    /**
     * @brief Restartable cursor over a snapshot of the elements.
     *
     * Produces the same sequence as begin()/end().
     *
     * @complexity O(n) to take the snapshot
     */
    key_iterator_type key_iterator() const;

    const_iterator begin() const;
    const_iterator end() const;

    Subscript operator[](const Element& key);

    bool operator[](const Element& key) const;

    friend bool operator==(const BasicSet& lhs, const BasicSet& rhs) {
        return lhs.equals(rhs);
    }

    friend bool operator!=(const BasicSet& lhs, const BasicSet& rhs) {
        return !lhs.equals(rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const BasicSet& set) {
        os << '{';
        for (auto it = set.begin(); it != set.end(); ++it) {
            if (it.position() > 0) {
                os << ", ";
            }
            os << *it;
        }
        return os << '}';
    }

private:
    struct adopt_t {};

    // Internal fast path, takes ownership of an already built mapping
    BasicSet(adopt_t, mapping_type&& entries) : entries_(std::move(entries)) {}

    static const mapping_type& to_keys(const BasicSet& set);
    static const mapping_type& to_keys(const mapping_type& keys);

    /**
     * @brief Normalize an arbitrary source into a key-presence mapping.
     * @throws InvalidInput if Source is not a range of Element-convertible values
     */
    template<typename Source>
    static mapping_type to_keys(const Source& source);

    /**
     * @brief Convert one value read from Source into an element.
     * @throws InvalidInput naming Source if Element's constructor rejects the value
     */
    template<typename Source, typename Value>
    static Element to_element(const Value& value);

    mapping_type entries_;
};

/// The set of integers and strings.
using Set = BasicSet<Scalar>;

template<typename Element, typename Hash, typename KeyEqual>
BasicSet<Element, Hash, KeyEqual>::BasicSet(std::initializer_list<Element> elements) {
    for (const auto& element : elements) {
        entries_.insert(element, true);
    }
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename InputIt, typename>
BasicSet<Element, Hash, KeyEqual>::BasicSet(InputIt first, InputIt last) {
    for (; first != last; ++first) {
        entries_.insert(to_element<InputIt>(*first), true);
    }
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename Source>
BasicSet<Element, Hash, KeyEqual>::BasicSet(const Source& source)
    : entries_(to_keys(source)) {}

template<typename Element, typename Hash, typename KeyEqual>
BasicSet<Element, Hash, KeyEqual> BasicSet<Element, Hash, KeyEqual>::from_array_keys(mapping_type&& keys) {
    return BasicSet(adopt_t{}, std::move(keys));
}

template<typename Element, typename Hash, typename KeyEqual>
BasicSet<Element, Hash, KeyEqual> BasicSet<Element, Hash, KeyEqual>::from_array_keys(const mapping_type& keys) {
    return BasicSet(adopt_t{}, mapping_type(keys));
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename... Sources>
BasicSet<Element, Hash, KeyEqual> BasicSet<Element, Hash, KeyEqual>::union_all(const Sources&... sources) {
    BasicSet result;
    (result.add_all(sources), ...);
    return result;
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename Range>
BasicSet<Element, Hash, KeyEqual> BasicSet<Element, Hash, KeyEqual>::union_all_of(const Range& sources) {
    if constexpr (detail::is_iterable<Range>::value) {
        BasicSet result;
        for (const auto& source : sources) {
            result.add_all(source);
        }
        return result;
    } else {
        throw InvalidInput(type_name<Range>());
    }
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename A, typename B>
BasicSet<Element, Hash, KeyEqual> BasicSet<Element, Hash, KeyEqual>::intersect(const A& a, const B& b) {
    BasicSet result(adopt_t{}, mapping_type(to_keys(a)));
    result.retain_all(b);
    return result;
}

template<typename Element, typename Hash, typename KeyEqual>
void BasicSet<Element, Hash, KeyEqual>::add(const Element& element) {
    entries_.insert(element, true);
}

template<typename Element, typename Hash, typename KeyEqual>
void BasicSet<Element, Hash, KeyEqual>::remove(const Element& element) {
    entries_.erase(element);
}

template<typename Element, typename Hash, typename KeyEqual>
bool BasicSet<Element, Hash, KeyEqual>::contains(const Element& element) const {
    return entries_.contains(element);
}

template<typename Element, typename Hash, typename KeyEqual>
bool BasicSet<Element, Hash, KeyEqual>::is_empty() const {
    return entries_.empty();
}

template<typename Element, typename Hash, typename KeyEqual>
bool BasicSet<Element, Hash, KeyEqual>::empty() const {
    return is_empty();
}

template<typename Element, typename Hash, typename KeyEqual>
typename BasicSet<Element, Hash, KeyEqual>::size_type BasicSet<Element, Hash, KeyEqual>::size() const {
    return entries_.size();
}

template<typename Element, typename Hash, typename KeyEqual>
typename BasicSet<Element, Hash, KeyEqual>::size_type BasicSet<Element, Hash, KeyEqual>::count() const {
    return size();
}

template<typename Element, typename Hash, typename KeyEqual>
void BasicSet<Element, Hash, KeyEqual>::clear() {
    entries_.clear();
}

template<typename Element, typename Hash, typename KeyEqual>
std::vector<Element> BasicSet<Element, Hash, KeyEqual>::to_array() const {
    return entries_.keys();
}

template<typename Element, typename Hash, typename KeyEqual>
const typename BasicSet<Element, Hash, KeyEqual>::mapping_type&
BasicSet<Element, Hash, KeyEqual>::to_array_keys() const {
    return entries_;
}

template<typename Element, typename Hash, typename KeyEqual>
typename BasicSet<Element, Hash, KeyEqual>::mapping_type BasicSet<Element, Hash, KeyEqual>::take_array_keys() {
    mapping_type keys(std::move(entries_));
    entries_ = mapping_type();
    return keys;
}

// Set algebra

template<typename Element, typename Hash, typename KeyEqual>
template<typename Source>
void BasicSet<Element, Hash, KeyEqual>::add_all(const Source& source) {
    const mapping_type& keys = to_keys(source);
    for (auto it = keys.begin(); it != keys.end(); ++it) {
        entries_.insert_or_assign(it.key(), true);
    }
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename Source>
void BasicSet<Element, Hash, KeyEqual>::remove_all(const Source& source) {
    const mapping_type& keys = to_keys(source);
    if (&keys == &entries_) {
        clear();
        return;
    }

    // Walk whichever side is smaller
    if (keys.size() < entries_.size()) {
        for (auto it = keys.begin(); it != keys.end(); ++it) {
            entries_.erase(it.key());
        }
    } else {
        entries_.erase_if([&keys](const Element& key, bool) { return keys.contains(key); });
    }
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename Source>
void BasicSet<Element, Hash, KeyEqual>::retain_all(const Source& source) {
    const mapping_type& keys = to_keys(source);
    entries_.erase_if([&keys](const Element& key, bool) { return !keys.contains(key); });
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename Source>
bool BasicSet<Element, Hash, KeyEqual>::contains_all(const Source& source) const {
    const mapping_type& keys = to_keys(source);
    for (auto it = keys.begin(); it != keys.end(); ++it) {
        if (!entries_.contains(it.key())) {
            return false;
        }
    }
    return true;
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename Source>
bool BasicSet<Element, Hash, KeyEqual>::equals(const Source& source) const {
    try {
        const mapping_type& keys = to_keys(source);
        return keys.size() == entries_.size() && contains_all(keys);
    } catch (const InvalidInput&) {
        return false;
    }
}

// Iteration and indexed access

template<typename Element, typename Hash, typename KeyEqual>
typename BasicSet<Element, Hash, KeyEqual>::key_iterator_type
BasicSet<Element, Hash, KeyEqual>::key_iterator() const {
    return key_iterator_type(entries_);
}

template<typename Element, typename Hash, typename KeyEqual>
typename BasicSet<Element, Hash, KeyEqual>::const_iterator BasicSet<Element, Hash, KeyEqual>::begin() const {
    return const_iterator(entries_.begin(), 0);
}

template<typename Element, typename Hash, typename KeyEqual>
typename BasicSet<Element, Hash, KeyEqual>::const_iterator BasicSet<Element, Hash, KeyEqual>::end() const {
    return const_iterator(entries_.end(), entries_.size());
}

template<typename Element, typename Hash, typename KeyEqual>
typename BasicSet<Element, Hash, KeyEqual>::Subscript
BasicSet<Element, Hash, KeyEqual>::operator[](const Element& key) {
    return Subscript(*this, key);
}

template<typename Element, typename Hash, typename KeyEqual>
bool BasicSet<Element, Hash, KeyEqual>::operator[](const Element& key) const {
    return contains(key);
}

// Normalization

template<typename Element, typename Hash, typename KeyEqual>
const typename BasicSet<Element, Hash, KeyEqual>::mapping_type&
BasicSet<Element, Hash, KeyEqual>::to_keys(const BasicSet& set) {
    return set.entries_;
}

template<typename Element, typename Hash, typename KeyEqual>
const typename BasicSet<Element, Hash, KeyEqual>::mapping_type&
BasicSet<Element, Hash, KeyEqual>::to_keys(const mapping_type& keys) {
    return keys;
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename Source>
typename BasicSet<Element, Hash, KeyEqual>::mapping_type
BasicSet<Element, Hash, KeyEqual>::to_keys(const Source& source) {
    if constexpr (detail::is_element_range<Source, Element>::value) {
        mapping_type keys;
        for (const auto& value : source) {
            keys.insert(to_element<Source>(value), true);
        }
        return keys;
    } else {
        throw InvalidInput(type_name<Source>());
    }
}

template<typename Element, typename Hash, typename KeyEqual>
template<typename Source, typename Value>
Element BasicSet<Element, Hash, KeyEqual>::to_element(const Value& value) {
    // Out of range integers and null C strings
    try {
        return Element(value);
    } catch (const std::logic_error&) {
        throw InvalidInput(type_name<Source>());
    }
}

} // namespace scalarset
