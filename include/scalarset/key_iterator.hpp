#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

namespace scalarset {

/**
 * @brief Restartable cursor producing the keys of a mapping as values.
 *
 * The cursor owns a snapshot of the mapping it walks, so later changes to the
 * source container do not affect an iteration in progress. Each key is paired
 * with a synthetic 0-based position that counts advance() calls since the
 * last restart(), independent of where the key lives inside the hash table.
 *
 * @tparam Mapping An insertion-ordered map exposing begin()/end() iterators
 *                 with a key() accessor, e.g. OrderedHashMap.
 *
 * Usage Example:
 * @code
 * scalarset::Set set{"foo", "bar", 9000};
 *
 * for (auto it = set.key_iterator(); it.valid(); it.advance()) {
 *     std::cout << it.position() << ": " << it.current() << std::endl;
 * }
 * // 0: foo
 * // 1: bar
 * // 2: 9000
 * @endcode
 *
 * @note Movable but not copyable: the cursor points into the owned snapshot.
 */
template<typename Mapping>
class OrderedKeyIterator {
public:
    using mapping_type = Mapping;
    using key_type = typename std::decay<decltype(std::declval<const Mapping&>().begin().key())>::type;

    /**
     * @brief Snapshot a mapping by copying it.
     *
     * @complexity O(n)
     */
    explicit OrderedKeyIterator(const Mapping& mapping)
        : snapshot_(mapping), cursor_(snapshot_.begin()), position_(0) {}

    /**
     * @brief Adopt a mapping as the snapshot.
     *
     * @complexity O(1)
     */
    explicit OrderedKeyIterator(Mapping&& mapping)
        : snapshot_(std::move(mapping)), cursor_(snapshot_.begin()), position_(0) {}

    OrderedKeyIterator(const OrderedKeyIterator&) = delete;
    OrderedKeyIterator& operator=(const OrderedKeyIterator&) = delete;

    // Mapping iterators only refer to nodes, which survive a move of the mapping
    OrderedKeyIterator(OrderedKeyIterator&&) = default;
    OrderedKeyIterator& operator=(OrderedKeyIterator&&) = default;

    /**
     * @brief Whether the cursor points at an entry.
     * @return false once every entry has been produced
     */
    bool valid() const { return cursor_ != snapshot_.end(); }

    /**
     * @brief The key under the cursor, produced as the element value.
     *
     * Requires valid().
     */
    const key_type& current() const { return cursor_.key(); }

    /**
     * @brief Synthetic 0-based position of the current element.
     */
    std::size_t position() const { return position_; }

    /**
     * @brief Move to the next entry and increment the position.
     */
    void advance() {
        ++cursor_;
        ++position_;
    }

    /**
     * @brief Rewind to the first entry and reset the position to 0.
     */
    void restart() {
        cursor_ = snapshot_.begin();
        position_ = 0;
    }

    /**
     * @brief Number of entries in the snapshot.
     */
    std::size_t size() const { return snapshot_.size(); }

private:
    Mapping snapshot_;
    typename Mapping::const_iterator cursor_;
    std::size_t position_;
};

} // namespace scalarset
