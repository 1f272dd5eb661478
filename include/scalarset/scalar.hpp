#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace scalarset {

/**
 * @brief Trait selecting the integer types accepted as set elements.
 *
 * Every integral type qualifies except bool and the character types, which
 * would otherwise silently turn 'a' or true into a number.
 */
template<typename T>
struct is_integer_element
    : std::integral_constant<bool,
          std::is_integral<T>::value &&
          !std::is_same<T, bool>::value &&
          !std::is_same<T, char>::value &&
          !std::is_same<T, wchar_t>::value &&
          !std::is_same<T, char16_t>::value &&
          !std::is_same<T, char32_t>::value> {};

/**
 * @brief The default set element: a 64-bit signed integer or a string.
 *
 * Scalar is the value type of scalarset::Set. It converts implicitly from
 * integers and strings so that a set can be filled with plain literals, and
 * it is hashable and equality comparable so that it can key an
 * OrderedHashMap.
 *
 * Integers and strings never compare equal to each other: the integer 100
 * and the string "100" are two distinct elements.
 *
 * Usage Example:
 * @code
 * scalarset::Scalar a = 42;
 * scalarset::Scalar b = "forty-two";
 *
 * if (a.is_integer()) {
 *     std::cout << a.as_integer() << std::endl;
 * }
 * std::cout << b << std::endl;   // prints forty-two
 * @endcode
 */
class Scalar {
public:
    /// Which alternative a Scalar holds.
    enum class Kind {
        Integer,
        String
    };

    /**
     * @brief Construct an integer element.
     *
     * @param value Any integral value other than bool or a character
     * @throws std::out_of_range if an unsigned value does not fit in int64_t
     */
    template<typename T, typename std::enable_if<is_integer_element<T>::value, int>::type = 0>
    Scalar(T value) : value_(to_int64(value)) {}

    /**
     * @brief Construct a string element.
     * @param value The string to copy
     */
    Scalar(const std::string& value) : value_(value) {}

    /**
     * @brief Construct a string element by moving.
     * @param value The string to move
     */
    Scalar(std::string&& value) : value_(std::move(value)) {}

    /**
     * @brief Construct a string element from a C string.
     * @param value Null-terminated string, must not be nullptr
     * @throws std::invalid_argument if value is nullptr
     */
    Scalar(const char* value) : value_(from_c_string(value)) {}

    /**
     * @brief Construct a string element from a string view.
     * @param value The characters to copy
     */
    Scalar(std::string_view value) : value_(std::string(value)) {}

    Kind kind() const noexcept {
        return value_.index() == 0 ? Kind::Integer : Kind::String;
    }

    bool is_integer() const noexcept { return kind() == Kind::Integer; }
    bool is_string() const noexcept { return kind() == Kind::String; }

    /**
     * @brief Integer value of the element.
     * @throws std::bad_variant_access if the element is a string
     */
    std::int64_t as_integer() const { return std::get<std::int64_t>(value_); }

    /**
     * @brief String value of the element.
     * @throws std::bad_variant_access if the element is an integer
     */
    const std::string& as_string() const { return std::get<std::string>(value_); }

    /**
     * @brief Textual form: decimal digits for integers, the raw characters for strings.
     */
    std::string to_string() const {
        return is_integer() ? std::to_string(as_integer()) : as_string();
    }

    std::size_t hash() const {
        return std::hash<std::variant<std::int64_t, std::string>>{}(value_);
    }

    friend bool operator==(const Scalar& lhs, const Scalar& rhs) {
        return lhs.value_ == rhs.value_;
    }

    friend bool operator!=(const Scalar& lhs, const Scalar& rhs) {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const Scalar& scalar) {
        if (scalar.is_integer()) {
            return os << scalar.as_integer();
        }
        return os << scalar.as_string();
    }

private:
    std::variant<std::int64_t, std::string> value_;

    template<typename T>
    static std::int64_t to_int64(T value) {
        if constexpr (std::is_unsigned<T>::value) {
            if (static_cast<std::uint64_t>(value) >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw std::out_of_range("integer element does not fit in int64_t");
            }
        }
        return static_cast<std::int64_t>(value);
    }

    static std::string from_c_string(const char* value) {
        if (value == nullptr) {
            throw std::invalid_argument("null C string cannot be a set element");
        }
        return std::string(value);
    }
};

} // namespace scalarset

// Hash specialization for Scalar
namespace std {
    template<>
    struct hash<scalarset::Scalar> {
        size_t operator()(const scalarset::Scalar& scalar) const {
            return scalar.hash();
        }
    };
}
