#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <typeinfo>

#ifndef _MSC_VER
#include <cxxabi.h>
#endif

namespace scalarset {

namespace detail {

#ifndef _MSC_VER
inline std::string demangle(const char* mangled_name) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status);
    if (status == 0 && demangled) {
        std::string result(demangled);
        std::free(demangled);
        return result;
    }
    return mangled_name;
}
#else
inline std::string demangle(const char* name) {
    return name;
}
#endif

} // namespace detail

/**
 * @brief Human readable name of a type, used in error messages.
 *
 * @tparam T The type to name
 * @return Demangled type name (e.g. "int", "Coordinate")
 */
template<typename T>
std::string type_name() {
    return detail::demangle(typeid(T).name());
}

/**
 * @brief Thrown when a value cannot be normalized into a key-presence mapping.
 *
 * Raised by the set constructors and by every bulk operation that accepts an
 * arbitrary source (add_all, remove_all, retain_all, contains_all). The
 * message names the concrete type that was rejected.
 */
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& type_name)
        : std::invalid_argument("Cannot use a '" + type_name + "' as a set"),
          type_name_(type_name) {}

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

/**
 * @brief Thrown by the indexed-access variants that are deliberately disabled.
 *
 * The message names the operation, e.g.
 * "BasicSet::Subscript::exists is not supported".
 */
class NotSupported : public std::logic_error {
public:
    explicit NotSupported(const std::string& operation)
        : std::logic_error(operation + " is not supported"),
          operation_(operation) {}

    const std::string& operation() const noexcept { return operation_; }

private:
    std::string operation_;
};

} // namespace scalarset
