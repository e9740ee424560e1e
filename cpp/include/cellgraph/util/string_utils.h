#ifndef CELLGRAPH_STRING_UTILS_H
#define CELLGRAPH_STRING_UTILS_H

#include <cellgraph/cellgraph_base.h>

#include <typeinfo>

namespace cellgraph {
    /**
     * Render a cell value for diagnostics and error messages. Types fmt can format are formatted directly,
     * anything else is rendered as its type name in angle brackets.
     */
    template<typename T>
    std::string to_string(const T &value) {
        if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("{}", value);
        } else {
            // typeid names are implementation defined, GCC and Clang give the mangled name.
            return fmt::format("<{}>", typeid(T).name());
        }
    }

    template<>
    CELLGRAPH_EXPORT std::string to_string(const std::string &value);

    template<>
    CELLGRAPH_EXPORT std::string to_string(const std::string_view &value);

    template<typename T>
    std::string to_string(const std::shared_ptr<T> &value) {
        return value ? fmt::format("{}", fmt::ptr(value.get())) : std::string{"nullptr"};
    }

    // The absent sentinel renders as "null"
    template<typename T>
    std::string to_string(const std::optional<T> &value) {
        return value.has_value() ? cellgraph::to_string(*value) : std::string{"null"};
    }
} // namespace cellgraph

#endif  // CELLGRAPH_STRING_UTILS_H
