#ifndef CELLGRAPH_UTIL_ERRORS
#define CELLGRAPH_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cellgraph {

    /**
     * Raised when an equality policy throws while an Observable decides whether a set is a change.
     * The message carries both compared values, the original exception is nested.
     */
    struct equality_test_failure : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * Raised by unobserve / untrack when the subscription does not exist.
     */
    struct subscriber_not_found : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * Raised while constructing an Algorithm whose port declaration or bindings are inconsistent.
     */
    struct construction_contract_violation : std::logic_error {
        using std::logic_error::logic_error;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location info
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace cellgraph

#endif // CELLGRAPH_UTIL_ERRORS
