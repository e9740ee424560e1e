#include <cellgraph/util/string_utils.h>

namespace cellgraph {
    template<>
    std::string to_string(const std::string &value) { return fmt::format("'{}'", value); }

    template<>
    std::string to_string(const std::string_view &value) { return fmt::format("'{}'", value); }
} // namespace cellgraph
