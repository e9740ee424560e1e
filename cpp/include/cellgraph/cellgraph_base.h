/*
 * The core imports for cellgraph. Include this first so the formatting support and forward declarations
 * are always available in the same order.
 */

#ifndef CELLGRAPH_BASE_H
#define CELLGRAPH_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cellgraph/cellgraph_export.h>
#include <cellgraph/cellgraph_forward_declarations.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#endif //CELLGRAPH_BASE_H
