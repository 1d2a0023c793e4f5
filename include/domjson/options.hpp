#pragma once

/// @file options.hpp
/// @brief Runtime options for the decode and encode engines.

#include "config.hpp"

#include <cstddef>

namespace domjson {

/// @brief Decode engine configuration.
struct DecodeOptions {
    /// Maximum nesting depth of arrays/objects (0 = DOMJSON_MAX_DEPTH)
    size_t max_depth = 0;

    [[nodiscard]] constexpr size_t effective_max_depth() const noexcept {
        return max_depth > 0 ? max_depth : DOMJSON_MAX_DEPTH;
    }
};

/// @brief Encode engine configuration.
struct EncodeOptions {
    /// Maximum nesting depth of encoded containers (0 = DOMJSON_MAX_DEPTH)
    size_t max_depth = 0;

    [[nodiscard]] constexpr size_t effective_max_depth() const noexcept {
        return max_depth > 0 ? max_depth : DOMJSON_MAX_DEPTH;
    }
};

} // namespace domjson
