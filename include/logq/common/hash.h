// =============================================================================
// logq - String Hashing
// =============================================================================
// xxHash-based transparent hasher for string-keyed containers, so lookups by
// std::string_view do not allocate.
// =============================================================================

#ifndef LOGQ_COMMON_HASH_H
#define LOGQ_COMMON_HASH_H

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include <xxhash.h>

namespace logq {

/// @brief Transparent XXH3 hasher accepting std::string and std::string_view.
struct StringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view value) const noexcept {
        return static_cast<std::size_t>(XXH3_64bits(value.data(), value.size()));
    }
};

/// @brief String set with heterogeneous lookup.
using StringSet = std::unordered_set<std::string, StringHash, std::equal_to<>>;

/// @brief String-keyed map with heterogeneous lookup.
template <typename T>
using StringMap = std::unordered_map<std::string, T, StringHash, std::equal_to<>>;

}  // namespace logq

#endif  // LOGQ_COMMON_HASH_H
