#ifndef CKG_HASH_UTILS_HPP
#define CKG_HASH_UTILS_HPP

/**
 * @file hash_utils.hpp
 * @brief Hashing helpers for content-addressed ids and cache keys.
 */

#include "ckg/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ckg::hash_utils {

    /**
     * Compute the FNV-1a hash (64-bit) of the input data.
     *
     * Stable across platforms and runs, which node ids and vector slots
     * depend on. Never replace it with std::hash.
     */
    [[nodiscard]] std::uint64_t fnv1a_hash(std::string_view data) noexcept;

    /**
     * Renders a 64-bit value as 16 lower-case hex digits.
     */
    [[nodiscard]] std::string to_hex_string(std::uint64_t value);

    /**
     * Compute the SHA-256 digest of the input as lower-case hex.
     *
     * @throws std::runtime_error if the OpenSSL digest context fails.
     */
    [[nodiscard]] std::string compute_sha256(std::string_view data);

    /**
     * Deterministic node id: "<type>_<hex(fnv1a("<type>|<identifier>"))>".
     *
     * Files use their normalized path as identifier, entities use
     * "<path>:<name>", modules use the module specifier.
     */
    [[nodiscard]] std::string make_node_id(NodeType type, std::string_view identifier);

}  // namespace ckg::hash_utils

#endif //CKG_HASH_UTILS_HPP
