/**
 * @file payload_codec.h
 * @brief Canonical serialization shared by the inline and object storage paths
 */

#ifndef JOBWIRE_STORAGE_PAYLOAD_CODEC_H
#define JOBWIRE_STORAGE_PAYLOAD_CODEC_H

#include <cstdint>
#include <string>
#include <vector>

namespace jobwire::payload_codec {

/**
 * @brief Check whether @p bytes hold a single JSON document
 */
[[nodiscard]] auto is_json(const std::vector<uint8_t>& bytes) -> bool;

/**
 * @brief Canonical form of a payload
 *
 * JSON documents are re-serialized compactly with object keys sorted.
 * Anything else is returned unchanged. Idempotent.
 */
[[nodiscard]] auto canonicalize(const std::vector<uint8_t>& bytes) -> std::vector<uint8_t>;

[[nodiscard]] inline auto to_bytes(const std::string& text) -> std::vector<uint8_t> {
    return std::vector<uint8_t>(text.begin(), text.end());
}

[[nodiscard]] inline auto to_string(const std::vector<uint8_t>& bytes) -> std::string {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace jobwire::payload_codec

#endif  // JOBWIRE_STORAGE_PAYLOAD_CODEC_H
