/**
 * @file payload_codec.cpp
 * @brief Payload canonicalization
 */

#include "jobwire/storage/payload_codec.h"

#include <nlohmann/json.hpp>

namespace jobwire::payload_codec {

auto is_json(const std::vector<uint8_t>& bytes) -> bool {
    if (bytes.empty()) {
        return false;
    }
    return nlohmann::json::accept(bytes.begin(), bytes.end());
}

auto canonicalize(const std::vector<uint8_t>& bytes) -> std::vector<uint8_t> {
    if (bytes.empty()) {
        return bytes;
    }
    auto doc = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (doc.is_discarded()) {
        return bytes;
    }
    return to_bytes(doc.dump());
}

}  // namespace jobwire::payload_codec
