/**
 * @file Base64.hpp
 * @brief Decoding of base64 image payloads returned by the generation service.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dreadloom::infrastructure {

/**
 * @brief Decodes standard base64. Whitespace is skipped; decoding stops at the first '='.
 * @return Decoded bytes, or std::nullopt on an invalid character or truncated input.
 */
std::optional<std::vector<std::uint8_t>> Base64Decode(const std::string& encoded);

/** @brief "image/png", "image/jpeg" or "application/octet-stream" from magic bytes. */
std::string DetectImageMimeType(const std::vector<std::uint8_t>& bytes);

} // namespace dreadloom::infrastructure
