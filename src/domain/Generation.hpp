/**
 * @file Generation.hpp
 * @brief Request/result value objects exchanged with the generation pipeline.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace dreadloom::domain {

/**
 * @struct GenerationRequest
 * @brief A single prompt travelling through the orchestrator.
 */
struct GenerationRequest {
    std::string prompt;                        ///< Raw caller prompt (cache key source).
    std::string contextType;                   ///< e.g. "room_description", "analysis".
    std::vector<std::string> requiredElements; ///< Substrings the result must contain.
    float temperature = 0.7f;
    int maxTokens = 0;
    std::string model;
    std::string cacheKey;
};

/**
 * @enum GenerationStatus
 * @brief Outcome of a text generation.
 */
enum class GenerationStatus {
    Success,
    ValidationFailed, ///< Backend answered but required elements were missing after the retry.
    BackendFailed     ///< No usable answer. Set by the Director when delivering a GenerationError.
};

/**
 * @struct GenerationResult
 * @brief Generated text plus how it was obtained.
 */
struct GenerationResult {
    std::string text;
    GenerationStatus status = GenerationStatus::Success;
    bool valid = false;
    bool fromCache = false;
    int attempts = 0;                         ///< External calls spent on this result.
    std::vector<std::string> missingElements; ///< Set when status is ValidationFailed.

    bool ok() const { return status == GenerationStatus::Success && valid; }
};

/**
 * @struct ImageResult
 * @brief Decoded image artifact from the image-generation variant.
 */
struct ImageResult {
    std::vector<std::uint8_t> bytes;
    std::string mimeType = "image/png";
};

/**
 * @struct ContextualMemory
 * @brief A past response retained to enrich future prompts.
 */
struct ContextualMemory {
    std::string contextType;
    std::string content;
    float relevance = 0.0f;
    float emotionalImpact = 0.0f;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @class GenerationError
 * @brief Raised on a request's future when the backend could not produce a response.
 */
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace dreadloom::domain
