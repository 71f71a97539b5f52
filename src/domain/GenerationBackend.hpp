/**
 * @file GenerationBackend.hpp
 * @brief Interface for the external generative text/image service.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/Generation.hpp"

namespace dreadloom::domain {

/**
 * @class GenerationBackend
 * @brief Abstract synchronous gateway to a generative model.
 *
 * Implementations return std::nullopt on transport or service failure. They may
 * also throw; the orchestrator treats both the same way.
 */
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Generates text for a fully prepared request.
     * @param request Prompt (already enhanced), temperature, token budget and model.
     * @return Generated text if the call succeeded.
     */
    virtual std::optional<std::string> complete(const GenerationRequest& request) = 0;

    /**
     * @brief Generates an image for a prompt.
     * @return Decoded image bytes if supported and successful.
     */
    virtual std::optional<ImageResult> generateImage(const std::string& prompt) {
        (void)prompt;
        return std::nullopt;
    }
};

} // namespace dreadloom::domain
