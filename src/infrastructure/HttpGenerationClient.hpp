/**
 * @file HttpGenerationClient.hpp
 * @brief HTTP implementation of the generation backend.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/DirectorConfig.hpp"
#include "domain/GenerationBackend.hpp"

namespace dreadloom::infrastructure {

/**
 * @class HttpGenerationClient
 * @brief Talks to a completion-style REST service with cpp-httplib.
 *
 * Opens a fresh connection per call. Returns std::nullopt on connection errors,
 * non-200 replies and unparsable bodies.
 */
class HttpGenerationClient : public domain::GenerationBackend {
public:
    /**
     * @param settings Endpoint description.
     * @param defaultModel Preferred model; kept if the service lists it.
     */
    explicit HttpGenerationClient(domain::BackendSettings settings, std::string defaultModel = "");

    /** @brief Queries the model list and picks one with PickServedModel. */
    void initialize() override;

    std::optional<std::string> complete(const domain::GenerationRequest& request) override;
    std::optional<domain::ImageResult> generateImage(const std::string& prompt) override;

    /** @brief Fetches model names from the models endpoint. */
    std::vector<std::string> getAvailableModels();

    std::string getSelectedModel() const;

    /** @brief Request body for a text completion. */
    static nlohmann::json BuildCompletionBody(const domain::GenerationRequest& request, const std::string& model);

    /** @brief Text from choices[0].text, choices[0].message.content, response or generated_text. */
    static std::optional<std::string> ExtractText(const nlohmann::json& body);

    /** @brief Base64 payload from data[0].b64_json or images[0]. */
    static std::optional<std::string> ExtractImagePayload(const nlohmann::json& body);

    /** @brief Model names from data[].id or models[].name. */
    static std::vector<std::string> ExtractModelNames(const nlohmann::json& body);

    /**
     * @brief Chooses the model to send when a request names none.
     *
     * Keeps @p preferred when it is served, either verbatim or as "preferred:tag".
     * Otherwise takes the first served name containing a known storytelling family,
     * then the first served name. Returns @p preferred when nothing is served.
     */
    static std::string PickServedModel(const std::vector<std::string>& served, const std::string& preferred);

private:
    std::string baseUrl() const;
    std::optional<std::string> post(const std::string& path, const nlohmann::json& body);

    domain::BackendSettings m_settings;
    std::string m_apiKey;
    mutable std::mutex m_modelMutex;
    std::string m_selectedModel;
};

} // namespace dreadloom::infrastructure
