#include "infrastructure/HttpGenerationClient.hpp"
#include "infrastructure/Base64.hpp"
#include <algorithm>
#include <httplib.h>
#include <cstdlib>
#include <iostream>

namespace dreadloom::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kModelListTimeoutSeconds = 5;

// Model families that follow atmospheric prompts well, best first.
const std::vector<std::string> kStorytellingFamilies = {"llama3", "mistral", "qwen2.5", "gemma", "phi3"};
}

HttpGenerationClient::HttpGenerationClient(domain::BackendSettings settings, std::string defaultModel)
    : m_settings(std::move(settings)), m_selectedModel(std::move(defaultModel)) {
    if (!m_settings.apiKeyEnv.empty()) {
        const char* key = std::getenv(m_settings.apiKeyEnv.c_str());
        if (key && *key) {
            m_apiKey = key;
        }
    }
}

std::string HttpGenerationClient::baseUrl() const {
    return std::string(m_settings.useTls ? "https://" : "http://") + m_settings.host + ":" +
           std::to_string(m_settings.port);
}

void HttpGenerationClient::initialize() {
    auto models = getAvailableModels();
    if (models.empty()) {
        std::cerr << "[HttpGenerationClient] Could not list models at " << baseUrl()
                  << "; using configured model." << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_modelMutex);
    m_selectedModel = PickServedModel(models, m_selectedModel);
    std::cout << "[HttpGenerationClient] Using model: " << m_selectedModel << std::endl;
}

std::string HttpGenerationClient::getSelectedModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_selectedModel;
}

std::vector<std::string> HttpGenerationClient::getAvailableModels() {
    httplib::Client cli(baseUrl());
    if (!cli.is_valid()) {
        std::cerr << "[HttpGenerationClient] Invalid endpoint " << baseUrl() << std::endl;
        return {};
    }
    cli.set_read_timeout(kModelListTimeoutSeconds);

    httplib::Headers headers;
    if (!m_apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + m_apiKey);
    }

    auto res = cli.Get(m_settings.modelsPath, headers);
    if (res && res->status == 200) {
        try {
            return ExtractModelNames(json::parse(res->body));
        } catch (const std::exception& e) {
            std::cerr << "[HttpGenerationClient] Model list parse error: " << e.what() << std::endl;
        }
    }
    return {};
}

std::optional<std::string> HttpGenerationClient::post(const std::string& path, const json& body) {
    httplib::Client cli(baseUrl());
    if (!cli.is_valid()) {
        std::cerr << "[HttpGenerationClient] Invalid endpoint " << baseUrl() << std::endl;
        return std::nullopt;
    }
    cli.set_read_timeout(m_settings.readTimeoutSeconds);

    httplib::Headers headers;
    if (!m_apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + m_apiKey);
    }

    auto res = cli.Post(path, headers, body.dump(), "application/json");
    if (res && res->status == 200) {
        return res->body;
    }

    if (res) {
        std::cerr << "[HttpGenerationClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[HttpGenerationClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

json HttpGenerationClient::BuildCompletionBody(const domain::GenerationRequest& request, const std::string& model) {
    json body = {
        {"prompt", request.prompt},
        {"temperature", request.temperature},
        {"max_tokens", request.maxTokens}
    };
    if (!model.empty()) {
        body["model"] = model;
    }
    return body;
}

std::optional<std::string> HttpGenerationClient::complete(const domain::GenerationRequest& request) {
    std::string model = request.model.empty() ? getSelectedModel() : request.model;

    auto raw = post(m_settings.path, BuildCompletionBody(request, model));
    if (!raw) return std::nullopt;

    try {
        auto text = ExtractText(json::parse(*raw));
        if (!text) {
            std::cerr << "[HttpGenerationClient] Reply has no text field." << std::endl;
        }
        return text;
    } catch (const std::exception& e) {
        std::cerr << "[HttpGenerationClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::ImageResult> HttpGenerationClient::generateImage(const std::string& prompt) {
    json body = {
        {"prompt", prompt},
        {"n", 1},
        {"response_format", "b64_json"}
    };

    auto raw = post(m_settings.imagePath, body);
    if (!raw) return std::nullopt;

    std::optional<std::string> payload;
    try {
        payload = ExtractImagePayload(json::parse(*raw));
    } catch (const std::exception& e) {
        std::cerr << "[HttpGenerationClient] Image JSON Parse Error: " << e.what() << std::endl;
        return std::nullopt;
    }
    if (!payload) {
        std::cerr << "[HttpGenerationClient] Reply has no image payload." << std::endl;
        return std::nullopt;
    }

    auto bytes = Base64Decode(*payload);
    if (!bytes || bytes->empty()) {
        std::cerr << "[HttpGenerationClient] Image payload is not valid base64." << std::endl;
        return std::nullopt;
    }

    domain::ImageResult image;
    image.mimeType = DetectImageMimeType(*bytes);
    image.bytes = std::move(*bytes);
    return image;
}

std::optional<std::string> HttpGenerationClient::ExtractText(const json& body) {
    if (body.contains("choices") && body["choices"].is_array() && !body["choices"].empty()) {
        const auto& first = body["choices"][0];
        if (first.contains("text") && first["text"].is_string()) {
            return first["text"].get<std::string>();
        }
        if (first.contains("message") && first["message"].is_object() &&
            first["message"].contains("content") && first["message"]["content"].is_string()) {
            return first["message"]["content"].get<std::string>();
        }
    }
    if (body.contains("response") && body["response"].is_string()) {
        return body["response"].get<std::string>();
    }
    if (body.contains("generated_text") && body["generated_text"].is_string()) {
        return body["generated_text"].get<std::string>();
    }
    // Some inference servers wrap the reply in a one-element array.
    if (body.is_array() && !body.empty() && body[0].is_object()) {
        return ExtractText(body[0]);
    }
    return std::nullopt;
}

std::optional<std::string> HttpGenerationClient::ExtractImagePayload(const json& body) {
    if (body.contains("data") && body["data"].is_array() && !body["data"].empty()) {
        const auto& first = body["data"][0];
        if (first.is_object() && first.contains("b64_json") && first["b64_json"].is_string()) {
            return first["b64_json"].get<std::string>();
        }
    }
    if (body.contains("images") && body["images"].is_array() && !body["images"].empty() &&
        body["images"][0].is_string()) {
        return body["images"][0].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> HttpGenerationClient::ExtractModelNames(const json& body) {
    std::vector<std::string> models;
    if (body.contains("data") && body["data"].is_array()) {
        for (const auto& item : body["data"]) {
            if (item.is_object() && item.contains("id") && item["id"].is_string()) {
                models.push_back(item["id"].get<std::string>());
            }
        }
    }
    if (body.contains("models") && body["models"].is_array()) {
        for (const auto& item : body["models"]) {
            if (item.is_object() && item.contains("name") && item["name"].is_string()) {
                models.push_back(item["name"].get<std::string>());
            }
        }
    }
    return models;
}

std::string HttpGenerationClient::PickServedModel(const std::vector<std::string>& served,
                                                  const std::string& preferred) {
    if (served.empty()) {
        return preferred;
    }

    if (!preferred.empty()) {
        if (std::find(served.begin(), served.end(), preferred) != served.end()) {
            return preferred;
        }
        const std::string tagged = preferred + ":";
        for (const auto& name : served) {
            if (name.rfind(tagged, 0) == 0) {
                return name;
            }
        }
    }

    for (const auto& family : kStorytellingFamilies) {
        for (const auto& name : served) {
            if (name.find(family) != std::string::npos) {
                return name;
            }
        }
    }
    return served.front();
}

} // namespace dreadloom::infrastructure
