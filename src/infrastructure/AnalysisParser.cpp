#include "infrastructure/AnalysisParser.hpp"
#include <nlohmann/json.hpp>

namespace dreadloom::infrastructure {

using json = nlohmann::json;

namespace {

bool ReadTrait(const json& obj, const char* key, std::optional<float>& out, std::vector<std::string>& errors) {
    if (!obj.contains(key)) {
        errors.push_back(std::string("missing '") + key + "'");
        return false;
    }
    if (!obj[key].is_number()) {
        errors.push_back(std::string("'") + key + "' is not a number");
        return false;
    }
    out = obj[key].get<float>();
    return true;
}

} // namespace

std::string AnalysisParser::ExtractJsonObject(const std::string& response) {
    auto open = response.find('{');
    auto close = response.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return {};
    }
    return response.substr(open, close - open + 1);
}

std::optional<domain::TraitAnalysis> AnalysisParser::Parse(const std::string& response,
                                                           std::vector<std::string>* errors) {
    std::vector<std::string> localErrors;
    std::vector<std::string>& errs = errors ? *errors : localErrors;

    std::string payload = ExtractJsonObject(response);
    if (payload.empty()) {
        errs.push_back("no JSON object in response");
        return std::nullopt;
    }

    json data;
    try {
        data = json::parse(payload);
    } catch (const std::exception& e) {
        errs.push_back(std::string("invalid JSON: ") + e.what());
        return std::nullopt;
    }

    domain::TraitAnalysis analysis;
    bool ok = ReadTrait(data, "fear", analysis.fear, errs);
    ok = ReadTrait(data, "obsession", analysis.obsession, errs) && ok;
    ok = ReadTrait(data, "aggression", analysis.aggression, errs) && ok;
    if (!ok) {
        return std::nullopt;
    }

    if (data.contains("notes") && data["notes"].is_string()) {
        analysis.notes = data["notes"].get<std::string>();
    }
    return analysis;
}

} // namespace dreadloom::infrastructure
