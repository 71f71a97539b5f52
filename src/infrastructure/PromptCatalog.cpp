#include "infrastructure/PromptCatalog.hpp"
#include <iomanip>
#include <sstream>

namespace dreadloom::infrastructure {

namespace {

std::string FormatLevel(float value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

std::string ObsessionLine(const domain::PsychologicalProfile& profile) {
    auto obsessions = profile.getActiveObsessions();
    if (obsessions.empty()) return {};

    std::string line = "The player keeps returning to: ";
    for (std::size_t i = 0; i < obsessions.size(); ++i) {
        if (i > 0) line += ", ";
        line += obsessions[i];
    }
    return line + ".\n";
}

} // namespace

std::string PromptCatalog::GetEventContextType(domain::TensionSeverity severity) {
    switch (severity) {
    case domain::TensionSeverity::Subtle:
        return "event_generation";
    case domain::TensionSeverity::Moderate:
        return "psychological_impact";
    case domain::TensionSeverity::Intense:
        return "manifestation";
    }
    return "event_generation";
}

std::string PromptCatalog::GetEventPrompt(domain::TensionSeverity severity,
                                          const domain::PsychologicalProfile& profile,
                                          float tension) {
    std::ostringstream ss;
    switch (severity) {
    case domain::TensionSeverity::Subtle:
        ss << "You are the unseen narrator of a psychological horror game.\n"
           << "Describe one small, easily dismissed anomaly in the player's surroundings: "
           << "a sound slightly out of place, an object that was not there before.\n"
           << "Two sentences at most. Never name the threat.\n";
        break;

    case domain::TensionSeverity::Moderate:
        ss << "You are the unseen narrator of a psychological horror game.\n";
        if (profile.getFear() > profile.getObsession()) {
            ss << "The atmosphere grows heavy with tension. Describe the growing certainty "
               << "that something is watching the player.\n";
        } else {
            ss << "Reality begins to waver. Describe the room subtly contradicting "
               << "what the player remembers about it.\n";
        }
        ss << "Three sentences at most, second person.\n";
        break;

    case domain::TensionSeverity::Intense:
        ss << "You are the unseen narrator of a psychological horror game.\n"
           << "The room twists impossibly and the player's fears take physical form.\n"
           << "Describe the manifestation in vivid second person, shaped by the fears below. "
           << "One short paragraph.\n";
        break;
    }

    ss << "Current tension: " << FormatLevel(tension) << "\n";
    ss << ObsessionLine(profile);
    return ss.str();
}

std::string PromptCatalog::GetRoomPrompt(const std::string& archetype, int levelNumber, const std::string& theme) {
    std::ostringstream ss;
    ss << "Describe a " << archetype << " on level " << levelNumber
       << " of a psychological horror game. The level's theme is " << theme << ".\n"
       << "Use the words '" << archetype << "' and '" << theme << "' in the description.\n"
       << "Focus on light, sound and one wrong detail. One paragraph, second person.\n";
    return ss.str();
}

std::string PromptCatalog::GetAnalysisPrompt(const std::vector<domain::BehaviorSnapshot>& recent) {
    std::ostringstream ss;
    ss << "Analyze the player's recent behavior in a horror game and estimate their state.\n\n"
       << "Recent actions (oldest first):\n";
    if (recent.empty()) {
        ss << "- (none)\n";
    }
    for (const auto& snapshot : recent) {
        ss << "- " << snapshot.action;
        if (!snapshot.context.empty()) {
            ss << " -> " << snapshot.context;
        }
        ss << " (fear " << FormatLevel(snapshot.fear)
           << ", paranoia " << FormatLevel(snapshot.paranoia) << ")\n";
    }
    ss << "\nREPLY WITH JSON ONLY, no prose, exactly this shape:\n"
       << "{\"fear\": <0..1>, \"obsession\": <0..1>, \"aggression\": <0..1>, \"notes\": \"<one sentence>\"}\n";
    return ss.str();
}

std::string PromptCatalog::GetImagePrompt(const std::string& description, float tension) {
    std::ostringstream ss;
    ss << "Dark, grainy, photographic still of: " << description << ". ";
    if (tension > 0.7f) {
        ss << "Distorted perspective, deep shadows, something barely visible at the edge of frame.";
    } else if (tension > 0.3f) {
        ss << "Dim light, heavy shadows, unsettling stillness.";
    } else {
        ss << "Muted colors, quiet and empty.";
    }
    ss << " No text, no people in focus.";
    return ss.str();
}

} // namespace dreadloom::infrastructure
