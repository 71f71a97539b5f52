#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include "domain/PsychologicalProfile.hpp"

using dreadloom::domain::PsychologicalProfile;
using dreadloom::domain::TraitAnalysis;

namespace {

bool Near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

float TriggerSum(const PsychologicalProfile& profile) {
    float sum = 0.0f;
    for (const auto& [name, weight] : profile.getTriggerWeights()) {
        assert(weight >= 0.0f);
        sum += weight;
    }
    return sum;
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    for (const auto& v : values) {
        if (v == value) return true;
    }
    return false;
}

void TestInitialDistribution() {
    std::cout << "[Test] Initial trigger distribution..." << std::endl;
    PsychologicalProfile profile;
    assert(profile.getTriggerWeights().size() == 5);
    assert(Near(TriggerSum(profile), 1.0f));
    assert(Near(profile.triggerSensitivity("observation"), 0.4f / 1.5f));
    assert(profile.triggerSensitivity("unknown") == 0.0f);
}

void TestObserveShadowScenario() {
    std::cout << "[Test] Repeated observe_shadow raises paranoia..." << std::endl;
    PsychologicalProfile profile;
    profile.setFear(0.2f);
    profile.setObsession(0.1f);
    profile.setAggression(0.0f);

    float previous = profile.getParanoiaIndex();
    for (int i = 0; i < 4; ++i) {
        profile.recordChoice("observe_shadow", "corridor");
        float paranoia = profile.getParanoiaIndex();
        assert(paranoia > previous);
        assert(paranoia <= 1.0f);
        previous = paranoia;

        if (i == 0) {
            assert(profile.getEmotionalInstability() == 0.0f);
        } else {
            assert(profile.getEmotionalInstability() >= 0.0f);
        }
    }

    assert(Near(profile.getParanoiaIndex(), 0.12f));
    // No fear words were used, so fear keeps its starting value.
    assert(Near(profile.getFear(), 0.2f));
    // The fourth identical choice forms an obsessive pattern.
    assert(Near(profile.getObsession(), 0.2f));
    assert(profile.getChoiceFrequencies().at("observe_shadow") == 4);
    assert(Contains(profile.getActiveObsessions(), "corridor"));
    assert(profile.getBehaviorHistory().size() == 4);
}

void TestTriggerRenormalization() {
    std::cout << "[Test] recordTrigger keeps the distribution normalized..." << std::endl;
    PsychologicalProfile profile;
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> intensity(-0.5f, 1.5f);
    const char* names[] = {"isolation", "darkness", "paranoia", "mirrors", "silence"};

    for (int i = 0; i < 200; ++i) {
        profile.recordTrigger(names[i % 5], intensity(rng));
        assert(std::fabs(TriggerSum(profile) - 1.0f) <= 1e-4f);
    }
    assert(profile.getEmotionalTriggers().at("darkness").occurrences == 40);

    profile.recordTrigger("void", 0.0f);
    assert(std::fabs(TriggerSum(profile) - 1.0f) <= 1e-4f);
}

void TestBoundedness() {
    std::cout << "[Test] Traits and indices stay within [0,1]..." << std::endl;
    PsychologicalProfile profile;
    for (int i = 0; i < 100; ++i) {
        profile.recordChoice("attack", "door");
        profile.recordChoice("observe", "impossible geometry");
        profile.recordChoice("run", "unreal hallway");
    }
    for (float v : {profile.getFear(), profile.getObsession(), profile.getAggression(), profile.getCuriosity(),
                    profile.getParanoiaIndex(), profile.getRealityDistortion(), profile.getEmotionalInstability()}) {
        assert(v >= 0.0f && v <= 1.0f);
    }
    assert(Near(profile.getAggression(), 1.0f));
    assert(profile.getRealityDistortion() > 0.0f);
    assert(profile.getRecentChoices().size() == PsychologicalProfile::kMaxRecentChoices);
    assert(profile.getBehaviorHistory().size() == PsychologicalProfile::kMaxBehaviorHistory);
    assert(Near(TriggerSum(profile), 1.0f));

    profile.setFear(5.0f);
    assert(profile.getFear() == 1.0f);
    profile.setFear(-1.0f);
    assert(profile.getFear() == 0.0f);
}

void TestLexicalTraits() {
    std::cout << "[Test] Action verbs drive traits..." << std::endl;
    PsychologicalProfile profile;
    profile.recordChoice("run", "stairs");
    assert(Near(profile.getFear(), 0.25f));
    assert(profile.getEmotionalInstability() == 0.0f);

    profile.recordChoice("RUN", "stairs");
    assert(Near(profile.getFear(), 0.5f));
    // Fear moved between the two snapshots.
    assert(profile.getEmotionalInstability() > 0.0f);

    profile.recordChoice("examine", "painting");
    assert(Near(profile.getCuriosity(), 0.15f));
    assert(profile.getAggression() == 0.0f);
}

void TestDecayMonotonicity() {
    std::cout << "[Test] Decay never increases derived indices..." << std::endl;
    PsychologicalProfile profile;
    for (int i = 0; i < 10; ++i) {
        profile.recordChoice("observe", "impossible window");
        profile.recordChoice("run", "hall");
    }

    float paranoia = profile.getParanoiaIndex();
    float distortion = profile.getRealityDistortion();
    float instability = profile.getEmotionalInstability();
    assert(paranoia > 0.0f && distortion > 0.0f);

    for (int i = 0; i < 100; ++i) {
        profile.decay(0.25f);
        assert(profile.getParanoiaIndex() <= paranoia);
        assert(profile.getRealityDistortion() <= distortion);
        assert(profile.getEmotionalInstability() <= instability);
        assert(profile.getParanoiaIndex() >= 0.0f);
        assert(Near(TriggerSum(profile), 1.0f));
        paranoia = profile.getParanoiaIndex();
        distortion = profile.getRealityDistortion();
        instability = profile.getEmotionalInstability();
    }
    assert(profile.getParanoiaIndex() == 0.0f);

    float before = profile.getFear();
    profile.decay(0.0f);
    profile.decay(-1.0f);
    profile.decayTraits(-1.0f);
    assert(profile.getFear() == before);

    profile.decayTraits(100.0f);
    assert(profile.getFear() == 0.0f);
}

void TestAnalysisIsAllOrNothing() {
    std::cout << "[Test] Malformed analysis leaves the profile unchanged..." << std::endl;
    PsychologicalProfile profile;
    profile.setFear(0.4f);
    profile.setObsession(0.2f);
    profile.setAggression(0.1f);

    TraitAnalysis missing;
    missing.fear = 0.9f;
    missing.obsession = 0.9f;
    assert(!profile.applyAnalysis(missing));

    TraitAnalysis outOfRange;
    outOfRange.fear = 0.5f;
    outOfRange.obsession = 1.5f;
    outOfRange.aggression = 0.5f;
    assert(!profile.applyAnalysis(outOfRange));

    TraitAnalysis notANumber;
    notANumber.fear = std::numeric_limits<float>::quiet_NaN();
    notANumber.obsession = 0.5f;
    notANumber.aggression = 0.5f;
    assert(!profile.applyAnalysis(notANumber));

    assert(Near(profile.getFear(), 0.4f));
    assert(Near(profile.getObsession(), 0.2f));
    assert(Near(profile.getAggression(), 0.1f));

    TraitAnalysis valid;
    valid.fear = 1.0f;
    valid.obsession = 0.2f;
    valid.aggression = 0.0f;
    assert(profile.applyAnalysis(valid));
    assert(Near(profile.getFear(), 0.58f));
    assert(Near(profile.getObsession(), 0.2f));
    assert(Near(profile.getAggression(), 0.07f));
}

void TestPersistedStateAccessors() {
    std::cout << "[Test] Persisted state accessors..." << std::endl;
    PsychologicalProfile profile;
    profile.setChoiceFrequencies({{"Examine", 3}, {"hide", 0}});
    assert(profile.getChoiceFrequencies().size() == 1);
    assert(profile.getChoiceFrequencies().at("examine") == 3);

    profile.setActiveObsessions({"Mirror", ""});
    auto obsessions = profile.getActiveObsessions();
    assert(obsessions.size() == 1 && obsessions[0] == "mirror");

    std::string summary = profile.summary();
    assert(summary.find("Psychological State:") == 0);
    assert(summary.find("Fear Level: 0.00") != std::string::npos);
    assert(summary.find("Obsessions: mirror") != std::string::npos);
    assert(summary.find("Dominant Triggers: observation") != std::string::npos);

    // Restoring obsessions replaces the active set, including ones earned by play.
    for (int i = 0; i < 3; ++i) {
        profile.recordChoice("walk", "Stairs");
    }
    assert(Contains(profile.getActiveObsessions(), "stairs"));
    profile.setActiveObsessions({"mirror"});
    obsessions = profile.getActiveObsessions();
    assert(obsessions.size() == 1 && obsessions[0] == "mirror");
    profile.setActiveObsessions({});
    assert(profile.getActiveObsessions().empty());

    // A keyword cleared from the set becomes active again on its next occurrence.
    profile.recordChoice("walk", "stairs");
    obsessions = profile.getActiveObsessions();
    assert(obsessions.size() == 1 && obsessions[0] == "stairs");

    profile.setFear(0.9f);
    profile.setAggression(0.6f);
    auto dominant = profile.dominantTraits();
    assert(dominant.size() == 2 && dominant[0] == "Fear" && dominant[1] == "Aggression");
    assert(Near(profile.dominantTraitLevel(), 0.9f));

    profile.reset();
    assert(profile.getFear() == 0.0f);
    assert(profile.getActiveObsessions().empty());
    assert(profile.getChoiceFrequencies().empty());
    assert(Near(TriggerSum(profile), 1.0f));
}

} // namespace

int main() {
    std::cout << "[Test] Starting Profile Tracker Tests..." << std::endl;

    TestInitialDistribution();
    TestObserveShadowScenario();
    TestTriggerRenormalization();
    TestBoundedness();
    TestLexicalTraits();
    TestDecayMonotonicity();
    TestAnalysisIsAllOrNothing();
    TestPersistedStateAccessors();

    std::cout << "[PASS] Profile Tracker Tests." << std::endl;
    return 0;
}
