/**
 * @file ShapeCurve.cpp
 * @brief Implementation of ShapeCurve.
 */

#include "domain/ShapeCurve.hpp"
#include <algorithm>
#include <stdexcept>

namespace dreadloom::domain {

ShapeCurve::ShapeCurve(std::vector<CurveKey> keys) : m_keys(std::move(keys)) {
    std::sort(m_keys.begin(), m_keys.end(),
              [](const CurveKey& a, const CurveKey& b) { return a.time < b.time; });
}

void ShapeCurve::addKey(const CurveKey& key) {
    auto pos = std::upper_bound(m_keys.begin(), m_keys.end(), key,
                                [](const CurveKey& a, const CurveKey& b) { return a.time < b.time; });
    m_keys.insert(pos, key);
}

float ShapeCurve::evaluate(float t) const {
    if (m_keys.empty()) {
        throw std::logic_error("ShapeCurve::evaluate on a curve without keys");
    }
    if (t <= m_keys.front().time) return m_keys.front().value;
    if (t >= m_keys.back().time) return m_keys.back().value;

    auto upper = std::upper_bound(m_keys.begin(), m_keys.end(), t,
                                  [](float value, const CurveKey& key) { return value < key.time; });
    const CurveKey& k1 = *upper;
    const CurveKey& k0 = *(upper - 1);

    float dt = k1.time - k0.time;
    if (dt <= 0.0f) return k1.value;

    float s = (t - k0.time) / dt;
    float s2 = s * s;
    float s3 = s2 * s;

    float h00 = 2.0f * s3 - 3.0f * s2 + 1.0f;
    float h10 = s3 - 2.0f * s2 + s;
    float h01 = -2.0f * s3 + 3.0f * s2;
    float h11 = s3 - s2;

    return h00 * k0.value + h10 * dt * k0.outTangent + h01 * k1.value + h11 * dt * k1.inTangent;
}

ShapeCurve ShapeCurve::Surge() {
    return ShapeCurve({
        {0.0f, 0.0f, 2.0f, 2.0f},
        {0.3f, 0.8f, 0.0f, 0.0f},
        {0.7f, 0.9f, 0.0f, 0.0f},
        {1.0f, 0.0f, -0.5f, -0.5f}
    });
}

ShapeCurve ShapeCurve::Relief() {
    // Sign comes from the (negative) event amount.
    return ShapeCurve({
        {0.0f, 0.0f, 0.5f, 0.5f},
        {0.5f, 0.5f, 0.0f, 0.0f},
        {1.0f, 0.0f, -0.5f, -0.5f}
    });
}

ShapeCurve ShapeCurve::ForAmount(float amount) {
    return amount > 0.0f ? Surge() : Relief();
}

} // namespace dreadloom::domain
