/**
 * @file ShapeCurve.hpp
 * @brief Keyframed cubic Hermite curve describing how a tension event evolves over time.
 */

#pragma once
#include <vector>

namespace dreadloom::domain {

/**
 * @struct CurveKey
 * @brief A curve control point with incoming/outgoing slopes.
 */
struct CurveKey {
    float time = 0.0f;
    float value = 0.0f;
    float inTangent = 0.0f;
    float outTangent = 0.0f;
};

/**
 * @class ShapeCurve
 * @brief Evaluates a piecewise Hermite spline over normalized time.
 *
 * Outside the key range the curve holds the first/last key value.
 */
class ShapeCurve {
public:
    ShapeCurve() = default;
    explicit ShapeCurve(std::vector<CurveKey> keys);

    /** @brief Inserts a key keeping keys ordered by time. */
    void addKey(const CurveKey& key);

    /** @brief Samples the curve at @p t. Throws std::logic_error if the curve has no keys. */
    float evaluate(float t) const;

    const std::vector<CurveKey>& keys() const { return m_keys; }
    bool empty() const { return m_keys.empty(); }

    /** @brief Fast rise, slow decay. Used for positive tension. */
    static ShapeCurve Surge();

    /** @brief Smooth dip and recovery. Used for relief (negative) tension. */
    static ShapeCurve Relief();

    /** @brief Picks Surge or Relief from the sign of @p amount. */
    static ShapeCurve ForAmount(float amount);

private:
    std::vector<CurveKey> m_keys;
};

} // namespace dreadloom::domain
