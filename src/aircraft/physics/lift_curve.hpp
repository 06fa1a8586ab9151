#pragma once

#include <vector>

namespace contrail {

/**
 * @brief Linear lift-curve slope with a stall break and post-stall falloff.
 *
 * Angles are in radians. Between the stall angles CL = cl0 + clAlpha * alpha.
 * Past stall CL blends toward clPostStall at postStallAlpha, then decays to
 * zero at +/-90 degrees.
 */
struct LinearLiftParams {
    float cl0 = 0.0f;
    float clAlpha = 5.5f;
    float stallAlpha = 0.26f;
    float stallAlphaNeg = 0.0f;    // <= 0 mirrors stallAlpha
    float postStallAlpha = 0.0f;   // <= stallAlpha uses stallAlpha + 0.35
    float clPostStall = 0.6f;
    float clPostStallNeg = -0.6f;
};

class LiftCurve {
public:
    enum class Kind { Linear, Table };

    LiftCurve();

    static LiftCurve linear(const LinearLiftParams& params);

    // Piecewise-linear table; knots in degrees, strictly increasing.
    // Throws std::invalid_argument on an empty, mismatched or unsorted table.
    static LiftCurve table(std::vector<float> knotsDeg, std::vector<float> elements);

    // Always finite; non-finite or |alpha| >= 90 deg yields the table edge or zero.
    float evaluate(float alphaRad) const;

    // Positive angle of maximum CL, in radians.
    float stallAngle() const;

    // Slope around zero angle of attack, per radian.
    float liftSlope() const;

    float maxCoefficient() const;

    Kind kind() const { return m_kind; }

private:
    void configureLinear(const LinearLiftParams& params);
    float evaluateLinear(float alpha) const;
    float evaluateTable(float alphaDeg) const;

    Kind m_kind = Kind::Linear;
    LinearLiftParams m_linear;
    float m_stallPos = 0.0f;
    float m_stallNeg = 0.0f;
    float m_postStallPos = 0.0f;
    float m_postStallNeg = 0.0f;

    std::vector<float> m_knotsDeg;
    std::vector<float> m_elements;
};

}
