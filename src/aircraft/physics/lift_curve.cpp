#include "aircraft/physics/lift_curve.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace contrail {

namespace {
constexpr float kHalfPi = 1.57079632679f;
constexpr float kDefaultStall = 0.26f;
constexpr float kPostStallSpan = 0.35f;
constexpr float kRadToDeg = static_cast<float>(PhysicsConstants::RAD_TO_DEG);
constexpr float kDegToRad = static_cast<float>(PhysicsConstants::DEG_TO_RAD);

float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}
}

LiftCurve::LiftCurve() {
    configureLinear(LinearLiftParams{});
}

LiftCurve LiftCurve::linear(const LinearLiftParams& params) {
    LiftCurve curve;
    curve.configureLinear(params);
    return curve;
}

void LiftCurve::configureLinear(const LinearLiftParams& params) {
    m_kind = Kind::Linear;
    m_linear = params;
    m_knotsDeg.clear();
    m_elements.clear();

    float stallPos = params.stallAlpha;
    if (!(stallPos > 0.0f) || !std::isfinite(stallPos)) {
        stallPos = kDefaultStall;
    }
    stallPos = std::min(stallPos, kHalfPi - 0.02f);

    float stallNeg = params.stallAlphaNeg;
    if (!(stallNeg < 0.0f) || !std::isfinite(stallNeg)) {
        stallNeg = -stallPos;
    }
    stallNeg = std::max(stallNeg, -(kHalfPi - 0.02f));

    float postPos = params.postStallAlpha;
    if (!(postPos > stallPos) || !std::isfinite(postPos)) {
        postPos = stallPos + kPostStallSpan;
    }
    postPos = std::min(postPos, kHalfPi - 0.01f);
    float postNeg = std::max(stallNeg - (postPos - stallPos), -(kHalfPi - 0.01f));

    if (!std::isfinite(m_linear.cl0)) m_linear.cl0 = 0.0f;
    if (!std::isfinite(m_linear.clAlpha)) m_linear.clAlpha = 0.0f;

    float clMax = m_linear.cl0 + m_linear.clAlpha * stallPos;
    float clMin = m_linear.cl0 + m_linear.clAlpha * stallNeg;

    // Post-stall values must not exceed the peak, otherwise CL would keep rising past stall.
    float postValue = std::isfinite(params.clPostStall) ? params.clPostStall : 0.0f;
    m_linear.clPostStall = std::clamp(postValue, std::min(0.0f, clMax), std::max(0.0f, clMax));
    float postValueNeg = std::isfinite(params.clPostStallNeg) ? params.clPostStallNeg : 0.0f;
    m_linear.clPostStallNeg = std::clamp(postValueNeg, std::min(0.0f, clMin), std::max(0.0f, clMin));

    m_stallPos = stallPos;
    m_stallNeg = stallNeg;
    m_postStallPos = postPos;
    m_postStallNeg = postNeg;
}

LiftCurve LiftCurve::table(std::vector<float> knotsDeg, std::vector<float> elements) {
    if (knotsDeg.size() < 2) {
        throw std::invalid_argument("lift table needs at least two knots");
    }
    if (knotsDeg.size() != elements.size()) {
        throw std::invalid_argument("lift table has " + std::to_string(knotsDeg.size()) +
                                    " knots but " + std::to_string(elements.size()) + " elements");
    }
    for (std::size_t i = 0; i < knotsDeg.size(); ++i) {
        if (!std::isfinite(knotsDeg[i]) || !std::isfinite(elements[i])) {
            throw std::invalid_argument("lift table contains a non-finite value");
        }
        if (i > 0 && !(knotsDeg[i] > knotsDeg[i - 1])) {
            throw std::invalid_argument("lift table knots must be strictly increasing");
        }
    }

    LiftCurve curve;
    curve.m_kind = Kind::Table;
    curve.m_knotsDeg = std::move(knotsDeg);
    curve.m_elements = std::move(elements);
    return curve;
}

float LiftCurve::evaluate(float alphaRad) const {
    if (!std::isfinite(alphaRad)) {
        return 0.0f;
    }
    if (m_kind == Kind::Table) {
        return evaluateTable(alphaRad * kRadToDeg);
    }
    return evaluateLinear(alphaRad);
}

float LiftCurve::evaluateLinear(float alpha) const {
    const LinearLiftParams& p = m_linear;
    if (std::abs(alpha) >= kHalfPi) {
        return 0.0f;
    }

    if (alpha > m_stallPos) {
        float clMax = p.cl0 + p.clAlpha * m_stallPos;
        if (alpha <= m_postStallPos) {
            float t = (alpha - m_stallPos) / std::max(m_postStallPos - m_stallPos, 0.001f);
            return lerp(clMax, p.clPostStall, std::clamp(t, 0.0f, 1.0f));
        }
        float t = (alpha - m_postStallPos) / std::max(kHalfPi - m_postStallPos, 0.001f);
        return lerp(p.clPostStall, 0.0f, std::clamp(t, 0.0f, 1.0f));
    }

    if (alpha < m_stallNeg) {
        float clMin = p.cl0 + p.clAlpha * m_stallNeg;
        if (alpha >= m_postStallNeg) {
            float t = (alpha - m_stallNeg) / std::min(m_postStallNeg - m_stallNeg, -0.001f);
            return lerp(clMin, p.clPostStallNeg, std::clamp(t, 0.0f, 1.0f));
        }
        float t = (alpha - m_postStallNeg) / std::min(-kHalfPi - m_postStallNeg, -0.001f);
        return lerp(p.clPostStallNeg, 0.0f, std::clamp(t, 0.0f, 1.0f));
    }

    return p.cl0 + p.clAlpha * alpha;
}

float LiftCurve::evaluateTable(float alphaDeg) const {
    if (alphaDeg <= m_knotsDeg.front()) {
        return m_elements.front();
    }
    if (alphaDeg >= m_knotsDeg.back()) {
        return m_elements.back();
    }

    auto upper = std::upper_bound(m_knotsDeg.begin(), m_knotsDeg.end(), alphaDeg);
    std::size_t hi = static_cast<std::size_t>(upper - m_knotsDeg.begin());
    std::size_t lo = hi - 1;
    float t = (alphaDeg - m_knotsDeg[lo]) / (m_knotsDeg[hi] - m_knotsDeg[lo]);
    return lerp(m_elements[lo], m_elements[hi], t);
}

float LiftCurve::stallAngle() const {
    if (m_kind == Kind::Linear) {
        return m_stallPos;
    }
    auto peak = std::max_element(m_elements.begin(), m_elements.end());
    std::size_t index = static_cast<std::size_t>(peak - m_elements.begin());
    return m_knotsDeg[index] * kDegToRad;
}

float LiftCurve::liftSlope() const {
    if (m_kind == Kind::Linear) {
        return m_linear.clAlpha;
    }
    constexpr float kProbe = 1.0f * kDegToRad;
    return (evaluate(kProbe) - evaluate(-kProbe)) / (2.0f * kProbe);
}

float LiftCurve::maxCoefficient() const {
    if (m_kind == Kind::Linear) {
        return m_linear.cl0 + m_linear.clAlpha * m_stallPos;
    }
    return *std::max_element(m_elements.begin(), m_elements.end());
}

}
