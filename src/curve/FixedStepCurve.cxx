// Implementation for FixedStepCurve
#include "FixedStepCurve.hxx"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

template <class X, class Y>
FixedStepCurve<X, Y>::FixedStepCurve(float step, float origin, const std::vector<float>& samples)
    : step_(fromFloat<X>(step)),
      origin_(fromFloat<X>(origin)) {
    samples_.reserve(samples.size());
    for (float s : samples) samples_.push_back(fromFloat<Y>(s));
    validate();
}

template <class X, class Y>
FixedStepCurve<X, Y> FixedStepCurve<X, Y>::fromTyped(X step, X origin, std::vector<Y> samples) {
    FixedStepCurve c;
    c.step_ = step;
    c.origin_ = origin;
    c.samples_ = std::move(samples);
    c.validate();
    return c;
}

template <class X, class Y>
void FixedStepCurve<X, Y>::validate() const {
    if (samples_.size() < 2) {
        throw std::invalid_argument("FixedStepCurve: at least two samples are required");
    }
    if (!(toFloat(step_) > 0.0f)) {
        throw std::invalid_argument("FixedStepCurve: step must be positive");
    }
    for (std::size_t i = 1; i < samples_.size(); ++i) {
        if (toFloat(samples_[i]) < toFloat(samples_[i - 1])) {
            throw std::invalid_argument("FixedStepCurve: samples decrease at index " + std::to_string(i));
        }
    }
    if (std::fabs(toFloat(samples_.front())) > kSnapEpsilon) {
        throw std::invalid_argument("FixedStepCurve: first sample does not define y = 0");
    }
    if (std::fabs(toFloat(samples_.back()) - 1.0f) > kSnapEpsilon) {
        throw std::invalid_argument("FixedStepCurve: last sample does not define y = 1");
    }
}

template <class X, class Y>
float FixedStepCurve<X, Y>::step() const { return toFloat(step_); }

template <class X, class Y>
float FixedStepCurve<X, Y>::origin() const { return toFloat(origin_); }

template <class X, class Y>
std::size_t FixedStepCurve<X, Y>::size() const { return samples_.size(); }

template <class X, class Y>
const std::vector<Y>& FixedStepCurve<X, Y>::samples() const { return samples_; }

template <class X, class Y>
float FixedStepCurve<X, Y>::minX() const { return toFloat(origin_); }

template <class X, class Y>
float FixedStepCurve<X, Y>::maxX() const {
    return toFloat(origin_) + toFloat(step_) * static_cast<float>(samples_.size() - 1);
}

template <class X, class Y>
float FixedStepCurve<X, Y>::yAtX(float x) const {
    if (x <= minX()) return toFloat(samples_.front());
    if (x >= maxX()) return toFloat(samples_.back());

    const float i = (x - minX()) / toFloat(step_);
    const std::size_t last = samples_.size() - 1;
    const std::size_t iMin = std::min(static_cast<std::size_t>(std::floor(i)), last);
    const std::size_t iMax = std::min(static_cast<std::size_t>(std::ceil(i)), last);
    if (iMin == iMax) return toFloat(samples_[iMin]);

    const float a = i - std::floor(i);
    return toFloat(samples_[iMin]) * (1.0f - a) + toFloat(samples_[iMax]) * a;
}

template <class X, class Y>
float FixedStepCurve<X, Y>::xAtY(float y) const {
    if (!(y >= 0.0f && y <= 1.0f)) {
        throw std::invalid_argument("FixedStepCurve: y must lie in [0, 1]");
    }
    if (y == 0.0f) return minX();
    if (y == 1.0f) return maxX();

    const float s = toFloat(step_);
    for (std::size_t i = 0; i < samples_.size(); ++i) {
        const float vr = toFloat(samples_[i]);
        if (vr == y) return minX() + static_cast<float>(i) * s;
        if (vr > y) {
            if (i == 0) throw std::logic_error("FixedStepCurve: first sample lies above the requested y");
            const float vl = toFloat(samples_[i - 1]);
            const float a = (y - vl) / (vr - vl);
            return minX() + (static_cast<float>(i - 1) + a) * s;
        }
    }
    throw std::logic_error("FixedStepCurve: no sample pair brackets y = " + std::to_string(y));
}

template <class X, class Y>
std::vector<CurvePoint> FixedStepCurve<X, Y>::valuesAsPairs() const {
    std::vector<CurvePoint> out;
    out.reserve(samples_.size());
    const float x0 = minX();
    const float s = toFloat(step_);
    for (std::size_t i = 0; i < samples_.size(); ++i) {
        out.push_back(CurvePoint{x0 + static_cast<float>(i) * s, toFloat(samples_[i])});
    }
    return out;
}

template <class X, class Y>
std::pair<std::vector<float>, std::vector<float>> FixedStepCurve<X, Y>::valuesAsVectors() const {
    std::pair<std::vector<float>, std::vector<float>> out;
    out.first = xValues();
    out.second.reserve(samples_.size());
    for (const Y& v : samples_) out.second.push_back(toFloat(v));
    return out;
}

template <class X, class Y>
std::vector<float> FixedStepCurve<X, Y>::xValues() const {
    std::vector<float> out(samples_.size());
    const float x0 = minX();
    const float s = toFloat(step_);
    for (std::size_t i = 0; i < samples_.size(); ++i) out[i] = x0 + static_cast<float>(i) * s;
    return out;
}

template <class X, class Y>
X FixedStepCurve<X, Y>::typedMinX() const { return origin_; }

template <class X, class Y>
X FixedStepCurve<X, Y>::typedMaxX() const { return fromFloat<X>(maxX()); }

template <class X, class Y>
Y FixedStepCurve<X, Y>::typedYAtX(X x) const { return fromFloat<Y>(yAtX(toFloat(x))); }

template <class X, class Y>
X FixedStepCurve<X, Y>::typedXAtY(Y y) const { return fromFloat<X>(xAtY(toFloat(y))); }

template class FixedStepCurve<float, float>;
template class FixedStepCurve<float, UFix8>;
template class FixedStepCurve<float, UFix16>;
template class FixedStepCurve<float, Half>;
template class FixedStepCurve<SignedByte, float>;
template class FixedStepCurve<SignedByte, UFix8>;
template class FixedStepCurve<SignedByte, UFix16>;
template class FixedStepCurve<SignedByte, Half>;
