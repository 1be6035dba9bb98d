#ifndef PROPCURVES_FIXED_STEP_CURVE_HXX
#define PROPCURVES_FIXED_STEP_CURVE_HXX

#include "Curve.hxx"
#include "Numeric.hxx"

#include <cstddef>
#include <utility>
#include <vector>

// A proportion curve sampled at evenly spaced x positions.
// Notes:
// - Sample i sits at x = origin + i * step.
// - X is the storage type of origin and step, Y the storage type of samples.
//   All queries compute in float (see NumericTraits).
// - Samples are non-decreasing; the first is ~0 and the last ~1.
// - Immutable after construction.
// - Explicitly instantiated in FixedStepCurve.cxx for X in {float, SignedByte}
//   and Y in {float, UFix8, UFix16, Half}.
template <class X = float, class Y = float>
class FixedStepCurve {
public:
    // Throws std::invalid_argument for fewer than two samples, step <= 0,
    // decreasing samples, or end samples not at 0 / 1.
    FixedStepCurve(float step, float origin, const std::vector<float>& samples);

    // Same validation, values already in storage form.
    static FixedStepCurve fromTyped(X step, X origin, std::vector<Y> samples);

    float step() const;
    float origin() const;
    std::size_t size() const;
    const std::vector<Y>& samples() const;

    // Query contract (canonical float)
    float minX() const;
    float maxX() const;

    // Clamps to the first/last sample outside [minX, maxX]; O(1).
    float yAtX(float x) const;

    // Throws std::invalid_argument unless 0 <= y <= 1. On a run of equal
    // samples the position of the first one is returned.
    float xAtY(float y) const;

    std::vector<CurvePoint> valuesAsPairs() const;
    std::pair<std::vector<float>, std::vector<float>> valuesAsVectors() const;
    std::vector<float> xValues() const;

    // Queries returning storage-typed values
    X typedMinX() const;
    X typedMaxX() const;
    Y typedYAtX(X x) const;
    X typedXAtY(Y y) const;

private:
    FixedStepCurve() = default;
    void validate() const;

    X step_{};
    X origin_{};
    std::vector<Y> samples_;
};

#endif // PROPCURVES_FIXED_STEP_CURVE_HXX
