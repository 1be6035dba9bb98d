#ifndef PROPCURVES_CURVE_COLLECTION_HXX
#define PROPCURVES_CURVE_COLLECTION_HXX

#include "BreakpointCurve.hxx"
#include "Numeric.hxx"

#include <cstddef>
#include <utility>
#include <vector>

// CurveCollection: curves indexed by an external parameter (a route, an hour
// of the day, ...), kept sorted by key. Looking up a key between two stored
// keys interpolates the neighbouring curves with CurveMath::weightedAverage.
//
// K is any NumericTraits storage type; keys are compared as floats.
// C is the stored curve type (anything a CurveView accepts).
// Explicitly instantiated in CurveCollection.cxx for
// <float>, <SignedByte>, <UFix16> and <float, FixedStepCurve<>>.
template <class K = float, class C = BreakpointCurve<>>
class CurveCollection {
public:
    using Entry = std::pair<K, C>;

    std::size_t size() const;
    bool empty() const;
    const std::vector<Entry>& entries() const;

    // Throws std::out_of_range on an empty collection.
    float minKey() const;
    float maxKey() const;

    // Inserts in key order. Throws std::invalid_argument on a duplicate or NaN key.
    void addCurve(K key, C curve);

    // Interpolates the two curves around x. Outside the key range the two
    // nearest curves are extrapolated linearly (interpolation factor below 0
    // or above 1). This behaviour is not verified and may yield a curve that
    // violates monotonicity, in which case std::invalid_argument is thrown.
    // Throws std::out_of_range with fewer than two curves.
    BreakpointCurve<> curveAtXWithExtrapolation(float x) const;

    // At or below minKey() the first curve, at or above maxKey() the last
    // curve, interpolation in between. Throws std::out_of_range when empty.
    BreakpointCurve<> curveAtXWithContinuation(float x) const;

    // Interpolation strictly inside the key range. Throws std::out_of_range
    // when x is at or beyond either bound.
    BreakpointCurve<> curveAtX(float x) const;

private:
    BreakpointCurve<> interpolate(float x, std::size_t start, std::size_t end) const;

    std::vector<Entry> curves_;
};

#endif // PROPCURVES_CURVE_COLLECTION_HXX
