#ifndef PROPCURVES_CURVE_MATH_HXX
#define PROPCURVES_CURVE_MATH_HXX

#include "BreakpointCurve.hxx"
#include "Curve.hxx"

#include <vector>

namespace CurveMath {

// Sorted union of the x values of all curves, duplicates removed.
std::vector<float> mergedXValues(const std::vector<CurveView>& curves);

// Weighted average of any mix of curves, evaluated on the union of their
// breakpoints; weights are normalised to sum to one. The result is passed
// through simplify(0).
// Throws std::invalid_argument if curves and weights differ in size, if no
// curve is given, or if the weights sum to zero.
BreakpointCurve<> weightedAverage(const std::vector<CurveView>& curves, const std::vector<float>& weights);

// Equal-weight average.
BreakpointCurve<> average(const std::vector<CurveView>& curves);

// Area enclosed between the graphs of a and b.
float distance(CurveView a, CurveView b);

} // namespace CurveMath

#endif // PROPCURVES_CURVE_MATH_HXX
