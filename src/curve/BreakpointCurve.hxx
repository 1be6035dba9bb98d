#ifndef PROPCURVES_BREAKPOINT_CURVE_HXX
#define PROPCURVES_BREAKPOINT_CURVE_HXX

#include "Curve.hxx"
#include "Numeric.hxx"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

// Compact binary format constants (see encode()).
constexpr std::uint8_t kCompactFormatTag = 1;
constexpr std::size_t kCompactHeaderBytes = 10;
constexpr std::size_t kCompactMaxPoints = 255;

// A proportion curve defined by irregular breakpoints joined linearly.
// Notes:
// - Points are strictly increasing in x and non-decreasing in y.
// - The first point has y == 0 and the last y == 1 (values within
//   kSnapEpsilon are snapped on construction).
// - X and Y are the storage types; all math happens in float.
// - addPoint/simplify/simplifyFixed edit the point list in place and keep
//   every invariant; they throw instead of leaving a broken curve behind.
// - Explicitly instantiated in BreakpointCurve.cxx for X in {float, SignedByte}
//   and Y in {float, UFix8, UFix16, Half}.
template <class X = float, class Y = float>
class BreakpointCurve {
public:
    struct Point {
        X x;
        Y y;
    };

    // Accepts points in any order. Throws std::invalid_argument if the sorted
    // points violate the invariants above.
    explicit BreakpointCurve(std::vector<CurvePoint> points);

    static BreakpointCurve fromTyped(std::vector<Point> points);

    std::size_t size() const;
    const std::vector<Point>& points() const;

    // Query contract (canonical float). O(log n).
    float minX() const;
    float maxX() const;
    float yAtX(float x) const;  // 0 below minX, 1 above maxX
    float xAtY(float y) const;  // throws std::invalid_argument unless 0 <= y <= 1

    // Index of the left point of the segment containing x (or y),
    // clamped to [0, size() - 1].
    std::size_t indexAtX(float x) const;
    std::size_t indexAtY(float y) const;

    std::vector<CurvePoint> valuesAsPairs() const;
    std::pair<std::vector<float>, std::vector<float>> valuesAsVectors() const;
    std::vector<float> xValues() const;

    // Inserts (x, y) in x order. Throws std::invalid_argument on a duplicate x,
    // an x outside [minX, maxX], or a y outside its neighbours' range.
    void addPoint(float x, float y);

    // Douglas-Peucker reduction: drops every point whose removal keeps the
    // curve within `tolerance` (perpendicular distance) of the original.
    void simplify(float tolerance);

    // Removes the least significant middle points until size() <= maxPoints.
    // Throws std::invalid_argument if maxPoints < 2.
    void simplifyFixed(std::size_t maxPoints);

    // Quantized byte form:
    //   [0]      format tag (1)
    //   [1..4]   minX, float32 little-endian
    //   [5..8]   maxX, float32 little-endian
    //   [9]      point count n
    //   [10+2i]  round((x - minX) / (maxX - minX) * 255)
    //   [11+2i]  round(y * 255)
    // Throws std::length_error for more than 255 points.
    std::vector<std::uint8_t> encode() const;

    // Like encode(), but first reduces a copy with simplifyFixed() when the
    // full curve would not fit into maxBytes. Throws std::invalid_argument
    // when maxBytes cannot hold two points.
    std::vector<std::uint8_t> encodeLimited(std::size_t maxBytes) const;

    // Inverse of encode(). Consecutive points with the same x byte collapse
    // into the first point of the run, so the result may hold fewer points
    // than were encoded. When the collapsed run is the last one, its point
    // takes the final y instead so the curve still ends at y = 1.
    // Throws std::invalid_argument on a malformed buffer.
    static BreakpointCurve decode(const std::vector<std::uint8_t>& bytes);

    // One-line description with the x positions of y = 0, 5%, 50%, 95%, 1.
    std::string summary() const;

private:
    void validate() const;

    std::pair<std::size_t, float> searchByX(float x, std::size_t start, std::size_t end) const;
    std::pair<std::size_t, float> searchByY(float y, std::size_t start, std::size_t end) const;
    void simplifyRange(float tolerance, std::size_t start, std::size_t end, std::vector<char>& keep) const;

    std::vector<Point> points_;
};

template <class X, class Y>
inline std::ostream& operator<<(std::ostream& os, const BreakpointCurve<X, Y>& c) {
    return os << c.summary();
}

#endif // PROPCURVES_BREAKPOINT_CURVE_HXX
