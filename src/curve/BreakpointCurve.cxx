// Implementation for BreakpointCurve
#include "BreakpointCurve.hxx"
#include "Log.hxx"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace {
static inline std::uint8_t quantize(float v) {
    const long q = std::lround(v * 255.0f);
    return static_cast<std::uint8_t>(std::max(0L, std::min(255L, q)));
}

static void appendFloatLE(std::vector<std::uint8_t>& out, float f) {
    std::uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    for (int shift = 0; shift < 32; shift += 8) out.push_back(static_cast<std::uint8_t>(u >> shift));
}

static float readFloatLE(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
    std::uint32_t u = 0;
    for (int k = 0; k < 4; ++k) u |= static_cast<std::uint32_t>(bytes[offset + k]) << (8 * k);
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

// Saturates to the int range; NaN maps to 0
static inline int saturatingInt(float v) {
    if (std::isnan(v)) return 0;
    if (v >= 2147483648.0f) return INT_MAX;
    if (v <= -2147483648.0f) return INT_MIN;
    return static_cast<int>(v);
}

// |(p - s) . n| / |n|, where n is normal to the line through s and e
static inline float lineDistance(const CurvePoint& s, const CurvePoint& e, const CurvePoint& p) {
    const float nx = s[1] - e[1];
    const float ny = e[0] - s[0];
    return std::fabs((p[0] - s[0]) * nx + (p[1] - s[1]) * ny) / std::sqrt(nx * nx + ny * ny);
}
}

template <class X, class Y>
static inline CurvePoint asFloat(const typename BreakpointCurve<X, Y>::Point& p) {
    return CurvePoint{toFloat(p.x), toFloat(p.y)};
}

template <class X, class Y>
BreakpointCurve<X, Y>::BreakpointCurve(std::vector<CurvePoint> points) {
    for (const auto& p : points) {
        if (std::isnan(p[0]) || std::isnan(p[1])) throw std::invalid_argument("BreakpointCurve: NaN coordinate");
    }
    std::stable_sort(points.begin(), points.end(),
                     [](const CurvePoint& a, const CurvePoint& b) { return a[0] < b[0]; });
    points_.reserve(points.size());
    for (const auto& p : points) points_.push_back(Point{fromFloat<X>(p[0]), fromFloat<Y>(p[1])});

    // Snap ends that are almost 0 / 1
    if (!points_.empty()) {
        if (std::fabs(toFloat(points_.front().y)) < kSnapEpsilon) points_.front().y = fromFloat<Y>(0.0f);
        if (std::fabs(toFloat(points_.back().y) - 1.0f) < kSnapEpsilon) points_.back().y = fromFloat<Y>(1.0f);
    }
    validate();
}

template <class X, class Y>
BreakpointCurve<X, Y> BreakpointCurve<X, Y>::fromTyped(std::vector<Point> points) {
    std::vector<CurvePoint> pts;
    pts.reserve(points.size());
    for (const auto& p : points) pts.push_back(asFloat<X, Y>(p));
    return BreakpointCurve(std::move(pts));
}

template <class X, class Y>
void BreakpointCurve<X, Y>::validate() const {
    if (points_.size() < 2) throw std::invalid_argument("BreakpointCurve: at least two points are required");
    if (toFloat(points_.front().y) != 0.0f) throw std::invalid_argument("BreakpointCurve: first point does not define y = 0");
    if (toFloat(points_.back().y) != 1.0f) throw std::invalid_argument("BreakpointCurve: last point does not define y = 1");
    for (std::size_t i = 0; i + 1 < points_.size(); ++i) {
        const CurvePoint l = asFloat<X, Y>(points_[i]);
        const CurvePoint r = asFloat<X, Y>(points_[i + 1]);
        if (!(l[0] < r[0])) throw std::invalid_argument("BreakpointCurve: unsorted or duplicate x value");
        if (r[1] < l[1]) throw std::invalid_argument("BreakpointCurve: y does not increase monotonically with x");
    }
}

template <class X, class Y>
std::size_t BreakpointCurve<X, Y>::size() const { return points_.size(); }

template <class X, class Y>
const std::vector<typename BreakpointCurve<X, Y>::Point>& BreakpointCurve<X, Y>::points() const { return points_; }

template <class X, class Y>
float BreakpointCurve<X, Y>::minX() const { return toFloat(points_.front().x); }

template <class X, class Y>
float BreakpointCurve<X, Y>::maxX() const { return toFloat(points_.back().x); }

// Invariant: points_[start].x <= x < points_[end].x
template <class X, class Y>
std::pair<std::size_t, float> BreakpointCurve<X, Y>::searchByX(float x, std::size_t start, std::size_t end) const {
    if (start + 1 == end) {
        const CurvePoint l = asFloat<X, Y>(points_[start]);
        const CurvePoint r = asFloat<X, Y>(points_[end]);
        const float a = (x - l[0]) / (r[0] - l[0]);
        return {start, l[1] * (1.0f - a) + r[1] * a};
    }
    const std::size_t mid = (start + end) / 2;
    if (x < toFloat(points_[mid].x)) return searchByX(x, start, mid);
    return searchByX(x, mid, end);
}

// Invariant: points_[start].y <= y < points_[end].y
template <class X, class Y>
std::pair<std::size_t, float> BreakpointCurve<X, Y>::searchByY(float y, std::size_t start, std::size_t end) const {
    if (start + 1 == end) {
        const CurvePoint l = asFloat<X, Y>(points_[start]);
        const CurvePoint r = asFloat<X, Y>(points_[end]);
        const float a = (y - l[1]) / (r[1] - l[1]);
        return {start, l[0] * (1.0f - a) + r[0] * a};
    }
    const std::size_t mid = (start + end) / 2;
    if (y < toFloat(points_[mid].y)) return searchByY(y, start, mid);
    return searchByY(y, mid, end);
}

template <class X, class Y>
float BreakpointCurve<X, Y>::yAtX(float x) const {
    if (x <= minX()) return 0.0f;
    if (x >= maxX()) return 1.0f;
    return searchByX(x, 0, points_.size() - 1).second;
}

template <class X, class Y>
float BreakpointCurve<X, Y>::xAtY(float y) const {
    if (!(y >= 0.0f && y <= 1.0f)) {
        throw std::invalid_argument("BreakpointCurve: y must lie in [0, 1]");
    }
    if (y == 0.0f) return minX();
    if (y == 1.0f) return maxX();
    return searchByY(y, 0, points_.size() - 1).second;
}

template <class X, class Y>
std::size_t BreakpointCurve<X, Y>::indexAtX(float x) const {
    if (x <= minX()) return 0;
    if (x >= maxX()) return points_.size() - 1;
    return searchByX(x, 0, points_.size() - 1).first;
}

template <class X, class Y>
std::size_t BreakpointCurve<X, Y>::indexAtY(float y) const {
    if (y <= 0.0f) return 0;
    if (y >= 1.0f) return points_.size() - 1;
    return searchByY(y, 0, points_.size() - 1).first;
}

template <class X, class Y>
std::vector<CurvePoint> BreakpointCurve<X, Y>::valuesAsPairs() const {
    std::vector<CurvePoint> out;
    out.reserve(points_.size());
    for (const auto& p : points_) out.push_back(asFloat<X, Y>(p));
    return out;
}

template <class X, class Y>
std::pair<std::vector<float>, std::vector<float>> BreakpointCurve<X, Y>::valuesAsVectors() const {
    std::pair<std::vector<float>, std::vector<float>> out;
    out.first.reserve(points_.size());
    out.second.reserve(points_.size());
    for (const auto& p : points_) {
        out.first.push_back(toFloat(p.x));
        out.second.push_back(toFloat(p.y));
    }
    return out;
}

template <class X, class Y>
std::vector<float> BreakpointCurve<X, Y>::xValues() const {
    std::vector<float> out;
    out.reserve(points_.size());
    for (const auto& p : points_) out.push_back(toFloat(p.x));
    return out;
}

template <class X, class Y>
void BreakpointCurve<X, Y>::addPoint(float x, float y) {
    const Point np{fromFloat<X>(x), fromFloat<Y>(y)};
    const float xf = toFloat(np.x);
    const float yf = toFloat(np.y);
    if (std::isnan(xf) || std::isnan(yf)) throw std::invalid_argument("BreakpointCurve: NaN coordinate");

    auto it = std::lower_bound(points_.begin(), points_.end(), xf,
                               [](const Point& p, float v) { return toFloat(p.x) < v; });
    if (it != points_.end() && toFloat(it->x) == xf) {
        throw std::invalid_argument("BreakpointCurve: duplicate x value " + std::to_string(x));
    }
    if (it == points_.begin() || it == points_.end()) {
        throw std::invalid_argument("BreakpointCurve: x value " + std::to_string(x) + " lies outside the curve");
    }
    const Point& left = *(it - 1);
    const Point& right = *it;
    if (yf < toFloat(left.y) || yf > toFloat(right.y)) {
        throw std::invalid_argument("BreakpointCurve: new point " + std::to_string(x) + "," +
                                    std::to_string(y) + " breaks monotonicity");
    }
    points_.insert(it, np);
}

template <class X, class Y>
void BreakpointCurve<X, Y>::simplifyRange(float tolerance, std::size_t start, std::size_t end,
                                          std::vector<char>& keep) const {
    if (end - start < 2) return; // one or two points: nothing to drop

    const CurvePoint s = asFloat<X, Y>(points_[start]);
    const CurvePoint e = asFloat<X, Y>(points_[end]);
    float maxD = -1.0f;
    std::size_t maxI = start + 1;
    for (std::size_t i = start + 1; i < end; ++i) {
        const float d = lineDistance(s, e, asFloat<X, Y>(points_[i]));
        if (d > maxD) {
            maxD = d;
            maxI = i;
        }
    }

    if (maxD <= tolerance) {
        for (std::size_t i = start + 1; i < end; ++i) keep[i] = 0;
    } else {
        simplifyRange(tolerance, start, maxI, keep);
        simplifyRange(tolerance, maxI, end, keep);
    }
}

template <class X, class Y>
void BreakpointCurve<X, Y>::simplify(float tolerance) {
    if (points_.size() < 3) return;
    std::vector<char> keep(points_.size(), 1);
    simplifyRange(tolerance, 0, points_.size() - 1, keep);

    std::vector<Point> kept;
    kept.reserve(points_.size());
    for (std::size_t i = 0; i < points_.size(); ++i) {
        if (keep[i]) kept.push_back(points_[i]);
    }
    points_ = std::move(kept);
}

template <class X, class Y>
void BreakpointCurve<X, Y>::simplifyFixed(std::size_t maxPoints) {
    if (maxPoints < 2) throw std::invalid_argument("BreakpointCurve: simplifyFixed needs room for two points");
    while (points_.size() > maxPoints) {
        std::size_t best = 0;
        float bestD = 0.0f;
        for (std::size_t i = 0; i + 2 < points_.size(); ++i) {
            const float d = lineDistance(asFloat<X, Y>(points_[i]), asFloat<X, Y>(points_[i + 2]),
                                         asFloat<X, Y>(points_[i + 1]));
            if (i == 0 || d < bestD) {
                bestD = d;
                best = i;
            }
        }
        points_.erase(points_.begin() + static_cast<std::ptrdiff_t>(best + 1));
    }
}

template <class X, class Y>
std::vector<std::uint8_t> BreakpointCurve<X, Y>::encode() const {
    if (points_.size() > kCompactMaxPoints) {
        throw std::length_error("BreakpointCurve: compact format holds at most 255 points, curve has " +
                                std::to_string(points_.size()));
    }
    const float lo = minX();
    const float hi = maxX();

    std::vector<std::uint8_t> out;
    out.reserve(kCompactHeaderBytes + 2 * points_.size());
    out.push_back(kCompactFormatTag);
    appendFloatLE(out, lo);
    appendFloatLE(out, hi);
    out.push_back(static_cast<std::uint8_t>(points_.size()));
    for (const auto& p : points_) {
        out.push_back(quantize((toFloat(p.x) - lo) / (hi - lo)));
        out.push_back(quantize(toFloat(p.y)));
    }
    return out;
}

template <class X, class Y>
std::vector<std::uint8_t> BreakpointCurve<X, Y>::encodeLimited(std::size_t maxBytes) const {
    if (maxBytes < kCompactHeaderBytes + 4) {
        throw std::invalid_argument("BreakpointCurve: " + std::to_string(maxBytes) +
                                    " bytes cannot hold a compact curve");
    }
    const std::size_t maxPoints = std::min((maxBytes - kCompactHeaderBytes) / 2, kCompactMaxPoints);
    if (points_.size() <= maxPoints) return encode();

    BreakpointCurve reduced(*this);
    reduced.simplifyFixed(maxPoints);
    PROPCURVES_LOG_DEBUG("compact encoding reduced curve from %zu to %zu points", points_.size(), reduced.size());
    return reduced.encode();
}

template <class X, class Y>
BreakpointCurve<X, Y> BreakpointCurve<X, Y>::decode(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) throw std::invalid_argument("BreakpointCurve: empty compact buffer");
    if (bytes[0] != kCompactFormatTag) {
        throw std::invalid_argument("BreakpointCurve: unknown compact format tag " + std::to_string(bytes[0]));
    }
    if (bytes.size() < kCompactHeaderBytes) throw std::invalid_argument("BreakpointCurve: truncated compact header");
    const std::size_t n = bytes[9];
    if (bytes.size() < kCompactHeaderBytes + 2 * n) {
        throw std::invalid_argument("BreakpointCurve: byte array too short for declared length");
    }

    const float lo = readFloatLE(bytes, 1);
    const float hi = readFloatLE(bytes, 5);

    std::vector<CurvePoint> pts;
    pts.reserve(n);
    int previousXb = -1;
    std::size_t collapsed = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const int xb = bytes[kCompactHeaderBytes + 2 * i];
        const float y = static_cast<float>(bytes[kCompactHeaderBytes + 2 * i + 1]) / 255.0f;
        if (xb == previousXb) {
            // Keep the first point of a run; the closing run still has to end at y = 1.
            if (i + 1 == n) pts.back()[1] = y;
            ++collapsed;
            continue;
        }
        pts.push_back(CurvePoint{lo + static_cast<float>(xb) / 255.0f * (hi - lo), y});
        previousXb = xb;
    }
    if (collapsed > 0) {
        PROPCURVES_LOG_DEBUG("compact decoding collapsed %zu points sharing an x byte", collapsed);
    }
    return BreakpointCurve(std::move(pts));
}

template <class X, class Y>
std::string BreakpointCurve<X, Y>::summary() const {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "BreakpointCurve (min=%5d, 5%%=%5d, med=%5d, 95%%=%5d, max=%5d) with %zu points",
                  saturatingInt(xAtY(0.0f)), saturatingInt(xAtY(0.05f)), saturatingInt(xAtY(0.5f)),
                  saturatingInt(xAtY(0.95f)), saturatingInt(xAtY(1.0f)), points_.size());
    return std::string(buf);
}

template class BreakpointCurve<float, float>;
template class BreakpointCurve<float, UFix8>;
template class BreakpointCurve<float, UFix16>;
template class BreakpointCurve<float, Half>;
template class BreakpointCurve<SignedByte, float>;
template class BreakpointCurve<SignedByte, UFix8>;
template class BreakpointCurve<SignedByte, UFix16>;
template class BreakpointCurve<SignedByte, Half>;
