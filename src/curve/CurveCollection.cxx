// Implementation for CurveCollection
#include "CurveCollection.hxx"
#include "CurveMath.hxx"
#include "FixedStepCurve.hxx"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

template <class K, class C>
std::size_t CurveCollection<K, C>::size() const { return curves_.size(); }

template <class K, class C>
bool CurveCollection<K, C>::empty() const { return curves_.empty(); }

template <class K, class C>
const std::vector<typename CurveCollection<K, C>::Entry>& CurveCollection<K, C>::entries() const { return curves_; }

template <class K, class C>
float CurveCollection<K, C>::minKey() const {
    if (curves_.empty()) throw std::out_of_range("CurveCollection: no curves");
    return toFloat(curves_.front().first);
}

template <class K, class C>
float CurveCollection<K, C>::maxKey() const {
    if (curves_.empty()) throw std::out_of_range("CurveCollection: no curves");
    return toFloat(curves_.back().first);
}

template <class K, class C>
void CurveCollection<K, C>::addCurve(K key, C curve) {
    const float k = toFloat(key);
    if (std::isnan(k)) throw std::invalid_argument("CurveCollection: NaN key");
    auto it = std::lower_bound(curves_.begin(), curves_.end(), k,
                               [](const Entry& e, float v) { return toFloat(e.first) < v; });
    if (it != curves_.end() && toFloat(it->first) == k) {
        throw std::invalid_argument("CurveCollection: duplicate key " + std::to_string(k));
    }
    curves_.insert(it, Entry(key, std::move(curve)));
}

// Binary search down to one pair of neighbours, then blend them.
template <class K, class C>
BreakpointCurve<> CurveCollection<K, C>::interpolate(float x, std::size_t start, std::size_t end) const {
    if (start + 1 == end) {
        const Entry& l = curves_[start];
        const Entry& r = curves_[end];
        const float lk = toFloat(l.first);
        const float a = (x - lk) / (toFloat(r.first) - lk);
        return CurveMath::weightedAverage({CurveView(l.second), CurveView(r.second)}, {1.0f - a, a});
    }
    const std::size_t mid = (start + end) / 2;
    if (x < toFloat(curves_[mid].first)) return interpolate(x, start, mid);
    return interpolate(x, mid, end);
}

template <class K, class C>
BreakpointCurve<> CurveCollection<K, C>::curveAtXWithExtrapolation(float x) const {
    if (curves_.size() < 2) throw std::out_of_range("CurveCollection: extrapolation needs two curves");
    return interpolate(x, 0, curves_.size() - 1);
}

template <class K, class C>
BreakpointCurve<> CurveCollection<K, C>::curveAtXWithContinuation(float x) const {
    if (x <= minKey()) return CurveMath::weightedAverage({CurveView(curves_.front().second)}, {1.0f});
    if (x >= maxKey()) return CurveMath::weightedAverage({CurveView(curves_.back().second)}, {1.0f});
    return interpolate(x, 0, curves_.size() - 1);
}

template <class K, class C>
BreakpointCurve<> CurveCollection<K, C>::curveAtX(float x) const {
    if (x <= minKey()) throw std::out_of_range("CurveCollection: x below minimum");
    if (x >= maxKey()) throw std::out_of_range("CurveCollection: x above maximum");
    return interpolate(x, 0, curves_.size() - 1);
}

template class CurveCollection<float, BreakpointCurve<>>;
template class CurveCollection<SignedByte, BreakpointCurve<>>;
template class CurveCollection<UFix16, BreakpointCurve<>>;
template class CurveCollection<float, FixedStepCurve<>>;
