#include "CurveMath.hxx"

#include <cmath>
#include <functional>
#include <queue>
#include <stdexcept>
#include <tuple>

namespace CurveMath {

std::vector<float> mergedXValues(const std::vector<CurveView>& curves) {
    std::vector<std::vector<float>> lists;
    lists.reserve(curves.size());
    for (const auto& c : curves) lists.push_back(c.xValues());

    // k-way merge: (value, list index, position in list)
    using Head = std::tuple<float, std::size_t, std::size_t>;
    std::priority_queue<Head, std::vector<Head>, std::greater<Head>> heads;
    for (std::size_t i = 0; i < lists.size(); ++i) {
        if (!lists[i].empty()) heads.emplace(lists[i][0], i, 0);
    }

    std::vector<float> out;
    while (!heads.empty()) {
        const Head h = heads.top();
        heads.pop();
        const float v = std::get<0>(h);
        const std::size_t li = std::get<1>(h);
        const std::size_t pos = std::get<2>(h) + 1;
        if (out.empty() || out.back() != v) out.push_back(v);
        if (pos < lists[li].size()) heads.emplace(lists[li][pos], li, pos);
    }
    return out;
}

BreakpointCurve<> weightedAverage(const std::vector<CurveView>& curves, const std::vector<float>& weights) {
    if (curves.size() != weights.size()) {
        throw std::invalid_argument("weightedAverage: number of curves and weights must be the same");
    }
    if (curves.empty()) throw std::invalid_argument("weightedAverage: no curves given");

    float sum = 0.0f;
    for (float w : weights) sum += w;
    if (sum == 0.0f) throw std::invalid_argument("weightedAverage: weights sum to zero");
    const float f = 1.0f / sum;

    const std::vector<float> xs = mergedXValues(curves);
    std::vector<CurvePoint> points;
    points.reserve(xs.size());
    for (float x : xs) {
        float y = 0.0f;
        for (std::size_t i = 0; i < curves.size(); ++i) y += curves[i].yAtX(x) * weights[i];
        points.push_back(CurvePoint{x, y * f});
    }

    BreakpointCurve<> result(std::move(points));
    result.simplify(0.0f);
    return result;
}

BreakpointCurve<> average(const std::vector<CurveView>& curves) {
    return weightedAverage(curves, std::vector<float>(curves.size(), 1.0f));
}

float distance(CurveView a, CurveView b) {
    const std::vector<float> xs = mergedXValues({a, b});
    float area = 0.0f;
    for (std::size_t i = 0; i + 1 < xs.size(); ++i) {
        const float h = xs[i + 1] - xs[i];
        const float d1 = a.yAtX(xs[i]) - b.yAtX(xs[i]);
        const float d2 = a.yAtX(xs[i + 1]) - b.yAtX(xs[i + 1]);
        const float l = std::fabs(d1);
        const float r = std::fabs(d2);
        if (d1 * d2 >= 0.0f) {
            // trapezoid or triangle
            area += (l + r) * h * 0.5f;
        } else {
            // the graphs cross inside the segment: two triangles
            area += h * 0.5f * (l * l + r * r) / (l + r);
        }
    }
    return area;
}

} // namespace CurveMath
