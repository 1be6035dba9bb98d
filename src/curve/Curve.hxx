#ifndef PROPCURVES_CURVE_HXX
#define PROPCURVES_CURVE_HXX

#include <array>
#include <cstddef>
#include <type_traits>
#include <vector>

// A point of a proportion curve in canonical float space: {x, y}.
using CurvePoint = std::array<float, 2>;

// First/last y values within this distance of 0/1 are snapped on construction.
constexpr float kSnapEpsilon = 1e-4f;

// CurveView: non-owning handle to any curve that answers the query contract
//   float minX() const;
//   float maxX() const;
//   float yAtX(float) const;
//   float xAtY(float) const;
//   std::vector<float> xValues() const;
//
// Curve representations do not share a base class; the view erases the
// concrete type so combination code can take a mixed list of curves.
// The referenced curve must outlive the view.
class CurveView {
public:
    template <class C,
              class = typename std::enable_if<!std::is_same<typename std::decay<C>::type, CurveView>::value>::type>
    CurveView(const C& curve)
        : obj_(&curve),
          minX_(&minXOf<C>),
          maxX_(&maxXOf<C>),
          yAtX_(&yAtXOf<C>),
          xAtY_(&xAtYOf<C>),
          xValues_(&xValuesOf<C>) {}

    float minX() const { return minX_(obj_); }
    float maxX() const { return maxX_(obj_); }
    float yAtX(float x) const { return yAtX_(obj_, x); }
    float xAtY(float y) const { return xAtY_(obj_, y); }
    std::vector<float> xValues() const { return xValues_(obj_); }

private:
    template <class C> static float minXOf(const void* c) { return static_cast<const C*>(c)->minX(); }
    template <class C> static float maxXOf(const void* c) { return static_cast<const C*>(c)->maxX(); }
    template <class C> static float yAtXOf(const void* c, float x) { return static_cast<const C*>(c)->yAtX(x); }
    template <class C> static float xAtYOf(const void* c, float y) { return static_cast<const C*>(c)->xAtY(y); }
    template <class C> static std::vector<float> xValuesOf(const void* c) { return static_cast<const C*>(c)->xValues(); }

    const void* obj_;
    float (*minX_)(const void*);
    float (*maxX_)(const void*);
    float (*yAtX_)(const void*, float);
    float (*xAtY_)(const void*, float);
    std::vector<float> (*xValues_)(const void*);
};

#endif // PROPCURVES_CURVE_HXX
