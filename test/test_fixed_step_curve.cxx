#include <gtest/gtest.h>
#include "FixedStepCurve.hxx"
#include <stdexcept>

namespace {
// Queries in canonical float
template <class X, class Y>
void checkUntyped(const FixedStepCurve<X, Y>& c, bool floatX, float eps) {
    EXPECT_EQ(c.minX(), 10.0f);
    EXPECT_EQ(c.maxX(), 30.0f);

    EXPECT_EQ(c.yAtX(0.0f), 0.0f);
    EXPECT_EQ(c.yAtX(100.0f), 1.0f);

    EXPECT_NEAR(c.yAtX(10.0f), 0.0f, eps);
    EXPECT_NEAR(c.yAtX(20.0f), 0.6f, eps);
    EXPECT_NEAR(c.yAtX(30.0f), 1.0f, eps);

    EXPECT_NEAR(c.yAtX(15.0f), 0.3f, eps);
    EXPECT_NEAR(c.yAtX(25.0f), 0.8f, eps);
    if (floatX) {
        EXPECT_NEAR(c.yAtX(12.5f), 0.15f, eps);
        EXPECT_NEAR(c.yAtX(17.5f), 0.45f, eps);
    }

    EXPECT_NEAR(c.xAtY(0.0f), 10.0f, eps);
    EXPECT_NEAR(c.xAtY(1.0f), 30.0f, eps);
    EXPECT_NEAR(c.xAtY(0.6f), 20.0f, eps);
    if (floatX) {
        EXPECT_NEAR(c.xAtY(0.15f), 12.5f, eps);
        EXPECT_NEAR(c.xAtY(0.45f), 17.5f, eps);
    }
}

// Queries in storage types
template <class X, class Y>
void checkTyped(const FixedStepCurve<X, Y>& c, bool floatX, float eps) {
    EXPECT_EQ(toFloat(c.typedMinX()), 10.0f);
    EXPECT_EQ(toFloat(c.typedMaxX()), 30.0f);

    EXPECT_EQ(toFloat(c.typedYAtX(fromFloat<X>(0.0f))), 0.0f);
    EXPECT_EQ(toFloat(c.typedYAtX(fromFloat<X>(100.0f))), 1.0f);

    EXPECT_NEAR(toFloat(c.typedYAtX(fromFloat<X>(10.0f))), 0.0f, eps);
    EXPECT_NEAR(toFloat(c.typedYAtX(fromFloat<X>(20.0f))), 0.6f, eps);
    EXPECT_NEAR(toFloat(c.typedYAtX(fromFloat<X>(30.0f))), 1.0f, eps);

    EXPECT_NEAR(toFloat(c.typedYAtX(fromFloat<X>(15.0f))), 0.3f, eps);
    EXPECT_NEAR(toFloat(c.typedYAtX(fromFloat<X>(25.0f))), 0.8f, eps);
    if (floatX) {
        EXPECT_NEAR(toFloat(c.typedYAtX(fromFloat<X>(12.5f))), 0.15f, eps);
        EXPECT_NEAR(toFloat(c.typedYAtX(fromFloat<X>(17.5f))), 0.45f, eps);
    }

    EXPECT_NEAR(toFloat(c.typedXAtY(fromFloat<Y>(0.0f))), 10.0f, eps);
    EXPECT_NEAR(toFloat(c.typedXAtY(fromFloat<Y>(1.0f))), 30.0f, eps);
    EXPECT_NEAR(toFloat(c.typedXAtY(fromFloat<Y>(0.6f))), 20.0f, eps);
    if (floatX) {
        EXPECT_NEAR(toFloat(c.typedXAtY(fromFloat<Y>(0.15f))), 12.5f, eps);
        EXPECT_NEAR(toFloat(c.typedXAtY(fromFloat<Y>(0.45f))), 17.5f, eps);
    }
}

template <class X, class Y>
void checkCurve(bool floatX, float eps) {
    const FixedStepCurve<X, Y> c(10.0f, 10.0f, {0.0f, 0.6f, 1.0f});
    checkTyped(c, floatX, eps);
    checkUntyped(c, floatX, eps);
}
}

TEST(FixedStepCurve, FloatFloat) { checkCurve<float, float>(true, 1e-6f); }
TEST(FixedStepCurve, SignedByteFloat) { checkCurve<SignedByte, float>(false, 1e-6f); }
TEST(FixedStepCurve, FloatUFix8) { checkCurve<float, UFix8>(true, 0.05f); }
TEST(FixedStepCurve, FloatUFix16) { checkCurve<float, UFix16>(true, 0.0005f); }
TEST(FixedStepCurve, FloatHalf) { checkCurve<float, Half>(true, 0.005f); }

TEST(FixedStepCurve, FromTyped) {
    const auto c = FixedStepCurve<SignedByte, UFix8>::fromTyped(
        5, 0, {fromFloat<UFix8>(0.0f), fromFloat<UFix8>(0.5f), fromFloat<UFix8>(1.0f)});
    EXPECT_EQ(c.step(), 5.0f);
    EXPECT_EQ(c.origin(), 0.0f);
    EXPECT_EQ(c.maxX(), 10.0f);
    EXPECT_EQ(c.size(), 3u);
    EXPECT_EQ(c.samples()[1].raw(), 64);
    EXPECT_FLOAT_EQ(c.yAtX(2.5f), 0.25f);
}

TEST(FixedStepCurve, RejectsInvalidSamples) {
    EXPECT_THROW(FixedStepCurve<>(1.0f, 0.0f, {1.0f}), std::invalid_argument);
    EXPECT_THROW(FixedStepCurve<>(0.0f, 0.0f, {0.0f, 1.0f}), std::invalid_argument);
    EXPECT_THROW(FixedStepCurve<>(-1.0f, 0.0f, {0.0f, 1.0f}), std::invalid_argument);
    EXPECT_THROW(FixedStepCurve<>(1.0f, 0.0f, {0.0f, 0.7f, 0.6f, 1.0f}), std::invalid_argument);
    EXPECT_THROW(FixedStepCurve<>(1.0f, 0.0f, {0.1f, 1.0f}), std::invalid_argument);
    EXPECT_THROW(FixedStepCurve<>(1.0f, 0.0f, {0.0f, 0.9f}), std::invalid_argument);
    EXPECT_NO_THROW(FixedStepCurve<>(1.0f, 0.0f, {0.00005f, 0.99995f}));
}

TEST(FixedStepCurve, XAtYOutsideUnitRangeThrows) {
    const FixedStepCurve<> c(10.0f, 10.0f, {0.0f, 0.6f, 1.0f});
    EXPECT_THROW(c.xAtY(-0.1f), std::invalid_argument);
    EXPECT_THROW(c.xAtY(1.5f), std::invalid_argument);
}

TEST(FixedStepCurve, FlatRunReturnsFirstMatch) {
    const FixedStepCurve<> c(10.0f, 10.0f, {0.0f, 0.6f, 0.6f, 0.6f, 0.7f, 1.0f});
    EXPECT_EQ(c.xAtY(0.6f), 20.0f);
    EXPECT_NEAR(c.xAtY(0.65f), 45.0f, 1e-4f);
    EXPECT_NEAR(c.yAtX(35.0f), 0.6f, 1e-6f);
}

TEST(FixedStepCurve, RoundTripStrictlyIncreasing) {
    const FixedStepCurve<> c(2.0f, -4.0f, {0.0f, 0.1f, 0.35f, 0.5f, 0.8f, 1.0f});
    for (float x = -3.9f; x < 5.9f; x += 0.25f) {
        EXPECT_NEAR(c.xAtY(c.yAtX(x)), x, 1e-4f) << x;
    }
}

TEST(FixedStepCurve, Values) {
    const FixedStepCurve<> c(10.0f, 10.0f, {0.0f, 0.6f, 1.0f});
    const auto pairs = c.valuesAsPairs();
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[1][0], 20.0f);
    EXPECT_EQ(pairs[1][1], 0.6f);

    const auto vecs = c.valuesAsVectors();
    EXPECT_EQ(vecs.first, (std::vector<float>{10.0f, 20.0f, 30.0f}));
    EXPECT_EQ(vecs.second, (std::vector<float>{0.0f, 0.6f, 1.0f}));
    EXPECT_EQ(c.xValues(), vecs.first);
}
