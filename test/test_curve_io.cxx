#include <gtest/gtest.h>
#include "CurveIO.hxx"
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace {
std::vector<std::uint8_t> bytesOf(const char* txt) {
    return std::vector<std::uint8_t>(txt, txt + std::strlen(txt));
}

std::vector<BreakpointCurve<>> sampleCurves() {
    std::vector<BreakpointCurve<>> curves;
    curves.emplace_back(std::vector<CurvePoint>{{12.0f, 0.0f}, {14.0f, 0.4f}, {20.0f, 0.4f}, {30.0f, 0.7f}, {40.0f, 1.0f}});
    curves.emplace_back(std::vector<CurvePoint>{{-1.5f, 0.0f}, {0.1f, 0.33f}, {2.75f, 1.0f}});
    return curves;
}

CurveCollection<> sampleCollection() {
    CurveCollection<> set;
    set.addCurve(0.0f, BreakpointCurve<>(std::vector<CurvePoint>{{0.0f, 0.0f}, {5.0f, 0.4f}, {10.0f, 1.0f}}));
    set.addCurve(6.5f, BreakpointCurve<>(std::vector<CurvePoint>{{0.0f, 0.0f}, {5.0f, 0.6f}, {10.0f, 1.0f}}));
    return set;
}
}

TEST(CurveIO, TextRoundTripBreakpoint) {
    const auto curves = sampleCurves();
    const auto bytes = CurveIO::serialize(curves);

    std::vector<BreakpointCurve<>> r;
    CurveIO::deserialize(bytes, r);
    ASSERT_EQ(r.size(), curves.size());
    for (std::size_t i = 0; i < r.size(); ++i) {
        EXPECT_EQ(r[i].valuesAsPairs(), curves[i].valuesAsPairs()) << i;
    }
}

TEST(CurveIO, TextRoundTripFixedStep) {
    std::vector<FixedStepCurve<>> curves;
    curves.emplace_back(10.0f, 10.0f, std::vector<float>{0.0f, 0.6f, 0.6f, 0.7f, 1.0f});
    curves.emplace_back(0.25f, -3.0f, std::vector<float>{0.0f, 1.0f});

    std::vector<FixedStepCurve<>> r;
    CurveIO::deserialize(CurveIO::serialize(curves), r);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[0].step(), 10.0f);
    EXPECT_EQ(r[0].origin(), 10.0f);
    EXPECT_EQ(r[0].valuesAsPairs(), curves[0].valuesAsPairs());
    EXPECT_EQ(r[1].step(), 0.25f);
    EXPECT_EQ(r[1].origin(), -3.0f);
}

TEST(CurveIO, TextRoundTripCollection) {
    const std::vector<CurveCollection<>> sets{sampleCollection()};
    std::vector<CurveCollection<>> r;
    CurveIO::deserialize(CurveIO::serialize(sets), r);
    ASSERT_EQ(r.size(), 1u);
    ASSERT_EQ(r[0].size(), 2u);
    EXPECT_EQ(r[0].entries()[1].first, 6.5f);
    EXPECT_EQ(r[0].entries()[1].second.valuesAsPairs(), sets[0].entries()[1].second.valuesAsPairs());
}

TEST(CurveIO, CompactRoundTrip) {
    CurveIO::Options opts;
    opts.format = CurveIO::Format::Compact;

    const auto curves = sampleCurves();
    const auto bytes = CurveIO::serialize(curves, opts);
    EXPECT_EQ(bytes.size(), (kCompactHeaderBytes + 2 * 5) + (kCompactHeaderBytes + 2 * 3));

    std::vector<BreakpointCurve<>> r;
    CurveIO::deserialize(bytes, r, opts);
    ASSERT_EQ(r.size(), 2u);
    for (std::size_t i = 0; i < r.size(); ++i) {
        const float range = curves[i].maxX() - curves[i].minX();
        const auto a = curves[i].valuesAsPairs();
        const auto b = r[i].valuesAsPairs();
        ASSERT_EQ(a.size(), b.size());
        for (std::size_t j = 0; j < a.size(); ++j) {
            EXPECT_NEAR(b[j][0], a[j][0], range / 255.0f);
            EXPECT_NEAR(b[j][1], a[j][1], 1.0f / 255.0f);
        }
    }
}

TEST(CurveIO, CompactCollection) {
    CurveIO::Options opts;
    opts.format = CurveIO::Format::Compact;

    const std::vector<CurveCollection<>> sets{sampleCollection(), sampleCollection()};
    const auto bytes = CurveIO::serialize(sets, opts);
    ASSERT_GE(bytes.size(), 5u);
    EXPECT_EQ(bytes[0], 'P');
    EXPECT_EQ(bytes[1], 'C');
    EXPECT_EQ(bytes[2], 'S');
    EXPECT_EQ(bytes[3], 1);
    EXPECT_EQ(bytes[4], 2);

    std::vector<CurveCollection<>> r;
    CurveIO::deserialize(bytes, r, opts);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[1].minKey(), 0.0f);
    EXPECT_EQ(r[1].maxKey(), 6.5f);
    EXPECT_NEAR(r[1].curveAtX(3.25f).yAtX(5.0f), 0.5f, 2.0f / 255.0f);

    std::vector<std::uint8_t> broken = bytes;
    broken[2] = 'X';
    EXPECT_THROW(CurveIO::deserialize(broken, r, opts), std::runtime_error);
    broken = bytes;
    broken.resize(bytes.size() - 3);
    EXPECT_THROW(CurveIO::deserialize(broken, r, opts), std::runtime_error);
    EXPECT_EQ(r.size(), 2u);
}

TEST(CurveIO, FixedStepHasNoCompactForm) {
    CurveIO::Options opts;
    opts.format = CurveIO::Format::Compact;
    const std::vector<FixedStepCurve<>> curves{FixedStepCurve<>(1.0f, 0.0f, {0.0f, 1.0f})};
    EXPECT_THROW(CurveIO::serialize(curves, opts), std::invalid_argument);

    std::string err;
    EXPECT_FALSE(CurveIO::writeFile("io_fixed.pcv", curves, opts, &err));
    EXPECT_FALSE(err.empty());
}

TEST(CurveIO, ReadHandWrittenText) {
    const char* txt =
        "* two breakpoint curves\n"
        "breakpoint   # the scenario curve\n"
        "points 12 0  14 0.4\n"
        "points 30 0.7  20 0.4  40 1\n"
        "endcurve\n"
        "\n"
        "breakpoint\n"
        "points 0 0 1 1\n"
        "endcurve\n";
    std::vector<BreakpointCurve<>> r;
    CurveIO::deserialize(bytesOf(txt), r);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[0].size(), 5u);
    EXPECT_NEAR(r[0].yAtX(25.0f), 0.55f, 1e-4f);
    EXPECT_EQ(r[1].maxX(), 1.0f);
}

TEST(CurveIO, RejectsMalformedText) {
    std::vector<BreakpointCurve<>> r;
    EXPECT_THROW(CurveIO::deserialize(bytesOf("breakpoint\npoints 0 0 1\nendcurve\n"), r), std::runtime_error);
    EXPECT_THROW(CurveIO::deserialize(bytesOf("breakpoint\npoints 0 0 1 1\n"), r), std::runtime_error);
    EXPECT_THROW(CurveIO::deserialize(bytesOf("breakpoint\npoints 0 0 abc 1\nendcurve\n"), r), std::runtime_error);
    EXPECT_THROW(CurveIO::deserialize(bytesOf("breakpoint\npoints 0 0.5 1 1\nendcurve\n"), r), std::runtime_error);
    EXPECT_THROW(CurveIO::deserialize(bytesOf("curve degree 2\n"), r), std::runtime_error);
    EXPECT_THROW(CurveIO::deserialize(bytesOf("fixedstep step 1 origin 0\nsamples 0 1\nendcurve\n"), r),
                 std::runtime_error);
    EXPECT_TRUE(r.empty());

    std::vector<FixedStepCurve<>> f;
    EXPECT_THROW(CurveIO::deserialize(bytesOf("fixedstep step 1\nsamples 0 1\nendcurve\n"), f), std::runtime_error);

    std::vector<CurveCollection<>> c;
    EXPECT_THROW(CurveIO::deserialize(bytesOf("collection\nbreakpoint\npoints 0 0 1 1\nendcurve\nendcollection\n"), c),
                 std::runtime_error);
    EXPECT_THROW(CurveIO::deserialize(bytesOf("collection\nkey 1\nbreakpoint\npoints 0 0 1 1\nendcurve\n"
                                              "key 1\nbreakpoint\npoints 0 0 2 1\nendcurve\nendcollection\n"), c),
                 std::runtime_error);
    EXPECT_TRUE(c.empty());
}

TEST(CurveIO, WriteAndReadFile) {
    const char* path = "io_curves.pcv";
    const auto curves = sampleCurves();
    std::string err;
    ASSERT_TRUE(CurveIO::writeFile(path, curves, CurveIO::Options(), &err)) << err;

    // Append a comment and ensure the parser ignores it
    {
        FILE* f = std::fopen(path, "a");
        ASSERT_NE(f, nullptr);
        std::fputs("* trailing comment\n", f);
        std::fclose(f);
    }

    std::vector<BreakpointCurve<>> r;
    r.push_back(curves[1]);
    ASSERT_TRUE(CurveIO::readFile(path, r, CurveIO::Options(), &err)) << err;
    ASSERT_EQ(r.size(), 3u);
    EXPECT_EQ(r[1].valuesAsPairs(), curves[0].valuesAsPairs());
    std::remove(path);
}

TEST(CurveIO, WriteAndReadCompactCollectionFile) {
    const char* path = "io_sets.pcs";
    CurveIO::Options opts;
    opts.format = CurveIO::Format::Compact;
    const std::vector<CurveCollection<>> sets{sampleCollection()};
    std::string err;
    ASSERT_TRUE(CurveIO::writeFile(path, sets, opts, &err)) << err;

    std::vector<CurveCollection<>> r;
    ASSERT_TRUE(CurveIO::readFile(path, r, opts, &err)) << err;
    ASSERT_EQ(r.size(), 1u);
    EXPECT_EQ(r[0].size(), 2u);
    std::remove(path);
}

TEST(CurveIO, ReadMissingFile) {
    std::vector<FixedStepCurve<>> r;
    std::string err;
    EXPECT_FALSE(CurveIO::readFile("no_such_dir/missing.pcv", r, CurveIO::Options(), &err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(r.empty());
}
