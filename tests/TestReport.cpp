//
//  File:       TestReport.cpp
//
//  Function:   Tests for report text and figure output
//
//  Copyright:  Andrew Willmott 2018
//

#include "CBReport.h"

#include <catch2/catch.hpp>

#include <stdio.h>
#include <string>

using namespace CBPal;

namespace
{
    const PaletteEntry kPrimaries[] =
    {
        { { 1.0f, 0.0f, 0.0f }, 50.0f },
        { { 0.0f, 1.0f, 0.0f }, 30.0f },
        { { 0.0f, 0.0f, 1.0f }, 20.0f },
    };

    std::string ReportText(const PaletteReport& report)
    {
        FILE* f = tmpfile();
        REQUIRE(f);

        PrintReport(f, "primaries.png", report);

        std::string text;
        rewind(f);

        char buffer[256];
        size_t n;
        while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0)
            text.append(buffer, n);

        fclose(f);
        return text;
    }

    bool Contains(const std::string& text, const char* s)
    {
        return text.find(s) != std::string::npos;
    }

    bool SamePixel(RGBA32 a, RGBA32 b)
    {
        return a.u32 == b.u32;
    }
}

TEST_CASE("Hex strings", "[report]")
{
    char hex[8];

    HexString({ 1.0f, 0.0f, 0.0f }, hex);
    CHECK(std::string(hex) == "#FF0000");

    HexString({ 0.0f, 0.5f, 1.0f }, hex);
    CHECK(std::string(hex) == "#0080FF");
}

TEST_CASE("Text report lists colours and confusions", "[report]")
{
    Config config;
    config.threshold = 30.0f;

    PaletteReport report;
    REQUIRE(Extract(3, kPrimaries, config, &report) == kNoError);

    std::string text = ReportText(report);

    CHECK(Contains(text, "Extracted 3 colours from primaries.png"));
    CHECK(Contains(text, "#FF0000"));
    CHECK(Contains(text, "(0, 255, 0)"));
    CHECK(Contains(text, "50.0%"));
    CHECK(Contains(text, "23.2"));
    CHECK(Contains(text, "2 of 3 colours unsafe"));
    CHECK(Contains(text, "protanopia, deuteranopia, tritanopia"));
    CHECK(Contains(text, "Confusable pairs"));
    CHECK(Contains(text, "#FF0000 / #00FF00  deuteranopia"));
}

TEST_CASE("Text report for a single colour", "[report]")
{
    PaletteReport report;
    REQUIRE(Extract(1, kPrimaries, Config(), &report) == kNoError);

    std::string text = ReportText(report);

    CHECK(Contains(text, "YES"));
    CHECK(Contains(text, "       - "));      // no partner, no distance
    CHECK(!Contains(text, "Confusable pairs"));
}

TEST_CASE("Figure lays out palette rows", "[report]")
{
    Config config;
    config.threshold = 30.0f;

    PaletteReport report;
    REQUIRE(Extract(3, kPrimaries, config, &report) == kNoError);

    std::vector<RGBA32> figure;
    int w = 0;
    int h = 0;

    CreateFigure(report, 0, 0, 0, &figure, &w, &h);

    const int step = kSwatchSize + kFigureGap;

    CHECK(w == kFigureGap + 4 * step + kMarkerWidth + kFigureGap);
    CHECK(h == kFigureGap + 3 * step);
    REQUIRE(figure.size() == size_t(w * h));

    CHECK(SamePixel(figure[0], kFigureBackground));

    // Row 0: red, its simulations, then unsafe marker
    int y = kFigureGap;
    CHECK(SamePixel(figure[y * w + kFigureGap], ToRGBA32(kPrimaries[0].rgb)));
    CHECK(SamePixel(figure[y * w + kFigureGap + step], ToRGBA32(SimulatedColourFor(report, 0, 0).rgb)));
    CHECK(SamePixel(figure[y * w + kFigureGap + 4 * step], kUnsafeMarker));

    // Row 2: blue is safe
    y = kFigureGap + 2 * step + kSwatchSize - 1;
    CHECK(SamePixel(figure[y * w + kFigureGap], ToRGBA32(kPrimaries[2].rgb)));
    CHECK(SamePixel(figure[y * w + kFigureGap + 4 * step], kSafeMarker));
}

TEST_CASE("Figure includes the source image", "[report]")
{
    PaletteReport report;
    REQUIRE(Extract(1, kPrimaries, Config(), &report) == kNoError);

    const int iw = 200;
    const int ih = 100;
    std::vector<RGBA32> image(iw * ih, RGBA32 { 10, 20, 30, 0 });

    std::vector<RGBA32> figure;
    int w = 0;
    int h = 0;

    CreateFigure(report, iw, ih, image.data(), &figure, &w, &h);

    const int paletteX = iw + 2 * kFigureGap;

    CHECK(w == paletteX + 4 * (kSwatchSize + kFigureGap) + kMarkerWidth + kFigureGap);
    CHECK(h == ih + 2 * kFigureGap);

    RGBA32 expected = { 10, 20, 30, 255 };      // alpha forced opaque
    CHECK(SamePixel(figure[kFigureGap * w + kFigureGap], expected));
    CHECK(SamePixel(figure[(kFigureGap + ih - 1) * w + kFigureGap + iw - 1], expected));

    CHECK(SamePixel(figure[kFigureGap * w + paletteX], ToRGBA32(kPrimaries[0].rgb)));
}
