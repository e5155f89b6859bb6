//
//  File:       TestCluster.cpp
//
//  Function:   Tests for dominant colour extraction
//
//  Copyright:  Andrew Willmott 2018
//

#include "CBCluster.h"

#include <catch2/catch.hpp>

#include <string.h>

using namespace CBPal;

namespace
{
    RGBA32 Pixel(int r, int g, int b)
    {
        RGBA32 c = { uint8_t(r), uint8_t(g), uint8_t(b), 255 };
        return c;
    }

    float TotalWeight(const std::vector<PaletteEntry>& palette)
    {
        float total = 0.0f;
        for (const PaletteEntry& entry : palette)
            total += entry.weight;
        return total;
    }

    // Two well-separated groups of slightly varying colours, 60% reddish and 40% bluish.
    std::vector<RGBA32> TwoGroupImage()
    {
        std::vector<RGBA32> pixels;

        for (int i = 0; i < 60; i++)
            pixels.push_back(Pixel(240 + i % 10, i % 7, i % 5));
        for (int i = 0; i < 40; i++)
            pixels.push_back(Pixel(i % 6, 10 + i % 4, 230 + i % 9));

        return pixels;
    }
}

TEST_CASE("Few distinct colours are returned directly", "[cluster]")
{
    const RGBA32 pixels[] =
    {
        Pixel(255, 0, 0), Pixel(0, 0, 255), Pixel(255, 0, 0), Pixel(255, 0, 0),
    };

    std::vector<PaletteEntry> palette;
    REQUIRE(ExtractDominantColours(4, pixels, 5, &palette) == kNoError);

    // Asking for more colours than the image has only returns what is there
    REQUIRE(palette.size() == 2);

    CHECK(palette[0].rgb.x == 1.0f);
    CHECK(palette[0].rgb.z == 0.0f);
    CHECK(palette[0].weight == Approx(75.0f));

    CHECK(palette[1].rgb.x == 0.0f);
    CHECK(palette[1].rgb.z == 1.0f);
    CHECK(palette[1].weight == Approx(25.0f));
}

TEST_CASE("Alpha is ignored when counting colours", "[cluster]")
{
    const RGBA32 pixels[] =
    {
        { 10, 20, 30, 255 }, { 10, 20, 30, 0 }, { 10, 20, 30, 128 },
    };

    std::vector<PaletteEntry> palette;
    REQUIRE(ExtractDominantColours(3, pixels, 3, &palette) == kNoError);

    REQUIRE(palette.size() == 1);
    CHECK(palette[0].weight == Approx(100.0f));
}

TEST_CASE("K-means separates distinct colour groups", "[cluster]")
{
    std::vector<RGBA32> pixels = TwoGroupImage();

    std::vector<PaletteEntry> palette;
    REQUIRE(ExtractDominantColours(int(pixels.size()), pixels.data(), 2, &palette) == kNoError);

    REQUIRE(palette.size() == 2);

    CHECK(palette[0].weight == Approx(60.0f));
    CHECK(palette[0].rgb.x > 0.9f);
    CHECK(palette[0].rgb.z < 0.1f);

    CHECK(palette[1].weight == Approx(40.0f));
    CHECK(palette[1].rgb.x < 0.1f);
    CHECK(palette[1].rgb.z > 0.9f);

    CHECK(TotalWeight(palette) == Approx(100.0f));
}

TEST_CASE("Palette is ranked by weight", "[cluster]")
{
    std::vector<RGBA32> pixels;

    for (int i = 0; i < 200; i++)
        pixels.push_back(Pixel((i * 37) % 256, (i * 91) % 256, (i * 13) % 256));

    std::vector<PaletteEntry> palette;
    REQUIRE(ExtractDominantColours(int(pixels.size()), pixels.data(), 6, &palette) == kNoError);

    REQUIRE(!palette.empty());
    REQUIRE(palette.size() <= 6);

    for (size_t i = 1; i < palette.size(); i++)
        CHECK(palette[i - 1].weight >= palette[i].weight);

    for (const PaletteEntry& entry : palette)
    {
        CHECK(IsValidColour(entry.rgb));
        CHECK(entry.weight > 0.0f);
    }

    CHECK(TotalWeight(palette) == Approx(100.0f));
}

TEST_CASE("Clustering is deterministic for a seed", "[cluster]")
{
    std::vector<RGBA32> pixels;

    for (int i = 0; i < 500; i++)
        pixels.push_back(Pixel((i * 53) % 256, (i * 17) % 256, (i * 101) % 256));

    std::vector<PaletteEntry> p0;
    std::vector<PaletteEntry> p1;
    REQUIRE(ExtractDominantColours(int(pixels.size()), pixels.data(), 5, &p0, 7) == kNoError);
    REQUIRE(ExtractDominantColours(int(pixels.size()), pixels.data(), 5, &p1, 7) == kNoError);

    REQUIRE(p0.size() == p1.size());

    for (size_t i = 0; i < p0.size(); i++)
        CHECK(memcmp(&p0[i], &p1[i], sizeof(PaletteEntry)) == 0);
}

TEST_CASE("Clustering reports bad arguments", "[cluster]")
{
    const RGBA32 pixels[] = { Pixel(1, 2, 3) };

    std::vector<PaletteEntry> palette(3);

    CHECK(ExtractDominantColours(0, pixels, 5, &palette) == kEmptyPalette);
    CHECK(palette.empty());

    CHECK(ExtractDominantColours(1, pixels, 0, &palette) == kInvalidConfig);
    CHECK(palette.empty());
}

TEST_CASE("Downsample limits the larger side", "[cluster]")
{
    const int w = 80;
    const int h = 40;
    std::vector<RGBA32> image(w * h);

    for (int y = 0; y < h; y++)
    for (int x = 0; x < w; x++)
        image[y * w + x] = Pixel(x, y, 0);

    std::vector<RGBA32> out;
    int ow = 0;
    int oh = 0;

    Downsample(w, h, image.data(), 20, &out, &ow, &oh);
    CHECK(ow == 20);
    CHECK(oh == 10);
    REQUIRE(out.size() == 200);

    // Point sampled from pixel centres
    CHECK(out[0].c[0] == 2);
    CHECK(out[0].c[1] == 2);
    CHECK(out[19].c[0] == 78);

    Downsample(w, h, image.data(), 0, &out, &ow, &oh);
    CHECK(ow == w);
    CHECK(oh == h);
    CHECK(out.size() == image.size());

    Downsample(w, h, image.data(), 400, &out, &ow, &oh);
    CHECK(ow == w);
    CHECK(oh == h);
}
