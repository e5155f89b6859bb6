//
//  File:       CBCluster.cpp
//
//  Function:   Dominant colour extraction from images
//
//  Copyright:  Andrew Willmott 2018
//

#include "CBCluster.h"

#include <algorithm>
#include <random>
#include <unordered_map>

using namespace CBPal;

void CBPal::Downsample(int w, int h, const RGBA32 dataIn[], int maxSize, std::vector<RGBA32>* dataOut, int* outW, int* outH)
{
    int largest = w > h ? w : h;

    if (maxSize <= 0 || largest <= maxSize)
    {
        dataOut->assign(dataIn, dataIn + w * h);
        *outW = w;
        *outH = h;
        return;
    }

    float scale = maxSize / float(largest);
    int sw = int(w * scale);
    int sh = int(h * scale);

    if (sw < 1)
        sw = 1;
    if (sh < 1)
        sh = 1;

    dataOut->resize(sw * sh);

    for (int y = 0; y < sh; y++)
    {
        int sy = int((y + 0.5f) * h / sh);

        for (int x = 0; x < sw; x++)
        {
            int sx = int((x + 0.5f) * w / sw);

            (*dataOut)[y * sw + x] = dataIn[sy * w + sx];
        }
    }

    *outW = sw;
    *outH = sh;
}

namespace
{
    struct cColourCount
    {
        Vec3f    rgb;
        uint32_t key;
        int      count;
    };

    struct cClustering
    {
        std::vector<Vec3f> centroids;
        std::vector<int>   counts;
        double             inertia;
    };

    constexpr int kMaxIterations = 100;

    inline uint32_t Key(RGBA32 c)
    {
        return uint32_t(c.c[0]) | (uint32_t(c.c[1]) << 8) | (uint32_t(c.c[2]) << 16);
    }

    inline float DistSqr(Vec3f a, Vec3f b)
    {
        float dx = a.x - b.x;
        float dy = a.y - b.y;
        float dz = a.z - b.z;

        return dx * dx + dy * dy + dz * dz;
    }

    int Nearest(Vec3f c, const std::vector<Vec3f>& centroids, float* distSqr)
    {
        int   best     = 0;
        float bestDist = DistSqr(c, centroids[0]);

        for (int k = 1, nk = int(centroids.size()); k < nk; k++)
        {
            float d = DistSqr(c, centroids[k]);

            if (d < bestDist)
            {
                bestDist = d;
                best = k;
            }
        }

        *distSqr = bestDist;
        return best;
    }

    // Pick index with probability proportional to weights[i], or -1 if all weights are zero.
    int PickWeighted(const std::vector<double>& weights, std::mt19937& rng)
    {
        double total = 0.0;
        for (double w : weights)
            total += w;

        if (total <= 0.0)
            return -1;

        std::uniform_real_distribution<double> prob(0.0, total);
        double target = prob(rng);
        double cumulative = 0.0;
        int last = -1;

        for (int i = 0, n = int(weights.size()); i < n; i++)
        {
            if (weights[i] <= 0.0)
                continue;

            cumulative += weights[i];
            last = i;

            if (cumulative >= target)
                return i;
        }

        return last;
    }

    // Weighted k-means++ seeding
    std::vector<Vec3f> InitialCentroids(const std::vector<cColourCount>& colours, int k, std::mt19937& rng)
    {
        std::vector<Vec3f>  centroids;
        std::vector<double> weights(colours.size());

        for (size_t i = 0; i < colours.size(); i++)
            weights[i] = colours[i].count;

        centroids.push_back(colours[PickWeighted(weights, rng)].rgb);

        while (int(centroids.size()) < k)
        {
            for (size_t i = 0; i < colours.size(); i++)
            {
                float d;
                Nearest(colours[i].rgb, centroids, &d);
                weights[i] = double(colours[i].count) * d;
            }

            int next = PickWeighted(weights, rng);

            if (next < 0)   // every colour already is a centroid
                break;

            centroids.push_back(colours[next].rgb);
        }

        return centroids;
    }

    cClustering KMeans(const std::vector<cColourCount>& colours, int k, std::mt19937& rng)
    {
        cClustering result;
        result.centroids = InitialCentroids(colours, k, rng);

        const int nk = int(result.centroids.size());
        std::vector<int> assignment(colours.size(), -1);

        for (int iter = 0; iter < kMaxIterations; iter++)
        {
            bool changed = false;

            for (size_t i = 0; i < colours.size(); i++)
            {
                float d;
                int nearest = Nearest(colours[i].rgb, result.centroids, &d);

                if (nearest != assignment[i])
                {
                    assignment[i] = nearest;
                    changed = true;
                }
            }

            if (!changed)
                break;

            std::vector<double> sums(3 * nk, 0.0);
            std::vector<int>    counts(nk, 0);

            for (size_t i = 0; i < colours.size(); i++)
            {
                int j = assignment[i];
                int c = colours[i].count;

                sums[3 * j + 0] += double(c) * colours[i].rgb.x;
                sums[3 * j + 1] += double(c) * colours[i].rgb.y;
                sums[3 * j + 2] += double(c) * colours[i].rgb.z;
                counts[j] += c;
            }

            for (int j = 0; j < nk; j++)
                if (counts[j] > 0)
                    result.centroids[j] = { float(sums[3 * j + 0] / counts[j]), float(sums[3 * j + 1] / counts[j]), float(sums[3 * j + 2] / counts[j]) };
        }

        result.counts.assign(nk, 0);
        result.inertia = 0.0;

        for (size_t i = 0; i < colours.size(); i++)
        {
            float d;
            int nearest = Nearest(colours[i].rgb, result.centroids, &d);

            result.counts[nearest] += colours[i].count;
            result.inertia += double(colours[i].count) * d;
        }

        return result;
    }

    bool HeavierFirst(const PaletteEntry& a, const PaletteEntry& b)
    {
        if (a.weight != b.weight)
            return a.weight > b.weight;
        if (a.rgb.x != b.rgb.x)
            return a.rgb.x < b.rgb.x;
        if (a.rgb.y != b.rgb.y)
            return a.rgb.y < b.rgb.y;
        return a.rgb.z < b.rgb.z;
    }
}

tError CBPal::ExtractDominantColours(int n, const RGBA32 pixels[], int numColours, std::vector<PaletteEntry>* palette, uint32_t seed, int numRestarts)
{
    palette->clear();

    if (n <= 0 || !pixels)
        return kEmptyPalette;
    if (numColours < 1)
        return kInvalidConfig;

    std::unordered_map<uint32_t, int> histogram;

    for (int i = 0; i < n; i++)
        histogram[Key(pixels[i])]++;

    std::vector<cColourCount> colours;
    colours.reserve(histogram.size());

    for (const auto& entry : histogram)
    {
        RGBA32 c;
        c.u32 = 0;
        c.c[0] = uint8_t(entry.first);
        c.c[1] = uint8_t(entry.first >> 8);
        c.c[2] = uint8_t(entry.first >> 16);

        colours.push_back({ FromRGBA32(c), entry.first, entry.second });
    }

    // Map iteration order is unspecified, fix it so seeding is reproducible
    std::sort(colours.begin(), colours.end(), [](const cColourCount& a, const cColourCount& b) { return a.key < b.key; });

    const float toPercent = 100.0f / n;

    if (int(colours.size()) <= numColours)
    {
        for (const cColourCount& c : colours)
            palette->push_back({ c.rgb, c.count * toPercent });
    }
    else
    {
        std::mt19937 rng(seed);
        cClustering best;
        best.inertia = -1.0;

        for (int r = 0; r < (numRestarts > 0 ? numRestarts : 1); r++)
        {
            cClustering clustering = KMeans(colours, numColours, rng);

            if (best.inertia < 0.0 || clustering.inertia < best.inertia)
                best = clustering;
        }

        for (size_t j = 0; j < best.centroids.size(); j++)
            if (best.counts[j] > 0)
                palette->push_back({ ClampUnit(best.centroids[j]), best.counts[j] * toPercent });
    }

    std::sort(palette->begin(), palette->end(), HeavierFirst);

    return kNoError;
}
