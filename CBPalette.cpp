//
//  File:       CBPalette.cpp
//
//  Function:   Colour-blind safety classification of colour palettes
//
//  Copyright:  Andrew Willmott 2018
//

#include "CBPalette.h"

#include <math.h>
#include <cmath>

using namespace CBPal;

tError CBPal::ValidateConfig(const Config& config)
{
    if (!std::isfinite(config.threshold) || config.threshold < 0.0f)
        return kInvalidThreshold;

    if (config.numColours < 1)
        return kInvalidConfig;

    if (config.deficiencies == 0 || (config.deficiencies & ~kAllDeficiencies) != 0)
        return kInvalidConfig;

    if (config.colourSpace < 0 || config.colourSpace >= kNumColourSpaces)
        return kInvalidConfig;
    if (config.metric < 0 || config.metric >= kNumDistanceMetrics)
        return kInvalidConfig;

    // CIEDE2000 weights are defined on CIELAB lightness/chroma/hue only
    if (config.metric == kDeltaE2000 && config.colourSpace != kCIELab)
        return kInvalidConfig;

    return kNoError;
}

void PaletteReport::Clear()
{
    palette.clear();
    deficiencies.clear();
    simulated.clear();
    distances.clear();
    minDistances.clear();
    labels.clear();
    threshold = 0.0f;
}

tError CBPal::Classify(int n, const PaletteEntry palette[], const Config& config, PaletteReport* report)
{
    report->Clear();

    tError error = ValidateConfig(config);
    if (error != kNoError)
        return error;

    for (int i = 0; i < n; i++)
        if (!IsValidColour(palette[i].rgb))
            return kInvalidColour;

    for (int t = 0; t < kNumDeficiencies; t++)
        if (config.deficiencies & (1 << t))
            report->deficiencies.push_back(tDeficiency(t));

    const int numTypes = int(report->deficiencies.size());

    report->palette.assign(palette, palette + n);
    report->threshold = config.threshold;

    // Simulated colours, and their uniform-space equivalents for distance evaluation
    std::vector<Vec3f> uniform(n * numTypes);

    for (int i = 0; i < n; i++)
    for (int k = 0; k < numTypes; k++)
    {
        SimulatedColour sc = { report->deficiencies[k], Simulate(palette[i].rgb, report->deficiencies[k]) };

        if ((error = ToUniform(sc.rgb, &uniform[i * numTypes + k], config.colourSpace)) != kNoError)
        {
            report->Clear();
            return error;
        }

        report->simulated.push_back(sc);
    }

    report->minDistances.assign(n, INFINITY);

    for (int k = 0; k < numTypes; k++)
    for (int a = 0; a < n; a++)
    for (int b = a + 1; b < n; b++)
    {
        float d = DistanceUniform(uniform[a * numTypes + k], uniform[b * numTypes + k], config.metric);

        DistanceResult result = { a, b, report->deficiencies[k], d };
        report->distances.push_back(result);

        if (d < report->minDistances[a])
            report->minDistances[a] = d;
        if (d < report->minDistances[b])
            report->minDistances[b] = d;
    }

    // With fewer than two entries there is nothing to confuse, and minDistances stay infinite.
    report->labels.resize(n);

    for (int i = 0; i < n; i++)
        report->labels[i] = report->minDistances[i] >= config.threshold ? kSafe : kUnsafe;

    return kNoError;
}

tError CBPal::Extract(int n, const PaletteEntry entries[], const Config& config, PaletteReport* report)
{
    report->Clear();

    tError error = ValidateConfig(config);
    if (error != kNoError)
        return error;

    if (n <= 0 || !entries)
        return kEmptyPalette;

    for (int i = 0; i < n; i++)
        if (!std::isfinite(entries[i].weight) || entries[i].weight < 0.0f)
            return kInvalidWeight;

    return Classify(n, entries, config, report);
}

const SimulatedColour& CBPal::SimulatedColourFor(const PaletteReport& report, int entry, int k)
{
    return report.simulated[entry * report.deficiencies.size() + k];
}

int CBPal::CountUnsafe(const PaletteReport& report)
{
    int count = 0;

    for (tSafety label : report.labels)
        if (label == kUnsafe)
            count++;

    return count;
}
