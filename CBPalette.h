//
//  File:       CBPalette.h
//
//  Function:   Colour-blind safety classification of colour palettes
//
//  Copyright:  Andrew Willmott 2018
//

#ifndef CB_PALETTE_H
#define CB_PALETTE_H

#include "CBColour.h"
#include "CBSimulate.h"

#include <vector>

namespace CBPal
{
    constexpr int   kDefaultNumColours = 5;
    constexpr float kDefaultThreshold  = 2.3f;     ///< ΔE76 "just noticeable difference"

    struct Config
    {
        int             numColours   = kDefaultNumColours;  ///< Dominant colours to extract from an image
        float           threshold    = kDefaultThreshold;   ///< Minimum distance for a colour to be safe
        uint32_t        deficiencies = kAllDeficiencies;    ///< Mask of (1 << tDeficiency)
        tColourSpace    colourSpace  = kCIELab;
        tDistanceMetric metric       = kDeltaE76;
    };

    tError ValidateConfig(const Config& config);

    struct PaletteEntry
    {
        Vec3f rgb;          ///< sRGB, 0-1
        float weight;       ///< Relative usage, e.g., percentage of image pixels
    };

    struct SimulatedColour
    {
        tDeficiency type;
        Vec3f       rgb;
    };

    struct DistanceResult
    {
        int         a;      ///< Palette index, a < b
        int         b;
        tDeficiency type;
        float       distance;
    };

    enum tSafety
    {
        kSafe,
        kUnsafe,
    };

    struct PaletteReport
    {
        std::vector<PaletteEntry>    palette;
        std::vector<tDeficiency>     deficiencies;   ///< Simulated types, in enum order
        std::vector<SimulatedColour> simulated;      ///< deficiencies.size() per entry, entry-major
        std::vector<DistanceResult>  distances;      ///< Per deficiency, every pair a < b
        std::vector<float>           minDistances;   ///< Per entry, infinite if there is no other entry
        std::vector<tSafety>         labels;         ///< Per entry
        float                        threshold = 0.0f;

        void Clear();
    };

    tError Classify(int n, const PaletteEntry palette[], const Config& config, PaletteReport* report);
    ///< Simulate each colour in 'palette' under the configured deficiencies, and label it safe if it stays at least
    ///< config.threshold from every other simulated colour of the same deficiency.

    tError Extract(int n, const PaletteEntry entries[], const Config& config, PaletteReport* report);
    ///< Validate and classify the ranked colour list 'entries'. On failure 'report' is left empty.

    const SimulatedColour& SimulatedColourFor(const PaletteReport& report, int entry, int k);
    ///< Simulated version of the given entry under report.deficiencies[k]

    int CountUnsafe(const PaletteReport& report);
}

#endif
