//
//  File:       CBSimulate.h
//
//  Function:   Colour-blind simulation of sRGB colours
//
//  Copyright:  Andrew Willmott 2018
//

#ifndef CB_SIMULATE_H
#define CB_SIMULATE_H

#include "CBColour.h"

namespace CBPal
{
    // LMS colour space, models human eye response: https://en.wikipedia.org/wiki/LMS_color_space
    extern const Mat3f kLMSFromRGB;     ///< Convert linear RGB to LMS colour system
    extern const Mat3f kRGBFromLMS;     ///< Convert back from LMS colour system

    extern const Mat3f kLMSProtanope;   ///< Protanope: reds are greatly reduced (1% men)
    extern const Mat3f kLMSDeuteranope; ///< Deuteranope: greens are greatly reduced (1% men)
    extern const Mat3f kLMSTritanope;   ///< Tritanope: blues are greatly reduced (0.003% population)

    enum tDeficiency
    {
        kProtanopia,        ///< L cone missing
        kDeuteranopia,      ///< M cone missing
        kTritanopia,        ///< S cone missing
        kNumDeficiencies
    };

    constexpr uint32_t kAllDeficiencies = (1 << kNumDeficiencies) - 1;

    const char* DeficiencyName(tDeficiency type);

    Vec3f Simulate(Vec3f rgb, tDeficiency type);
    ///< Simulate the given form of dichromacy on sRGB colour 'rgb'. The result is clamped to [0, 1].

    Vec3f SimulateLinear(Vec3f rgb, tDeficiency type);
    ///< As Simulate(), for linear RGB, and without clamping.
}

#endif
