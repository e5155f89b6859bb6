//
//  File:       CBSimulate.cpp
//
//  Function:   Colour-blind simulation of sRGB colours
//
//  Copyright:  Andrew Willmott 2018
//

#include "CBSimulate.h"

using namespace CBPal;

// --- Colour-blind support ---------------------------------------------------

// LMS colour space, models human eye response: https://en.wikipedia.org/wiki/LMS_color_space

// https://ixora.io/projects/colorblindness/color-blindness-simulation-research/
// More recent version of the Viénot et al. approach, uses more up-to-date LMS
// conversion, and constrains each dichromat transform so that the LMS
// response of white is unchanged. Greys are therefore left alone.

const Mat3f CBPal::kLMSFromRGB =
{
    0.31399022f,    0.63951294f,    0.04649755f,
    0.15537241f,    0.75789446f,    0.08670142f,
    0.01775239f,    0.10944209f,    0.87256922f,
};

const Mat3f CBPal::kRGBFromLMS =
{
    5.47221206f,   -4.64196010f,    0.16963708f,
    -1.1252419f,    2.29317094f,   -0.16789520f,
    0.02980165f,   -0.19318073f,    1.16364789f,
};

const Mat3f CBPal::kLMSProtanope =      /// Protanope: red sensitivity is greatly reduced, reds/yellows appear darker (1% men).
{
    0, 1.05118294f, -0.05116099f,
    0, 1, 0,
    0, 0, 1,
};

const Mat3f CBPal::kLMSDeuteranope =    /// Deuteranope: green sensivitity is greatly reduced, no brightness issues (1% men)
{
    1, 0, 0,
    0.9513092f, 0,  0.04866992f,
    0, 0, 1,
};

const Mat3f CBPal::kLMSTritanope =      /// Tritanope: blue sensitivity greatly reduced (0.003% population)
{
    1, 0, 0,
    0, 1, 0,
    -0.86744736f, 1.86727089f, 0
};

namespace
{
    inline float dot(Vec3f a, Vec3f b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

    inline Vec3f operator*(const Mat3f& m, const Vec3f& v) { return Vec3f { dot(m.x, v), dot(m.y, v), dot(m.z, v) }; }

    const Mat3f* kLMSDeficiency[kNumDeficiencies] =
    {
        &kLMSProtanope,
        &kLMSDeuteranope,
        &kLMSTritanope,
    };
}

const char* CBPal::DeficiencyName(tDeficiency type)
{
    switch (type)
    {
    case kProtanopia:
        return "protanopia";
    case kDeuteranopia:
        return "deuteranopia";
    case kTritanopia:
        return "tritanopia";
    default:
        return "unknown";
    }
}

Vec3f CBPal::SimulateLinear(Vec3f rgb, tDeficiency type)
{
    Vec3f lms = kLMSFromRGB * rgb;

    lms = (*kLMSDeficiency[type]) * lms;

    return kRGBFromLMS * lms;
}

Vec3f CBPal::Simulate(Vec3f rgb, tDeficiency type)
{
    Vec3f c = LinearFromSRGB(rgb);

    c = ClampUnit(SimulateLinear(c, type));

    return ClampUnit(SRGBFromLinear(c));    // re-encoding can overshoot 1 by an ulp
}
