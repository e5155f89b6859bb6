//
//  File:       CBColour.cpp
//
//  Function:   Colour representation, uniform colour spaces and ΔE metrics
//
//  Copyright:  Andrew Willmott 2018
//

#include "CBColour.h"

#include <math.h>
#include <cmath>

using namespace CBPal;

namespace
{
    constexpr float kPi = 3.14159265358979f;

    inline float dot(Vec3f a, Vec3f b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
    inline float sqr(float f)          { return f * f; }

    inline Vec3f operator*(const Mat3f& m, const Vec3f& v) { return Vec3f { dot(m.x, v), dot(m.y, v), dot(m.z, v) }; }

    inline float Saturate(float f)
    {
        return f < 0.0f ? 0.0f : f > 1.0f ? 1.0f : f;
    }

    inline uint8_t ToU8(float f)
    {
        if (f <= 0.0f)
            return 0;
        if (f >= 1.0f)
            return 255;

        return uint8_t(f * 255.0f + 0.5f);
    }
}

const char* CBPal::ErrorString(tError error)
{
    switch (error)
    {
    case kNoError:
        return "no error";
    case kInvalidColour:
        return "colour channel outside [0, 1]";
    case kEmptyPalette:
        return "no colours to process";
    case kInvalidThreshold:
        return "threshold must be finite and non-negative";
    case kInvalidWeight:
        return "palette weights must be finite and non-negative";
    case kInvalidConfig:
        return "invalid configuration";
    }

    return "unknown error";
}

bool CBPal::IsValidColour(Vec3f rgb)
{
    const float* c = &rgb.x;

    for (int i = 0; i < 3; i++)
        if (!std::isfinite(c[i]) || c[i] < 0.0f || c[i] > 1.0f)
            return false;

    return true;
}

Vec3f CBPal::ClampUnit(Vec3f c)
{
    return { Saturate(c.x), Saturate(c.y), Saturate(c.z) };
}


// --- sRGB transfer function --------------------------------------------------

// IEC 61966-2-1

float CBPal::LinearFromSRGB(float c)
{
    if (c <= 0.04045f)
        return c / 12.92f;

    return powf((c + 0.055f) / 1.055f, 2.4f);
}

float CBPal::SRGBFromLinear(float c)
{
    if (c <= 0.0031308f)
        return 12.92f * c;

    return 1.055f * powf(c, 1.0f / 2.4f) - 0.055f;
}

Vec3f CBPal::LinearFromSRGB(Vec3f rgb)
{
    return { LinearFromSRGB(rgb.x), LinearFromSRGB(rgb.y), LinearFromSRGB(rgb.z) };
}

Vec3f CBPal::SRGBFromLinear(Vec3f rgb)
{
    return { SRGBFromLinear(rgb.x), SRGBFromLinear(rgb.y), SRGBFromLinear(rgb.z) };
}


// --- Uniform colour spaces ---------------------------------------------------

const Mat3f CBPal::kXYZFromLinearRGB =
{
    { 0.4124564f,   0.3575761f,   0.1804375f },
    { 0.2126729f,   0.7151522f,   0.0721750f },
    { 0.0193339f,   0.1191920f,   0.9503041f },
};

const Vec3f CBPal::kWhiteD65 = { 0.95047f, 1.0f, 1.08883f };

namespace
{
    constexpr float kEpsilon = 216.0f / 24389.0f;
    constexpr float kKappa   = 24389.0f / 27.0f;

    inline float LabF(float t)
    {
        if (t > kEpsilon)
            return cbrtf(t);

        return (kKappa * t + 16.0f) / 116.0f;
    }

    inline Vec3f XYZFromRGB(Vec3f rgb)
    {
        return kXYZFromLinearRGB * LinearFromSRGB(rgb);
    }

    // u', v' chromaticity. Black has no chromaticity, so maps to the white point.
    inline void UVPrime(Vec3f xyz, float* u, float* v)
    {
        float denom = xyz.x + 15.0f * xyz.y + 3.0f * xyz.z;

        if (denom <= 0.0f)
        {
            UVPrime(kWhiteD65, u, v);
            return;
        }

        *u = 4.0f * xyz.x / denom;
        *v = 9.0f * xyz.y / denom;
    }
}

Vec3f CBPal::LabFromRGB(Vec3f rgb)
{
    Vec3f xyz = XYZFromRGB(rgb);

    float fx = LabF(xyz.x / kWhiteD65.x);
    float fy = LabF(xyz.y / kWhiteD65.y);
    float fz = LabF(xyz.z / kWhiteD65.z);

    return { 116.0f * fy - 16.0f, 500.0f * (fx - fy), 200.0f * (fy - fz) };
}

Vec3f CBPal::LuvFromRGB(Vec3f rgb)
{
    Vec3f xyz = XYZFromRGB(rgb);

    float l = 116.0f * LabF(xyz.y / kWhiteD65.y) - 16.0f;

    float u,  v;
    float un, vn;
    UVPrime(xyz,       &u,  &v);
    UVPrime(kWhiteD65, &un, &vn);

    return { l, 13.0f * l * (u - un), 13.0f * l * (v - vn) };
}

tError CBPal::ToUniform(Vec3f rgb, Vec3f* uniform, tColourSpace space)
{
    if (!IsValidColour(rgb))
        return kInvalidColour;

    switch (space)
    {
    case kCIELab:
        *uniform = LabFromRGB(rgb);
        return kNoError;
    case kCIELuv:
        *uniform = LuvFromRGB(rgb);
        return kNoError;
    default:
        return kInvalidConfig;
    }
}


// --- Colour difference -------------------------------------------------------

float CBPal::DeltaE76(Vec3f u1, Vec3f u2)
{
    return sqrtf(sqr(u1.x - u2.x) + sqr(u1.y - u2.y) + sqr(u1.z - u2.z));
}

// "The CIEDE2000 Color-Difference Formula: Implementation Notes, Supplementary
// Test Data, and Mathematical Observations", Sharma, Wu, Dalal 2005.

namespace
{
    constexpr float kDegToRad = kPi / 180.0f;
    constexpr float k25Pow7   = 6103515625.0f;

    inline float pow7(float f) { float f2 = f * f; return f2 * f2 * f2 * f; }

    inline float Hue(float b, float ap)
    {
        if (ap == 0.0f && b == 0.0f)
            return 0.0f;

        float h = atan2f(b, ap);
        return h < 0.0f ? h + 2.0f * kPi : h;
    }
}

float CBPal::DeltaE2000(Vec3f lab1, Vec3f lab2)
{
    float c1 = sqrtf(sqr(lab1.y) + sqr(lab1.z));
    float c2 = sqrtf(sqr(lab2.y) + sqr(lab2.z));

    float meanC7 = pow7(0.5f * (c1 + c2));
    float g = 0.5f * (1.0f - sqrtf(meanC7 / (meanC7 + k25Pow7)));

    float a1p = lab1.y * (1.0f + g);
    float a2p = lab2.y * (1.0f + g);

    float c1p = sqrtf(sqr(a1p) + sqr(lab1.z));
    float c2p = sqrtf(sqr(a2p) + sqr(lab2.z));
    float h1p = Hue(lab1.z, a1p);
    float h2p = Hue(lab2.z, a2p);

    float deltaL = lab2.x - lab1.x;
    float deltaC = c2p - c1p;
    float deltah = 0.0f;

    bool achromatic = (c1p * c2p == 0.0f);

    if (!achromatic)
    {
        deltah = h2p - h1p;

        if (deltah > kPi)
            deltah -= 2.0f * kPi;
        else if (deltah < -kPi)
            deltah += 2.0f * kPi;
    }

    float deltaH = 2.0f * sqrtf(c1p * c2p) * sinf(0.5f * deltah);

    float meanL = 0.5f * (lab1.x + lab2.x);
    float meanCp = 0.5f * (c1p + c2p);
    float meanH;

    if (achromatic)
        meanH = h1p + h2p;
    else if (fabsf(h1p - h2p) <= kPi)
        meanH = 0.5f * (h1p + h2p);
    else if (h1p + h2p < 2.0f * kPi)
        meanH = 0.5f * (h1p + h2p + 2.0f * kPi);
    else
        meanH = 0.5f * (h1p + h2p - 2.0f * kPi);

    float t = 1.0f
        - 0.17f * cosf(meanH - 30.0f * kDegToRad)
        + 0.24f * cosf(2.0f * meanH)
        + 0.32f * cosf(3.0f * meanH + 6.0f * kDegToRad)
        - 0.20f * cosf(4.0f * meanH - 63.0f * kDegToRad);

    float meanHDeg   = meanH / kDegToRad;
    float deltaTheta = 30.0f * kDegToRad * expf(-sqr((meanHDeg - 275.0f) / 25.0f));
    float meanCp7    = pow7(meanCp);
    float rc = 2.0f * sqrtf(meanCp7 / (meanCp7 + k25Pow7));

    float sl = 1.0f + 0.015f * sqr(meanL - 50.0f) / sqrtf(20.0f + sqr(meanL - 50.0f));
    float sc = 1.0f + 0.045f * meanCp;
    float sh = 1.0f + 0.015f * meanCp * t;
    float rt = -sinf(2.0f * deltaTheta) * rc;

    float tl = deltaL / sl;
    float tc = deltaC / sc;
    float th = deltaH / sh;

    float de2 = tl * tl + tc * tc + th * th + rt * tc * th;

    return de2 > 0.0f ? sqrtf(de2) : 0.0f;
}

float CBPal::DistanceUniform(Vec3f u1, Vec3f u2, tDistanceMetric metric)
{
    if (metric == kDeltaE2000)
        return DeltaE2000(u1, u2);

    return DeltaE76(u1, u2);
}

tError CBPal::Distance(Vec3f rgbA, Vec3f rgbB, float* distance, tColourSpace space, tDistanceMetric metric)
{
    if (metric < 0 || metric >= kNumDistanceMetrics)
        return kInvalidConfig;
    if (metric == kDeltaE2000 && space != kCIELab)
        return kInvalidConfig;

    Vec3f ua;
    Vec3f ub;
    tError error;

    if ((error = ToUniform(rgbA, &ua, space)) != kNoError)
        return error;
    if ((error = ToUniform(rgbB, &ub, space)) != kNoError)
        return error;

    *distance = DistanceUniform(ua, ub, metric);
    return kNoError;
}


// --- RGBA32 ------------------------------------------------------------------

RGBA32 CBPal::ToRGBA32(Vec3f c, uint8_t alpha)
{
    RGBA32 result;

    result.c[0] = ToU8(c.x);
    result.c[1] = ToU8(c.y);
    result.c[2] = ToU8(c.z);
    result.c[3] = alpha;

    return result;
}

Vec3f CBPal::FromRGBA32(RGBA32 rgb)
{
    return { rgb.c[0] / 255.0f, rgb.c[1] / 255.0f, rgb.c[2] / 255.0f };
}
