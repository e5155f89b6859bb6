//
//  File:       CBColour.h
//
//  Function:   Colour representation, uniform colour spaces and ΔE metrics
//
//  Copyright:  Andrew Willmott 2018
//

#ifndef CB_COLOUR_H
#define CB_COLOUR_H

#include <stdint.h>

namespace CBPal
{
    struct Vec3f { float x; float y; float z; };
    struct Mat3f { Vec3f x; Vec3f y; Vec3f z; };

    enum tError
    {
        kNoError,
        kInvalidColour,     ///< Channel outside [0, 1] or not finite
        kEmptyPalette,      ///< Nothing to process
        kInvalidThreshold,  ///< Threshold negative or not finite
        kInvalidWeight,     ///< Palette weight negative or not finite
        kInvalidConfig,     ///< Other configuration error
    };

    const char* ErrorString(tError error);

    // Colours are sRGB-encoded, 0-1 per channel, everywhere in the pipeline.
    bool  IsValidColour(Vec3f rgb);
    Vec3f ClampUnit(Vec3f c);

    float LinearFromSRGB(float c);
    float SRGBFromLinear(float c);
    Vec3f LinearFromSRGB(Vec3f rgb);
    Vec3f SRGBFromLinear(Vec3f rgb);

    // CIE XYZ, sRGB primaries, D65
    extern const Mat3f kXYZFromLinearRGB;
    extern const Vec3f kWhiteD65;

    enum tColourSpace
    {
        kCIELab,
        kCIELuv,
        kNumColourSpaces
    };

    Vec3f LabFromRGB(Vec3f rgb);    ///< Unchecked, 'rgb' must be valid
    Vec3f LuvFromRGB(Vec3f rgb);    ///< Unchecked, 'rgb' must be valid

    tError ToUniform(Vec3f rgb, Vec3f* uniform, tColourSpace space = kCIELab);
    ///< Convert 'rgb' to the given perceptually uniform space, failing with kInvalidColour for out-of-range input.

    enum tDistanceMetric
    {
        kDeltaE76,          ///< Euclidean distance in the uniform space
        kDeltaE2000,        ///< CIEDE2000, CIELAB only
        kNumDistanceMetrics
    };

    float DeltaE76  (Vec3f u1, Vec3f u2);
    float DeltaE2000(Vec3f lab1, Vec3f lab2);
    float DistanceUniform(Vec3f u1, Vec3f u2, tDistanceMetric metric = kDeltaE76);

    tError Distance(Vec3f rgbA, Vec3f rgbB, float* distance, tColourSpace space = kCIELab, tDistanceMetric metric = kDeltaE76);
    ///< Perceptual distance between two sRGB colours. Symmetric, zero for identical colours.

    // Simple 32-bit RGBA handling, gamma-encoded
    struct RGBA32
    {
        union
        {
            uint8_t  c[4];
            uint32_t u32;
        };
    };

    RGBA32 ToRGBA32  (Vec3f c, uint8_t alpha = 255);
    Vec3f  FromRGBA32(RGBA32 rgb);
}

#endif
