//
//  File:       CBReport.h
//
//  Function:   Text and image summaries of palette reports
//
//  Copyright:  Andrew Willmott 2018
//

#ifndef CB_REPORT_H
#define CB_REPORT_H

#include "CBPalette.h"

#include <stdio.h>
#include <vector>

namespace CBPal
{
    void HexString(Vec3f rgb, char buffer[8]);  ///< "#RRGGBB"

    void PrintReport(FILE* out, const char* sourceName, const PaletteReport& report);
    ///< Write table of palette colours with weight, min ΔE and safety, followed by any confusable pairs.

    // Figure layout, in pixels
    constexpr int kSwatchSize  = 48;
    constexpr int kMarkerWidth = 12;
    constexpr int kFigureGap   = 4;

    extern const RGBA32 kFigureBackground;
    extern const RGBA32 kSafeMarker;    ///< Okabe-Ito bluish green
    extern const RGBA32 kUnsafeMarker;  ///< Okabe-Ito vermillion

    void CreateFigure(const PaletteReport& report, int imageW, int imageH, const RGBA32 image[], std::vector<RGBA32>* figure, int* w, int* h);
    ///< Render optional source image alongside one row per palette entry: the original colour, its simulated
    ///< versions, and a safe/unsafe marker. 'image' may be null.
}

#endif
