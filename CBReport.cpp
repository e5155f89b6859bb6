//
//  File:       CBReport.cpp
//
//  Function:   Text and image summaries of palette reports
//
//  Copyright:  Andrew Willmott 2018
//

#include "CBReport.h"

#include <math.h>
#include <cmath>

using namespace CBPal;

const RGBA32 CBPal::kFigureBackground = { 230, 230, 230, 255 };
const RGBA32 CBPal::kSafeMarker       = {   0, 158, 115, 255 };
const RGBA32 CBPal::kUnsafeMarker     = { 213,  94,   0, 255 };

void CBPal::HexString(Vec3f rgb, char buffer[8])
{
    RGBA32 c = ToRGBA32(rgb);
    snprintf(buffer, 8, "#%02X%02X%02X", c.c[0], c.c[1], c.c[2]);
}

// --- Text report -------------------------------------------------------------

namespace
{
    // Box-drawing characters are multi-byte, so printf widths are only applied to ASCII fields.
    const char* kTableHead =
        "┏━━━━━━━━━┳━━━━━━━━━━━━━━━━━┳━━━━━━━━━━━━┳━━━━━━━━━━┳━━━━━━━┓\n"
        "┃ Hex     ┃ RGB             ┃ Weight (%) ┃ Min ΔE   ┃ Safe? ┃\n"
        "┡━━━━━━━━━╇━━━━━━━━━━━━━━━━━╇━━━━━━━━━━━━╇━━━━━━━━━━╇━━━━━━━┩\n";
    const char* kTableFoot =
        "└─────────┴─────────────────┴────────────┴──────────┴───────┘\n";

    void FormatDistance(float d, char* buffer, size_t bufferSize)
    {
        if (std::isfinite(d))
            snprintf(buffer, bufferSize, "%.2f", d);
        else
            snprintf(buffer, bufferSize, "-");
    }
}

void CBPal::PrintReport(FILE* out, const char* sourceName, const PaletteReport& report)
{
    const int n = int(report.palette.size());

    fprintf(out, " Extracted %d colours from %s\n\n", n, sourceName);
    fputs(kTableHead, out);

    for (int i = 0; i < n; i++)
    {
        const PaletteEntry& entry = report.palette[i];

        char hex[8];
        HexString(entry.rgb, hex);

        RGBA32 c = ToRGBA32(entry.rgb);
        char rgb[32];
        snprintf(rgb, sizeof(rgb), "(%d, %d, %d)", c.c[0], c.c[1], c.c[2]);

        char dist[32];
        FormatDistance(report.minDistances[i], dist, sizeof(dist));

        fprintf(out, "│ %-7s │ %-15s │ %9.1f%% │ %8s │ %-5s │\n",
            hex, rgb, entry.weight, dist, report.labels[i] == kSafe ? "YES" : "NO");
    }

    fputs(kTableFoot, out);

    fprintf(out, " %d of %d colours unsafe at ΔE threshold %.2f, simulating", CountUnsafe(report), n, report.threshold);

    for (size_t k = 0; k < report.deficiencies.size(); k++)
        fprintf(out, "%s %s", k == 0 ? "" : ",", DeficiencyName(report.deficiencies[k]));

    fputs("\n", out);

    bool header = false;

    for (const DistanceResult& result : report.distances)
    {
        if (result.distance >= report.threshold)
            continue;

        if (!header)
        {
            fputs("\n Confusable pairs:\n", out);
            header = true;
        }

        char hexA[8];
        char hexB[8];
        HexString(report.palette[result.a].rgb, hexA);
        HexString(report.palette[result.b].rgb, hexB);

        fprintf(out, "   %s / %s  %-12s ΔE %.2f\n", hexA, hexB, DeficiencyName(result.type), result.distance);
    }
}


// --- Figure ------------------------------------------------------------------

namespace
{
    void FillRect(std::vector<RGBA32>* figure, int figureW, int x0, int y0, int w, int h, RGBA32 c)
    {
        for (int y = y0; y < y0 + h; y++)
        for (int x = x0; x < x0 + w; x++)
            (*figure)[y * figureW + x] = c;
    }
}

void CBPal::CreateFigure(const PaletteReport& report, int imageW, int imageH, const RGBA32 image[], std::vector<RGBA32>* figure, int* w, int* h)
{
    const int n        = int(report.palette.size());
    const int numTypes = int(report.deficiencies.size());

    if (!image)
    {
        imageW = 0;
        imageH = 0;
    }

    const int imagePanelW = image ? imageW + kFigureGap : 0;
    const int paletteW    = kFigureGap + (1 + numTypes) * (kSwatchSize + kFigureGap) + kMarkerWidth + kFigureGap;
    const int paletteH    = kFigureGap + n * (kSwatchSize + kFigureGap);

    *w = imagePanelW + paletteW;
    *h = paletteH > imageH + 2 * kFigureGap ? paletteH : imageH + 2 * kFigureGap;

    figure->assign((*w) * (*h), kFigureBackground);

    for (int y = 0; y < imageH; y++)
    for (int x = 0; x < imageW; x++)
    {
        RGBA32 c = image[y * imageW + x];
        c.c[3] = 255;
        (*figure)[(y + kFigureGap) * (*w) + x + kFigureGap] = c;
    }

    for (int i = 0; i < n; i++)
    {
        int x = imagePanelW + kFigureGap;
        int y = kFigureGap + i * (kSwatchSize + kFigureGap);

        FillRect(figure, *w, x, y, kSwatchSize, kSwatchSize, ToRGBA32(report.palette[i].rgb));
        x += kSwatchSize + kFigureGap;

        for (int k = 0; k < numTypes; k++)
        {
            FillRect(figure, *w, x, y, kSwatchSize, kSwatchSize, ToRGBA32(SimulatedColourFor(report, i, k).rgb));
            x += kSwatchSize + kFigureGap;
        }

        FillRect(figure, *w, x, y, kMarkerWidth, kSwatchSize, report.labels[i] == kSafe ? kSafeMarker : kUnsafeMarker);
    }
}
