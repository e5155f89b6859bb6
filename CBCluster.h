//
//  File:       CBCluster.h
//
//  Function:   Dominant colour extraction from images
//
//  Copyright:  Andrew Willmott 2018
//

#ifndef CB_CLUSTER_H
#define CB_CLUSTER_H

#include "CBPalette.h"

#include <vector>

namespace CBPal
{
    void Downsample(int w, int h, const RGBA32 dataIn[], int maxSize, std::vector<RGBA32>* dataOut, int* outW, int* outH);
    ///< Point-sample 'dataIn' so its larger side is at most maxSize. maxSize <= 0 leaves the image as is.

    tError ExtractDominantColours(int n, const RGBA32 pixels[], int numColours, std::vector<PaletteEntry>* palette, uint32_t seed = 42, int numRestarts = 10);
    ///< Cluster the given pixels (alpha ignored) into at most numColours colours, weighted by percentage of
    ///< pixels covered, in descending weight order. If there are no more than numColours distinct pixel values,
    ///< these are returned as-is. Deterministic for a given seed.
}

#endif
