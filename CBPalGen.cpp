//
//  File:       CBPalGen.cpp
//
//  Function:   Extract an image's palette and check it for colour-blind safety
//
//  Copyright:  Andrew Willmott 2018
//

#define _CRT_SECURE_NO_WARNINGS

#include "CBCluster.h"
#include "CBPalette.h"
#include "CBReport.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

using namespace CBPal;

namespace
{
    constexpr int kDefaultResize = 400;

    int Help(const char* command)
    {
        printf
        (
            "%s <options>\n"
            "\n"
            "Options:\n"
            "  -h        : this help\n"
            "  -f <path> : image to extract palette from (required)\n"
            "  -n <int>  : number of dominant colours to extract. Default = %d\n"
            "  -e <float>: ΔE threshold below which colours count as confusable. Default = %g\n"
            "  -r <int>  : downsample image so its larger side is at most this before clustering. 0 = off. Default = %d\n"
            "  -p        : check protanopia\n"
            "  -d        : check deuteranopia\n"
            "  -t        : check tritanopia\n"
            "  -a        : check all the above types (default)\n"
            "  -u        : measure distances in CIELUV rather than CIELAB\n"
            "  -c        : use CIEDE2000 rather than Euclidean ΔE (CIELAB only)\n"
            "  -o <dir>  : output directory. Default = directory of the input image\n"
            "  -s        : print the report only, don't save report or figure\n"
            "\nExample:\n"
            "  %s -f figure.png -n 8 -e 10\n"
            "      # emit figure_palette.txt and figure_palette.png for the 8 dominant colours of figure.png.\n"
            , command, kDefaultNumColours, kDefaultThreshold, kDefaultResize, command
        );

        return 0;
    }

    void GetFileName(char* buffer, size_t bufferSize, const char* path)
    {
        const char* lastSlash = strrchr(path, '/');
        if (!lastSlash)
            lastSlash = strrchr(path, '\\');

        snprintf(buffer, bufferSize, "%s", lastSlash ? lastSlash + 1 : path);

        char* lastDot = strrchr(buffer, '.');

        if (lastDot)
            *lastDot = 0;
    }

    void GetDirName(char* buffer, size_t bufferSize, const char* path)
    {
        const char* lastSlash = strrchr(path, '/');
        if (!lastSlash)
            lastSlash = strrchr(path, '\\');

        if (lastSlash)
            snprintf(buffer, bufferSize, "%.*s", int(lastSlash - path), path);
        else
            snprintf(buffer, bufferSize, ".");
    }

    int ReportError(const char* what, tError error)
    {
        fprintf(stderr, "%s: %s\n", what, ErrorString(error));
        return -1;
    }
}

int main(int argc, const char* argv[])
{
    const char* command = argv[0];
    argv++; argc--;

    if (argc == 0)
        return Help(command);

    Config      config;
    uint32_t    deficiencies = 0;
    const char* imagePath = 0;
    const char* outDir = 0;
    int         resize = kDefaultResize;
    bool        save = true;

    // Options
    while (argc > 0 && argv[0][0] == '-')
    {
        const char* option = argv[0] + 1;
        argv++; argc--;

        while (option[0])
        {
            switch (option[0])
            {
            case 'h':
            case '?':
                return Help(command);

            case 'f':
                if (argc <= 0)
                    return fprintf(stderr, "Expecting filename with -f\n");
                imagePath = argv[0];
                argv++; argc--;
                break;

            case 'n':
                if (argc <= 0)
                    return fprintf(stderr, "Expecting colour count for -n <int>\n");
                config.numColours = atoi(argv[0]);
                argv++; argc--;
                break;

            case 'e':
                if (argc <= 0)
                    return fprintf(stderr, "Expecting threshold for -e <float>\n");
                config.threshold = (float) atof(argv[0]);
                argv++; argc--;
                break;

            case 'r':
                if (argc <= 0)
                    return fprintf(stderr, "Expecting size for -r <int>\n");
                resize = atoi(argv[0]);
                argv++; argc--;
                break;

            case 'o':
                if (argc <= 0)
                    return fprintf(stderr, "Expecting directory with -o\n");
                outDir = argv[0];
                argv++; argc--;
                break;

            case 'p':
                deficiencies |= 1 << kProtanopia;
                break;
            case 'd':
                deficiencies |= 1 << kDeuteranopia;
                break;
            case 't':
                deficiencies |= 1 << kTritanopia;
                break;
            case 'a':
                deficiencies = kAllDeficiencies;
                break;

            case 'u':
                config.colourSpace = kCIELuv;
                break;
            case 'c':
                config.metric = kDeltaE2000;
                break;

            case 's':
                save = false;
                break;

            default:
                fprintf(stderr, "Unknown option -%c\n", option[0]);
                return -1;
            }
            option++;
        }
    }

    if (argc > 0)
    {
        fprintf(stderr, "Unrecognised arguments starting with %s\n", argv[0]);
        return -1;
    }

    if (deficiencies)
        config.deficiencies = deficiencies;

    tError error = ValidateConfig(config);
    if (error != kNoError)
        return ReportError("Bad options", error);

    if (!imagePath)
    {
        fprintf(stderr, "No input image, use -f <path>\n");
        return -1;
    }

    int w, h;
    RGBA32* dataIn = (RGBA32*) stbi_load(imagePath, &w, &h, 0, 4);

    if (!dataIn)
    {
        fprintf(stderr, "Couldn't read %s\n", imagePath);
        return -1;
    }

    std::vector<RGBA32> pixels;
    int pw, ph;
    Downsample(w, h, dataIn, resize, &pixels, &pw, &ph);

    stbi_image_free(dataIn);

    std::vector<PaletteEntry> palette;
    error = ExtractDominantColours(pw * ph, pixels.data(), config.numColours, &palette);
    if (error != kNoError)
        return ReportError(imagePath, error);

    PaletteReport report;
    error = Extract(int(palette.size()), palette.data(), config, &report);
    if (error != kNoError)
        return ReportError(imagePath, error);

    PrintReport(stdout, imagePath, report);

    if (!save)
        return 0;

    char baseName[256];
    char dirName[1024];
    GetFileName(baseName, sizeof(baseName), imagePath);

    if (outDir)
        snprintf(dirName, sizeof(dirName), "%s", outDir);
    else
        GetDirName(dirName, sizeof(dirName), imagePath);

    char filename[1280];

    snprintf(filename, sizeof(filename), "%s/%s_palette.txt", dirName, baseName);
    FILE* reportFile = fopen(filename, "w");

    if (!reportFile)
    {
        fprintf(stderr, "Couldn't write %s\n", filename);
        return -1;
    }

    printf("Saving %s\n", filename);
    PrintReport(reportFile, imagePath, report);
    fclose(reportFile);

    std::vector<RGBA32> figure;
    int fw, fh;
    CreateFigure(report, pw, ph, pixels.data(), &figure, &fw, &fh);

    snprintf(filename, sizeof(filename), "%s/%s_palette.png", dirName, baseName);
    printf("Saving %s\n", filename);

    if (!stbi_write_png(filename, fw, fh, 4, figure.data(), 0))
    {
        fprintf(stderr, "Couldn't write %s\n", filename);
        return -1;
    }

    return 0;
}
