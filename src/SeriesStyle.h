// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <array>

constexpr int NUM_SERIES_COLORS = 10;

struct SeriesColorDef {
    float r, g, b;
    const char* name;
};

// Series line cycle (Tableau 10)
constexpr std::array<SeriesColorDef, NUM_SERIES_COLORS> kSeriesColors = {{
    {0.122f, 0.467f, 0.706f, "Blue"},
    {1.000f, 0.498f, 0.055f, "Orange"},
    {0.173f, 0.627f, 0.173f, "Green"},
    {0.839f, 0.153f, 0.157f, "Red"},
    {0.580f, 0.404f, 0.741f, "Purple"},
    {0.549f, 0.337f, 0.294f, "Brown"},
    {0.890f, 0.467f, 0.761f, "Pink"},
    {0.498f, 0.498f, 0.498f, "Grey"},
    {0.737f, 0.741f, 0.133f, "Olive"},
    {0.090f, 0.745f, 0.812f, "Cyan"},
}};

constexpr float kSeriesLineWidth = 1.15f;

// Vertical marker lines (#d63031)
constexpr float kMarkerColor[4] = {0.839f, 0.188f, 0.192f, 0.9f};
constexpr float kMarkerLineWidth = 1.0f;

constexpr float kBackgroundAlpha = 0.13f;
constexpr float kLegendPatchAlpha = 0.4f;

// Right-drag span
constexpr float kSelectionColor[4] = {1.0f, 0.0f, 0.0f, 0.3f};

constexpr float kGridColor[4] = {0.0f, 0.0f, 0.0f, 0.12f};
