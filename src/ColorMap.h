// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <string>
#include <vector>
#include <cstddef>

struct Rgb {
    float r, g, b;
};

// h, s, v in [0, 1]
void HsvToRgb(float h, float s, float v, float& r, float& g, float& b);

// n background colors evenly spaced in hue (saturation 0.6, value 1.0)
std::vector<Rgb> CategoryPalette(size_t n);

// Line color for the i-th plotted series; cycles through kSeriesColors
Rgb SeriesColor(size_t index);

// "#rrggbb" for legends and logs
std::string ColorToHex(const Rgb& c);
