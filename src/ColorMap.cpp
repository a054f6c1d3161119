// Tracemark (MIT License) - See LICENSE file
#include "ColorMap.h"
#include "SeriesStyle.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

void HsvToRgb(float h, float s, float v, float& r, float& g, float& b) {
    h = h - std::floor(h);
    s = std::max(0.0f, std::min(1.0f, s));
    v = std::max(0.0f, std::min(1.0f, v));

    float h6 = h * 6.0f;
    int sector = static_cast<int>(h6) % 6;
    float f = h6 - std::floor(h6);
    float p = v * (1.0f - s);
    float q = v * (1.0f - s * f);
    float t = v * (1.0f - s * (1.0f - f));

    switch (sector) {
        case 0:  r = v; g = t; b = p; break;
        case 1:  r = q; g = v; b = p; break;
        case 2:  r = p; g = v; b = t; break;
        case 3:  r = p; g = q; b = v; break;
        case 4:  r = t; g = p; b = v; break;
        default: r = v; g = p; b = q; break;
    }
}

std::vector<Rgb> CategoryPalette(size_t n) {
    std::vector<Rgb> colors;
    colors.reserve(n);
    for (size_t i = 0; i < n; i++) {
        Rgb c;
        HsvToRgb(static_cast<float>(i) / static_cast<float>(n), 0.6f, 1.0f, c.r, c.g, c.b);
        colors.push_back(c);
    }
    return colors;
}

Rgb SeriesColor(size_t index) {
    const auto& def = kSeriesColors[index % kSeriesColors.size()];
    return {def.r, def.g, def.b};
}

std::string ColorToHex(const Rgb& c) {
    auto toByte = [](float v) {
        return static_cast<int>(std::lround(std::max(0.0f, std::min(1.0f, v)) * 255.0f));
    };
    char buf[8];
    snprintf(buf, sizeof(buf), "#%02x%02x%02x", toByte(c.r), toByte(c.g), toByte(c.b));
    return buf;
}
