// Tracemark (MIT License) - See LICENSE file
#pragma once

#include "Segmenter.h"
#include "AxisScale.h"
#include <optional>
#include <string>

class DataManager;

// Closed interval of absolute row indices.
struct RowInterval {
    size_t first = 0;
    size_t last = 0;

    size_t count() const { return last - first + 1; }
};

// Rounds both ends of a data-space span to the nearest row (half away from
// zero), orders them and clamps to the segment. nullopt when the span misses
// the segment entirely.
std::optional<RowInterval> MapSpanToRows(double x0, double x1, const RowRange& segment);

// Same, starting from the pixel x positions of a drag on the plot.
std::optional<RowInterval> MapPixelSpanToRows(double px0, double px1, const ViewRange& view,
                                              int widthPx, const RowRange& segment);

// Writes `value` into every row of the interval in `column`.
bool ApplySelection(DataManager& data, size_t column, const RowInterval& rows,
                    const std::string& value);
