// Tracemark (MIT License) - See LICENSE file
#include "RangeSelection.h"
#include "DataManager.h"
#include <algorithm>
#include <cmath>
#include <utility>

std::optional<RowInterval> MapSpanToRows(double x0, double x1, const RowRange& segment) {
    if (segment.empty() || !std::isfinite(x0) || !std::isfinite(x1))
        return std::nullopt;

    double a = std::round(x0);
    double b = std::round(x1);
    if (a > b) std::swap(a, b);

    double lo = static_cast<double>(segment.begin);
    double hi = static_cast<double>(segment.end - 1);
    if (b < lo || a > hi)
        return std::nullopt;

    RowInterval rows;
    rows.first = static_cast<size_t>(std::max(a, lo));
    rows.last = static_cast<size_t>(std::min(b, hi));
    return rows;
}

std::optional<RowInterval> MapPixelSpanToRows(double px0, double px1, const ViewRange& view,
                                              int widthPx, const RowRange& segment) {
    if (widthPx <= 0)
        return std::nullopt;
    return MapSpanToRows(PixelToDataX(px0, view, widthPx),
                         PixelToDataX(px1, view, widthPx), segment);
}

bool ApplySelection(DataManager& data, size_t column, const RowInterval& rows,
                    const std::string& value) {
    return data.assignValue(column, rows.first, rows.last, value);
}
