// Tracemark (MIT License) - See LICENSE file
#include "AxisScale.h"
#include "DataManager.h"
#include <algorithm>
#include <cmath>
#include <limits>

// Pads [lo, hi] by margin * span; degenerate spans get +/-0.5
static void padRange(double& lo, double& hi, double margin) {
    double span = hi - lo;
    if (span <= 0.0) {
        lo -= 0.5;
        hi += 0.5;
        return;
    }
    lo -= span * margin;
    hi += span * margin;
}

ViewRange AutoscaleView(const DataSet& data, const std::vector<size_t>& columns,
                        const RowRange& segment, double margin) {
    ViewRange view;
    if (segment.empty()) {
        view.xMin = static_cast<double>(segment.begin) - 0.5;
        view.xMax = static_cast<double>(segment.begin) + 0.5;
        return view;
    }

    view.xMin = static_cast<double>(segment.begin);
    view.xMax = static_cast<double>(segment.end - 1);
    padRange(view.xMin, view.xMax, margin);

    double yLo = std::numeric_limits<double>::max();
    double yHi = std::numeric_limits<double>::lowest();
    for (size_t col : columns) {
        float mn, mx;
        if (data.columnRange(col, segment.begin, segment.end, mn, mx)) {
            yLo = std::min(yLo, static_cast<double>(mn));
            yHi = std::max(yHi, static_cast<double>(mx));
        }
    }
    if (yLo > yHi) {
        yLo = 0.0;
        yHi = 1.0;
    }
    padRange(yLo, yHi, margin);
    view.yMin = yLo;
    view.yMax = yHi;
    return view;
}

void ZoomLimits(double& lo, double& hi, double center, double scale) {
    if (scale <= 0.0) return;
    double newLo = center - (center - lo) / scale;
    double newHi = center + (hi - center) / scale;
    lo = newLo;
    hi = newHi;
}

void PanView(ViewRange& view, double dxPixels, double dyPixels, int widthPx, int heightPx) {
    if (widthPx <= 0 || heightPx <= 0) return;
    double dx = dxPixels * (view.xMax - view.xMin) / widthPx;
    double dy = dyPixels * (view.yMax - view.yMin) / heightPx;
    view.xMin -= dx;
    view.xMax -= dx;
    view.yMin += dy;
    view.yMax += dy;
}

double PixelToDataX(double px, const ViewRange& view, int widthPx) {
    if (widthPx <= 0) return view.xMin;
    return view.xMin + (px / widthPx) * (view.xMax - view.xMin);
}

double PixelToDataY(double py, const ViewRange& view, int heightPx) {
    if (heightPx <= 0) return view.yMin;
    return view.yMax - (py / heightPx) * (view.yMax - view.yMin);
}

double DataToPixelX(double x, const ViewRange& view, int widthPx) {
    double span = view.xMax - view.xMin;
    if (span == 0.0) return 0.0;
    return (x - view.xMin) / span * widthPx;
}

double DataToPixelY(double y, const ViewRange& view, int heightPx) {
    double span = view.yMax - view.yMin;
    if (span == 0.0) return 0.0;
    return (view.yMax - y) / span * heightPx;
}

std::vector<double> ComputeNiceTicks(double rangeMin, double rangeMax, int approxCount) {
    double range = rangeMax - rangeMin;
    if (!(range > 0.0) || approxCount <= 0 || !std::isfinite(range)) return {};
    double roughStep = range / approxCount;
    double mag = std::pow(10.0, std::floor(std::log10(roughStep)));
    double residual = roughStep / mag;
    double niceStep;
    if (residual <= 1.5) niceStep = mag;
    else if (residual <= 3.5) niceStep = 2.0 * mag;
    else if (residual <= 7.5) niceStep = 5.0 * mag;
    else niceStep = 10.0 * mag;

    double start = std::ceil(rangeMin / niceStep) * niceStep;
    std::vector<double> ticks;
    for (int i = 0;; i++) {
        double v = start + i * niceStep;
        if (v > rangeMax + niceStep * 0.001) break;
        // Snap values like 1e-17 to zero
        if (std::abs(v) < niceStep * 1e-9) v = 0.0;
        ticks.push_back(v);
    }
    return ticks;
}
