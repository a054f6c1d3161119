// Tracemark (MIT License) - See LICENSE file
#pragma once

#include "Segmenter.h"
#include <vector>
#include <cstddef>

struct DataSet;

// Visible data window of the plot. x is the absolute row index.
struct ViewRange {
    double xMin = 0.0, xMax = 1.0;
    double yMin = 0.0, yMax = 1.0;
};

constexpr double kAutoscaleMargin = 0.05;
constexpr double kWheelZoomStep = 1.1;
// Approximate tick counts shared by grid lines and axis labels
constexpr int kXTickTarget = 8;
constexpr int kYTickTarget = 6;

// Fits x to the segment and y to the finite values of the given columns.
ViewRange AutoscaleView(const DataSet& data, const std::vector<size_t>& columns,
                        const RowRange& segment, double margin = kAutoscaleMargin);

// Scales [lo, hi] about `center`: scale > 1 zooms in.
void ZoomLimits(double& lo, double& hi, double center, double scale);

// Shifts the view by a pixel delta (positive dx moves content right).
void PanView(ViewRange& view, double dxPixels, double dyPixels, int widthPx, int heightPx);

// Pixel <-> data. Pixel y grows downwards.
double PixelToDataX(double px, const ViewRange& view, int widthPx);
double PixelToDataY(double py, const ViewRange& view, int heightPx);
double DataToPixelX(double x, const ViewRange& view, int widthPx);
double DataToPixelY(double y, const ViewRange& view, int heightPx);

// "Nice" tick values (1, 2, 5 x 10^n series) inside [rangeMin, rangeMax]
std::vector<double> ComputeNiceTicks(double rangeMin, double rangeMax, int approxCount);
