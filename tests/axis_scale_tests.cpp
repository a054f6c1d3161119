// Tracemark (MIT License) - See LICENSE file
#include <catch2/catch.hpp>

#include "AxisScale.h"
#include "DataManager.h"

#include <cmath>
#include <limits>
#include <vector>

namespace axis_scale {

// Table with numeric columns only; cells are left empty
static DataSet MakeNumericSet(const std::vector<std::vector<float>>& columns) {
    DataSet ds;
    ds.numCols = columns.size();
    ds.numRows = columns.empty() ? 0 : columns[0].size();
    ds.numbers = columns;
    ds.cells.assign(ds.numCols, std::vector<std::string>(ds.numRows));
    ds.columnMeta.assign(ds.numCols, {});
    for (size_t c = 0; c < ds.numCols; c++)
        ds.columnLabels.push_back("c" + std::to_string(c));
    return ds;
}

TEST_CASE("Autoscale fits the segment with a margin", "[axis]") {
    std::vector<float> ramp;
    for (int i = 0; i <= 10; i++)
        ramp.push_back(static_cast<float>(i));
    DataSet ds = MakeNumericSet({ramp});

    ViewRange view = AutoscaleView(ds, {0}, RowRange{0, 11});
    CHECK(view.xMin == Approx(-0.5));
    CHECK(view.xMax == Approx(10.5));
    CHECK(view.yMin == Approx(-0.5));
    CHECK(view.yMax == Approx(10.5));
}

TEST_CASE("Autoscale uses absolute rows and ignores NaN", "[axis]") {
    float nan = std::numeric_limits<float>::quiet_NaN();
    DataSet ds = MakeNumericSet({{100.0f, 1.0f, nan, 3.0f, -50.0f},
                                 {2.0f, nan, 5.0f, 2.0f, 9.0f}});

    ViewRange view = AutoscaleView(ds, {0, 1}, RowRange{1, 4}, 0.0);
    CHECK(view.xMin == Approx(1.0));
    CHECK(view.xMax == Approx(3.0));
    CHECK(view.yMin == Approx(1.0));
    CHECK(view.yMax == Approx(5.0));
}

TEST_CASE("Autoscale handles flat and empty data", "[axis]") {
    float nan = std::numeric_limits<float>::quiet_NaN();
    DataSet flat = MakeNumericSet({{4.0f, 4.0f, 4.0f}});
    ViewRange view = AutoscaleView(flat, {0}, RowRange{0, 3});
    CHECK(view.yMin == Approx(3.5));
    CHECK(view.yMax == Approx(4.5));

    ViewRange single = AutoscaleView(flat, {0}, RowRange{2, 3});
    CHECK(single.xMin == Approx(1.5));
    CHECK(single.xMax == Approx(2.5));

    DataSet blank = MakeNumericSet({{nan, nan}});
    ViewRange none = AutoscaleView(blank, {0}, RowRange{0, 2});
    CHECK(none.yMin == Approx(-0.05));
    CHECK(none.yMax == Approx(1.05));
}

TEST_CASE("Zoom keeps the center fixed", "[axis]") {
    double lo = 0.0, hi = 10.0;
    ZoomLimits(lo, hi, 5.0, 2.0);
    CHECK(lo == Approx(2.5));
    CHECK(hi == Approx(7.5));

    lo = 0.0;
    hi = 10.0;
    ZoomLimits(lo, hi, 0.0, 0.5);
    CHECK(lo == Approx(0.0).margin(1e-12));
    CHECK(hi == Approx(20.0));
}

TEST_CASE("Panning moves the window against the drag", "[axis]") {
    ViewRange view;
    view.xMin = 0.0;
    view.xMax = 100.0;
    view.yMin = 0.0;
    view.yMax = 10.0;

    PanView(view, 100.0, 10.0, 1000, 100);
    CHECK(view.xMin == Approx(-10.0));
    CHECK(view.xMax == Approx(90.0));
    CHECK(view.yMin == Approx(1.0));
    CHECK(view.yMax == Approx(11.0));
}

TEST_CASE("Pixel and data coordinates are inverse", "[axis]") {
    ViewRange view;
    view.xMin = 1000.0;
    view.xMax = 2000.0;
    view.yMin = -1.0;
    view.yMax = 1.0;

    CHECK(DataToPixelX(1000.0, view, 500) == Approx(0.0).margin(1e-9));
    CHECK(DataToPixelX(2000.0, view, 500) == Approx(500.0));
    CHECK(DataToPixelY(1.0, view, 200) == Approx(0.0).margin(1e-9));
    CHECK(DataToPixelY(-1.0, view, 200) == Approx(200.0));

    for (double x : {1000.0, 1234.5, 1999.0})
        CHECK(PixelToDataX(DataToPixelX(x, view, 640), view, 640) == Approx(x));
    for (double y : {-0.75, 0.0, 0.5})
        CHECK(PixelToDataY(DataToPixelY(y, view, 480), view, 480) == Approx(y).margin(1e-12));
}

TEST_CASE("Nice ticks follow the 1-2-5 series", "[axis][ticks]") {
    auto ticks = ComputeNiceTicks(0.0, 10.0, 5);
    CHECK(ticks == std::vector<double>{0.0, 2.0, 4.0, 6.0, 8.0, 10.0});

    ticks = ComputeNiceTicks(0.0, 1.0, 5);
    REQUIRE(ticks.size() == 6);
    CHECK(ticks[1] == Approx(0.2));
    CHECK(ticks[5] == Approx(1.0));

    ticks = ComputeNiceTicks(-3.0, 3.0, 6);
    REQUIRE(ticks.size() == 7);
    CHECK(ticks[3] == 0.0);

    ticks = ComputeNiceTicks(0.0, 45000.0, kXTickTarget);
    REQUIRE_FALSE(ticks.empty());
    CHECK(ticks[1] - ticks[0] == Approx(5000.0));
}

TEST_CASE("Nice ticks reject empty ranges", "[axis][ticks]") {
    CHECK(ComputeNiceTicks(5.0, 5.0, 6).empty());
    CHECK(ComputeNiceTicks(5.0, 1.0, 6).empty());
    CHECK(ComputeNiceTicks(0.0, 1.0, 0).empty());
    CHECK(ComputeNiceTicks(0.0, std::numeric_limits<double>::infinity(), 6).empty());
}

} // namespace axis_scale
