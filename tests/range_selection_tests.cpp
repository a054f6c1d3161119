// Tracemark (MIT License) - See LICENSE file
#include <catch2/catch.hpp>

#include "RangeSelection.h"
#include "DataManager.h"
#include "TestFiles.h"

#include <cmath>
#include <limits>
#include <string>

namespace range_selection {

TEST_CASE("Span ends are rounded to rows and ordered", "[selection]") {
    RowRange segment{0, 100};

    auto rows = MapSpanToRows(10.4, 3.6, segment);
    REQUIRE(rows.has_value());
    CHECK(rows->first == 4);
    CHECK(rows->last == 10);
    CHECK(rows->count() == 7);
}

TEST_CASE("Half rows round away from zero", "[selection]") {
    RowRange segment{0, 100};

    auto rows = MapSpanToRows(2.5, 6.5, segment);
    REQUIRE(rows.has_value());
    CHECK(rows->first == 3);
    CHECK(rows->last == 7);
}

TEST_CASE("Spans are clamped to the segment", "[selection]") {
    RowRange segment{50, 100};

    auto rows = MapSpanToRows(95.2, 130.0, segment);
    REQUIRE(rows.has_value());
    CHECK(rows->first == 95);
    CHECK(rows->last == 99);

    rows = MapSpanToRows(-20.0, 51.4, segment);
    REQUIRE(rows.has_value());
    CHECK(rows->first == 50);
    CHECK(rows->last == 51);

    rows = MapSpanToRows(10.0, 500.0, segment);
    REQUIRE(rows.has_value());
    CHECK(rows->first == 50);
    CHECK(rows->last == 99);
}

TEST_CASE("Spans outside the segment select nothing", "[selection]") {
    RowRange segment{50, 100};

    CHECK_FALSE(MapSpanToRows(120.0, 130.0, segment).has_value());
    CHECK_FALSE(MapSpanToRows(10.0, 20.0, segment).has_value());
    CHECK_FALSE(MapSpanToRows(10.0, 49.4, segment).has_value());
    CHECK_FALSE(MapSpanToRows(99.6, 140.0, segment).has_value());
}

TEST_CASE("Degenerate input selects nothing", "[selection]") {
    double nan = std::numeric_limits<double>::quiet_NaN();
    CHECK_FALSE(MapSpanToRows(nan, 4.0, RowRange{0, 10}).has_value());
    CHECK_FALSE(MapSpanToRows(1.0, 4.0, RowRange{}).has_value());
}

TEST_CASE("A zero-width span selects a single row", "[selection]") {
    auto rows = MapSpanToRows(7.2, 7.2, RowRange{0, 10});
    REQUIRE(rows.has_value());
    CHECK(rows->first == 7);
    CHECK(rows->last == 7);
    CHECK(rows->count() == 1);
}

TEST_CASE("Pixel spans map through the visible window", "[selection]") {
    ViewRange view;
    view.xMin = 0.0;
    view.xMax = 100.0;

    auto rows = MapPixelSpanToRows(200.0, 100.0, view, 1000, RowRange{0, 100});
    REQUIRE(rows.has_value());
    CHECK(rows->first == 10);
    CHECK(rows->last == 20);

    CHECK_FALSE(MapPixelSpanToRows(0.0, 10.0, view, 0, RowRange{0, 100}).has_value());
}

TEST_CASE("Applying a selection writes exactly the closed interval", "[selection][data]") {
    std::string csv = "t,state\n";
    for (int i = 0; i < 20; i++)
        csv += std::to_string(i) + ",idle\n";
    std::string path = test_files::WriteTempFile("apply_selection.csv", csv);

    DataManager dm;
    REQUIRE(dm.loadFile(path));
    size_t state = dm.columnIndex("state");
    REQUIRE(state == 1);

    auto rows = MapSpanToRows(5.4, 8.6, RowRange{0, 20});
    REQUIRE(rows.has_value());
    REQUIRE(ApplySelection(dm, state, *rows, "run"));

    const auto& ds = dm.dataset();
    for (size_t r = 0; r < ds.numRows; r++) {
        INFO("row " << r);
        if (r >= 5 && r <= 9)
            CHECK(ds.text(r, state) == "run");
        else
            CHECK(ds.text(r, state) == "idle");
        CHECK(ds.text(r, 0) == std::to_string(r));
    }
    CHECK(dm.hasUnsavedChanges());
}

} // namespace range_selection
