// Tracemark (MIT License) - See LICENSE file
#include <catch2/catch.hpp>

#include "CategoryIndex.h"
#include "ColorMap.h"

#include <string>
#include <vector>

namespace category_index {

using Column = std::vector<std::string>;

TEST_CASE("Distinct values keep first-appearance order", "[category]") {
    Column col = {"b", "a", "b", "c", "a", ""};
    auto values = DistinctValuesUpTo(col, 30);
    REQUIRE(values.has_value());
    CHECK(*values == Column{"b", "a", "c", ""});
    CHECK(SortedValues(*values) == Column{"", "a", "b", "c"});
}

TEST_CASE("Distinct values above the limit are not listed", "[category]") {
    Column col;
    for (int i = 0; i < 31; i++)
        col.push_back("v" + std::to_string(i));

    CHECK_FALSE(DistinctValuesUpTo(col, 30).has_value());

    col.pop_back();
    auto values = DistinctValuesUpTo(col, 30);
    REQUIRE(values.has_value());
    CHECK(values->size() == 30);

    CHECK(DistinctValuesUpTo(Column{}, 0).has_value());
    CHECK_FALSE(DistinctValuesUpTo(Column{"x"}, 0).has_value());
}

TEST_CASE("Palette is evenly spaced in hue", "[category][color]") {
    auto palette = CategoryPalette(4);
    REQUIRE(palette.size() == 4);

    CHECK(palette[0].r == Approx(1.0f));
    CHECK(palette[0].g == Approx(0.4f));
    CHECK(palette[0].b == Approx(0.4f));

    CHECK(palette[1].r == Approx(0.7f));
    CHECK(palette[1].g == Approx(1.0f));
    CHECK(palette[1].b == Approx(0.4f));

    CHECK(CategoryPalette(0).empty());
}

TEST_CASE("Color map skips the no-background value", "[category][color]") {
    Column values = {"idle", "run", "stop"};

    auto all = BuildColorMap(values, std::nullopt);
    CHECK(all.size() == 3);

    auto map = BuildColorMap(values, std::string("idle"));
    REQUIRE(map.size() == 2);
    CHECK(map[0].value == "run");
    CHECK(map[1].value == "stop");
    CHECK(FindCategoryColor(map, "idle") == nullptr);
    REQUIRE(FindCategoryColor(map, "stop") != nullptr);
    CHECK(FindCategoryColor(map, "stop")->color.r == Approx(map[1].color.r));
}

TEST_CASE("Category runs group consecutive equal values", "[category]") {
    Column col = {"a", "a", "b", "b", "b", "none", "a"};
    auto map = BuildColorMap(SortedValues({"a", "b", "none"}), std::string("none"));

    auto runs = BuildCategoryRuns(col, RowRange{0, 7}, std::string("none"), map);
    REQUIRE(runs.size() == 3);
    CHECK(runs[0].first == 0);
    CHECK(runs[0].last == 1);
    CHECK(runs[1].first == 2);
    CHECK(runs[1].last == 4);
    CHECK(runs[2].first == 6);
    CHECK(runs[2].last == 6);
    CHECK(runs[0].color.r == Approx(FindCategoryColor(map, "a")->color.r));
}

TEST_CASE("Category runs are cut at segment bounds", "[category]") {
    Column col = {"a", "a", "b", "b", "b", "a"};
    auto map = BuildColorMap({"a", "b"}, std::nullopt);

    auto runs = BuildCategoryRuns(col, RowRange{1, 4}, std::nullopt, map);
    REQUIRE(runs.size() == 2);
    CHECK(runs[0].first == 1);
    CHECK(runs[0].last == 1);
    CHECK(runs[1].first == 2);
    CHECK(runs[1].last == 3);

    CHECK(BuildCategoryRuns(col, RowRange{}, std::nullopt, map).empty());
}

TEST_CASE("Values missing from the color map draw no band", "[category]") {
    Column col = {"a", "x", "x", "a"};
    auto map = BuildColorMap({"a"}, std::nullopt);

    auto runs = BuildCategoryRuns(col, RowRange{0, 4}, std::nullopt, map);
    REQUIRE(runs.size() == 2);
    CHECK(runs[0].first == 0);
    CHECK(runs[1].first == 3);
}

TEST_CASE("Marker rows match the value inside the segment only", "[category][markers]") {
    Column col = {"", "peak", "", "peak", "peak", "", "peak"};
    CHECK(FindMarkerRows(col, RowRange{0, 7}, "peak") == std::vector<size_t>{1, 3, 4, 6});
    CHECK(FindMarkerRows(col, RowRange{2, 5}, "peak") == std::vector<size_t>{3, 4});
    CHECK(FindMarkerRows(col, RowRange{0, 7}, "valley").empty());
}

TEST_CASE("Series colors cycle", "[color]") {
    Rgb first = SeriesColor(0);
    Rgb again = SeriesColor(10);
    CHECK(first.r == again.r);
    CHECK(first.g == again.g);
    CHECK(first.b == again.b);
    CHECK(ColorToHex(Rgb{1.0f, 0.0f, 0.5f}) == "#ff0080");
}

} // namespace category_index
