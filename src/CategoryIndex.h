// Tracemark (MIT License) - See LICENSE file
#pragma once

#include "ColorMap.h"
#include "Segmenter.h"
#include <optional>
#include <string>
#include <vector>

// Distinct values of a column in order of first appearance, or nullopt when
// there are more than `limit` of them.
std::optional<std::vector<std::string>> DistinctValuesUpTo(const std::vector<std::string>& column,
                                                           size_t limit);

// Copy sorted for display in choice controls
std::vector<std::string> SortedValues(std::vector<std::string> values);

struct CategoryColor {
    std::string value;
    Rgb color;
};

// Ordered value -> background color assignment
using CategoryColorMap = std::vector<CategoryColor>;

// Pairs each value except `noBackground` with a palette color.
CategoryColorMap BuildColorMap(const std::vector<std::string>& values,
                               const std::optional<std::string>& noBackground);

const CategoryColor* FindCategoryColor(const CategoryColorMap& map, const std::string& value);

// A maximal run of equal values inside a segment, rows first..last inclusive.
struct CategoryRun {
    size_t first = 0;
    size_t last = 0;
    Rgb color = {0.0f, 0.0f, 0.0f};
};

// Runs of the no-background value and of values missing from the map are skipped.
std::vector<CategoryRun> BuildCategoryRuns(const std::vector<std::string>& column,
                                           const RowRange& segment,
                                           const std::optional<std::string>& noBackground,
                                           const CategoryColorMap& colors);

// Rows of the segment whose text equals `value`.
std::vector<size_t> FindMarkerRows(const std::vector<std::string>& column,
                                   const RowRange& segment,
                                   const std::string& value);
