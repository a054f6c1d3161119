// Tracemark (MIT License) - See LICENSE file
#include "CategoryIndex.h"
#include <algorithm>
#include <unordered_set>

std::optional<std::vector<std::string>> DistinctValuesUpTo(const std::vector<std::string>& column,
                                                           size_t limit) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> values;
    for (const auto& text : column) {
        if (!seen.insert(text).second)
            continue;
        if (values.size() == limit)
            return std::nullopt;
        values.push_back(text);
    }
    return values;
}

std::vector<std::string> SortedValues(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    return values;
}

CategoryColorMap BuildColorMap(const std::vector<std::string>& values,
                               const std::optional<std::string>& noBackground) {
    std::vector<const std::string*> shaded;
    for (const auto& v : values) {
        if (noBackground && v == *noBackground)
            continue;
        shaded.push_back(&v);
    }

    auto palette = CategoryPalette(shaded.size());
    CategoryColorMap map;
    map.reserve(shaded.size());
    for (size_t i = 0; i < shaded.size(); i++)
        map.push_back({*shaded[i], palette[i]});
    return map;
}

const CategoryColor* FindCategoryColor(const CategoryColorMap& map, const std::string& value) {
    for (const auto& entry : map)
        if (entry.value == value)
            return &entry;
    return nullptr;
}

std::vector<CategoryRun> BuildCategoryRuns(const std::vector<std::string>& column,
                                           const RowRange& segment,
                                           const std::optional<std::string>& noBackground,
                                           const CategoryColorMap& colors) {
    std::vector<CategoryRun> runs;
    size_t end = std::min(segment.end, column.size());
    if (segment.begin >= end)
        return runs;

    size_t start = segment.begin;
    for (size_t i = segment.begin + 1; i <= end; i++) {
        if (i < end && column[i] == column[start])
            continue;

        const std::string& value = column[start];
        if (!(noBackground && value == *noBackground)) {
            if (const CategoryColor* entry = FindCategoryColor(colors, value))
                runs.push_back({start, i - 1, entry->color});
        }
        start = i;
    }
    return runs;
}

std::vector<size_t> FindMarkerRows(const std::vector<std::string>& column,
                                   const RowRange& segment,
                                   const std::string& value) {
    std::vector<size_t> rows;
    size_t end = std::min(segment.end, column.size());
    for (size_t row = segment.begin; row < end; row++)
        if (column[row] == value)
            rows.push_back(row);
    return rows;
}
