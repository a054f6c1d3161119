// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstddef>

struct ColumnMeta {
    bool isNumeric = false;            // every non-empty cell parses as a number
    bool tooManyValues = false;        // more distinct values than the category limit
    std::vector<std::string> values;   // distinct values in first-appearance order
};

// Column-major table. Cells keep the exact text read from disk so that a save
// reproduces the file; `numbers` is the float view used for plotting.
struct DataSet {
    std::vector<std::string> columnLabels;
    std::vector<std::vector<std::string>> cells;    // cells[col][row]
    std::vector<std::vector<float>> numbers;        // numbers[col][row], NaN if not numeric
    std::vector<ColumnMeta> columnMeta;
    size_t numRows = 0;
    size_t numCols = 0;

    const std::string& text(size_t row, size_t col) const {
        return cells[col][row];
    }

    float value(size_t row, size_t col) const {
        return numbers[col][row];
    }

    // Finite min and max of a column over [begin, end). Returns false if none.
    bool columnRange(size_t col, size_t begin, size_t end, float& minVal, float& maxVal) const;
};

// Parses a cell as a number. Blank or partially numeric text returns false
// and sets value to NaN.
bool ParseNumber(const std::string& text, float& value);

class DataManager {
public:
    // Progress callback receives (bytesRead, totalBytes), returns false to cancel.
    using ProgressCallback = std::function<bool(size_t bytesRead, size_t totalBytes)>;

    // Load a data file, dispatching on extension. The previous table is kept on failure.
    bool loadFile(const std::string& path, ProgressCallback progress = nullptr, size_t maxRows = 0);
    bool loadCsvFile(const std::string& path, ProgressCallback progress = nullptr, size_t maxRows = 0);
    bool loadParquetFile(const std::string& path, ProgressCallback progress = nullptr, size_t maxRows = 0);

    // Write the table to `path` (format from extension). On success `path`
    // becomes the current file and the unsaved flag is cleared.
    bool save(const std::string& path);
    bool saveAsCsv(const std::string& path);
    bool saveAsParquet(const std::string& path);

    // Overwrite rows first..last (inclusive) of one column.
    bool assignValue(size_t col, size_t first, size_t last, const std::string& value);

    void setCategoryLimit(size_t limit) { m_categoryLimit = limit; }
    size_t categoryLimit() const { return m_categoryLimit; }

    // Returns numCols when no column has that label.
    size_t columnIndex(const std::string& label) const;

    const DataSet& dataset() const { return m_data; }
    const std::string& errorMessage() const { return m_error; }
    const std::string& filePath() const { return m_filePath; }
    bool hasData() const { return m_data.numCols > 0; }
    bool hasUnsavedChanges() const { return m_modified; }

private:
    void finishLoad(DataSet&& data, const std::string& path);
    void refreshColumnMeta(DataSet& data, size_t col) const;

    DataSet m_data;
    std::string m_filePath;
    std::string m_error;
    size_t m_categoryLimit = 30;
    bool m_modified = false;
};
