// Tracemark (MIT License) - See LICENSE file
#include "DataManager.h"
#include "CategoryIndex.h"
#include <fstream>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <locale>
#include <limits>
#include <cstdio>
#include <unordered_set>
#include <chrono>

bool DataSet::columnRange(size_t col, size_t begin, size_t end, float& minVal, float& maxVal) const {
    minVal = std::numeric_limits<float>::max();
    maxVal = std::numeric_limits<float>::lowest();
    if (col >= numCols) return false;
    end = std::min(end, numRows);
    bool found = false;
    for (size_t r = begin; r < end; r++) {
        float v = numbers[col][r];
        if (std::isfinite(v)) {
            minVal = std::min(minVal, v);
            maxVal = std::max(maxVal, v);
            found = true;
        }
    }
    return found;
}

// Numbers are read in the classic locale so "1.5" parses regardless of the
// user's decimal separator. NaN/NA spellings count as numeric blanks.
bool ParseNumber(const std::string& text, float& value) {
    value = std::numeric_limits<float>::quiet_NaN();
    auto start = text.find_first_not_of(" \t");
    if (start == std::string::npos)
        return false;
    auto end = text.find_last_not_of(" \t");
    std::string tok = text.substr(start, end - start + 1);

    if (tok == "NaN" || tok == "nan" || tok == "NAN" || tok == "NA" || tok == "na")
        return true;
    if (tok == "inf" || tok == "+inf") {
        value = std::numeric_limits<float>::infinity();
        return true;
    }
    if (tok == "-inf") {
        value = -std::numeric_limits<float>::infinity();
        return true;
    }

    std::istringstream ss(tok);
    ss.imbue(std::locale::classic());
    double d;
    if (!(ss >> d) || ss.peek() != std::char_traits<char>::eof())
        return false;
    value = static_cast<float>(d);
    return true;
}

static std::string lowerExtension(const std::string& path) {
    std::string ext;
    auto dot = path.find_last_of('.');
    auto slash = path.find_last_of("/\\");
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        ext = path.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    }
    return ext;
}

static bool isParquetPath(const std::string& path) {
    std::string ext = lowerExtension(path);
    return ext == "parquet" || ext == "pq";
}

// Reads one CSV record, following quoted fields across line breaks.
// Blank lines between records are skipped. Returns false at end of input.
static bool readRecord(std::istream& in, std::vector<std::string>& fields,
                       size_t& bytesRead, size_t& lineNumber, bool& unterminated) {
    fields.clear();
    unterminated = false;

    std::string line;
    for (;;) {
        if (!std::getline(in, line))
            return false;
        bytesRead += line.size() + 1;
        lineNumber++;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            break;
    }

    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;   // any character (or opening quote) seen for this field
    size_t i = 0;
    for (;;) {
        if (i >= line.size()) {
            if (!inQuotes) {
                fields.push_back(std::move(field));
                return true;
            }
            // Quoted field continues on the next physical line
            if (!std::getline(in, line)) {
                unterminated = true;
                fields.push_back(std::move(field));
                return true;
            }
            bytesRead += line.size() + 1;
            lineNumber++;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            field += '\n';
            i = 0;
            continue;
        }

        char c = line[i++];
        if (inQuotes) {
            if (c == '"') {
                if (i < line.size() && line[i] == '"') {
                    field += '"';
                    i++;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"' && !fieldStarted) {
            inQuotes = true;
            fieldStarted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
            fieldStarted = false;
        } else {
            // A quote inside an unquoted field is literal text
            field += c;
            fieldStarted = true;
        }
    }
}

// Blank labels become "Unnamed: i"; repeats get ".1", ".2", ... appended.
static void makeUniqueLabels(std::vector<std::string>& labels) {
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < labels.size(); i++) {
        auto& label = labels[i];
        if (label.find_first_not_of(" \t") == std::string::npos)
            label = "Unnamed: " + std::to_string(i);
        if (seen.insert(label).second)
            continue;
        for (size_t k = 1;; k++) {
            std::string candidate = label + "." + std::to_string(k);
            if (seen.insert(candidate).second) {
                label = candidate;
                break;
            }
        }
    }
}

bool DataManager::loadFile(const std::string& path, ProgressCallback progress, size_t maxRows) {
    if (isParquetPath(path))
        return loadParquetFile(path, progress, maxRows);
    return loadCsvFile(path, progress, maxRows);
}

bool DataManager::loadCsvFile(const std::string& path, ProgressCallback progress, size_t maxRows) {
    using Clock = std::chrono::steady_clock;
    auto tStart = Clock::now();
    auto elapsed = [](Clock::time_point since) {
        return std::chrono::duration<double>(Clock::now() - since).count();
    };

    m_error.clear();

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        m_error = "Cannot open file: " + path;
        return false;
    }

    // Get file size for progress reporting
    file.seekg(0, std::ios::end);
    size_t totalBytes = static_cast<size_t>(file.tellg());
    file.seekg(0, std::ios::beg);
    size_t bytesRead = 0;
    size_t lineNumber = 0;
    bool unterminated = false;

    DataSet data;
    std::vector<std::string> fields;

    try {
        if (!readRecord(file, fields, bytesRead, lineNumber, unterminated)) {
            m_error = "File is empty: no columns to parse";
            return false;
        }
        if (unterminated) {
            m_error = "Line " + std::to_string(lineNumber) + ": unterminated quoted field in header";
            return false;
        }

        // UTF-8 byte order mark
        if (fields[0].compare(0, 3, "\xEF\xBB\xBF") == 0)
            fields[0].erase(0, 3);

        makeUniqueLabels(fields);
        data.columnLabels = fields;
        data.numCols = fields.size();
        data.cells.resize(data.numCols);

        size_t estRows = totalBytes / (data.numCols * 8 + 1);
        for (auto& column : data.cells)
            column.reserve(estRows);

        size_t recordsRead = 0;
        while (readRecord(file, fields, bytesRead, lineNumber, unterminated)) {
            if (unterminated) {
                m_error = "Line " + std::to_string(lineNumber) + ": unterminated quoted field";
                return false;
            }
            if (fields.size() > data.numCols) {
                m_error = "Line " + std::to_string(lineNumber) + ": expected " +
                          std::to_string(data.numCols) + " fields, found " +
                          std::to_string(fields.size());
                return false;
            }
            // Short rows are padded with empty cells
            for (size_t col = 0; col < data.numCols; col++) {
                if (col < fields.size())
                    data.cells[col].push_back(std::move(fields[col]));
                else
                    data.cells[col].emplace_back();
            }
            data.numRows++;
            recordsRead++;

            if (maxRows > 0 && data.numRows >= maxRows) {
                fprintf(stderr, "Row limit reached: %zu rows\n", maxRows);
                break;
            }

            // Report progress every 10000 records
            if (progress && recordsRead % 10000 == 0) {
                if (!progress(bytesRead, totalBytes)) {
                    m_error = "Loading cancelled";
                    return false;
                }
            }
        }
    } catch (const std::exception& e) {
        m_error = std::string("Failed to read CSV: ") + e.what();
        return false;
    }

    fprintf(stderr, "TIMING:   read+parse        %.3f s\n", elapsed(tStart));

    finishLoad(std::move(data), path);
    fprintf(stderr, "TIMING:   CSV loader total  %.3f s\n", elapsed(tStart));
    return true;
}

void DataManager::finishLoad(DataSet&& data, const std::string& path) {
    using Clock = std::chrono::steady_clock;
    auto tMeta = Clock::now();

    data.numbers.assign(data.numCols, {});
    data.columnMeta.assign(data.numCols, {});
    for (size_t col = 0; col < data.numCols; col++) {
        auto& numbers = data.numbers[col];
        numbers.resize(data.numRows);
        for (size_t row = 0; row < data.numRows; row++)
            ParseNumber(data.cells[col][row], numbers[row]);
        refreshColumnMeta(data, col);
    }

    m_data = std::move(data);
    m_filePath = path;
    m_modified = false;

    fprintf(stderr, "Loaded %s: %zu rows x %zu columns\n",
            path.c_str(), m_data.numRows, m_data.numCols);
    for (size_t col = 0; col < m_data.numCols; col++) {
        const auto& meta = m_data.columnMeta[col];
        if (!meta.isNumeric && !meta.tooManyValues)
            fprintf(stderr, "  Categorical column '%s': %zu values\n",
                    m_data.columnLabels[col].c_str(), meta.values.size());
    }
    fprintf(stderr, "TIMING:   column metadata   %.3f s\n",
            std::chrono::duration<double>(Clock::now() - tMeta).count());
}

void DataManager::refreshColumnMeta(DataSet& data, size_t col) const {
    auto& meta = data.columnMeta[col];
    const auto& cells = data.cells[col];

    bool anyValue = false;
    bool allNumeric = true;
    for (size_t row = 0; row < data.numRows; row++) {
        const auto& text = cells[row];
        if (text.find_first_not_of(" \t") == std::string::npos)
            continue;
        anyValue = true;
        float unused;
        if (!ParseNumber(text, unused)) {
            allNumeric = false;
            break;
        }
    }
    meta.isNumeric = anyValue && allNumeric;

    auto distinct = DistinctValuesUpTo(cells, m_categoryLimit);
    meta.tooManyValues = !distinct.has_value();
    meta.values = distinct ? std::move(*distinct) : std::vector<std::string>{};
}

size_t DataManager::columnIndex(const std::string& label) const {
    auto it = std::find(m_data.columnLabels.begin(), m_data.columnLabels.end(), label);
    return static_cast<size_t>(it - m_data.columnLabels.begin());
}

bool DataManager::assignValue(size_t col, size_t first, size_t last, const std::string& value) {
    if (col >= m_data.numCols) {
        m_error = "Column index out of range";
        return false;
    }
    if (first > last || last >= m_data.numRows) {
        m_error = "Row range out of bounds";
        return false;
    }

    auto& cells = m_data.cells[col];
    auto& numbers = m_data.numbers[col];
    float parsed;
    ParseNumber(value, parsed);
    for (size_t row = first; row <= last; row++) {
        cells[row] = value;
        numbers[row] = parsed;
    }
    refreshColumnMeta(m_data, col);
    m_modified = true;

    fprintf(stderr, "Assigned '%s' to rows %zu..%zu of '%s'\n", value.c_str(),
            first, last, m_data.columnLabels[col].c_str());
    return true;
}

bool DataManager::save(const std::string& path) {
    bool ok = isParquetPath(path) ? saveAsParquet(path) : saveAsCsv(path);
    if (ok) {
        m_filePath = path;
        m_modified = false;
    }
    return ok;
}

static void writeCsvField(std::ostream& out, const std::string& field, bool quoteEmpty) {
    bool needsQuotes = field.find_first_of(",\"\r\n") != std::string::npos;
    if (!field.empty() && (field.front() == ' ' || field.front() == '\t' ||
                           field.back() == ' ' || field.back() == '\t'))
        needsQuotes = true;
    if (field.empty() && quoteEmpty)
        needsQuotes = true;

    if (!needsQuotes) {
        out << field;
        return;
    }
    out << '"';
    for (char c : field) {
        if (c == '"') out << '"';
        out << c;
    }
    out << '"';
}

bool DataManager::saveAsCsv(const std::string& path) {
    m_error.clear();
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        m_error = "Cannot open file for writing: " + path;
        return false;
    }

    // A lone empty field would be written as a blank line, which readers skip
    bool quoteEmpty = m_data.numCols == 1;

    // Header
    for (size_t col = 0; col < m_data.numCols; col++) {
        if (col > 0) file << ',';
        writeCsvField(file, m_data.columnLabels[col], quoteEmpty);
    }
    file << '\n';

    // Data rows
    for (size_t row = 0; row < m_data.numRows; row++) {
        for (size_t col = 0; col < m_data.numCols; col++) {
            if (col > 0) file << ',';
            writeCsvField(file, m_data.cells[col][row], quoteEmpty);
        }
        file << '\n';
    }

    file.flush();
    if (!file) {
        m_error = "Write failed: " + path;
        return false;
    }

    fprintf(stderr, "Saved %zu rows to %s\n", m_data.numRows, path.c_str());
    return true;
}

#ifdef HAS_PARQUET
// Parquet I/O via Apache Arrow
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/file_reader.h>
#include <parquet/exception.h>
#endif

bool DataManager::saveAsParquet(const std::string& path) {
#ifndef HAS_PARQUET
    m_error = "Parquet support not available (install apache-arrow and rebuild)";
    return false;
#else
    m_error.clear();

    // Every column is written as UTF-8 text so cell contents round-trip exactly
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    for (size_t col = 0; col < m_data.numCols; col++) {
        fields.push_back(arrow::field(m_data.columnLabels[col], arrow::utf8()));
        arrow::StringBuilder builder;
        auto st = builder.Reserve(static_cast<int64_t>(m_data.numRows));
        if (!st.ok()) { m_error = "Arrow reserve failed: " + st.ToString(); return false; }

        for (size_t row = 0; row < m_data.numRows; row++) {
            st = builder.Append(m_data.cells[col][row]);
            if (!st.ok()) { m_error = "Arrow append failed: " + st.ToString(); return false; }
        }

        std::shared_ptr<arrow::Array> arr;
        st = builder.Finish(&arr);
        if (!st.ok()) { m_error = "Arrow build failed: " + st.ToString(); return false; }
        arrays.push_back(arr);
    }

    auto schema = arrow::schema(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(m_data.numRows));

    auto outResult = arrow::io::FileOutputStream::Open(path);
    if (!outResult.ok()) {
        m_error = "Cannot open file for writing: " + outResult.status().ToString();
        return false;
    }
    auto outfile = *outResult;

    int64_t chunkSize = std::max<int64_t>(1, static_cast<int64_t>(m_data.numRows));
    auto st = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, chunkSize);
    if (!st.ok()) {
        m_error = "Parquet write failed: " + st.ToString();
        return false;
    }
    st = outfile->Close();
    if (!st.ok()) {
        m_error = "Parquet close failed: " + st.ToString();
        return false;
    }

    fprintf(stderr, "Saved %zu rows to %s\n", m_data.numRows, path.c_str());
    return true;
#endif
}

#ifdef HAS_PARQUET
// Appends the text form of every value in one chunk; nulls become empty cells.
static arrow::Status appendChunkText(const std::shared_ptr<arrow::Array>& arr,
                                     std::vector<std::string>& out) {
    int64_t len = arr->length();
    auto typeId = arr->type_id();
    if (typeId == arrow::Type::STRING) {
        auto strArr = std::static_pointer_cast<arrow::StringArray>(arr);
        for (int64_t r = 0; r < len; r++)
            out.push_back(arr->IsNull(r) ? std::string() : strArr->GetString(r));
        return arrow::Status::OK();
    }
    if (typeId == arrow::Type::LARGE_STRING) {
        auto strArr = std::static_pointer_cast<arrow::LargeStringArray>(arr);
        for (int64_t r = 0; r < len; r++)
            out.push_back(arr->IsNull(r) ? std::string() : strArr->GetString(r));
        return arrow::Status::OK();
    }
    for (int64_t r = 0; r < len; r++) {
        if (arr->IsNull(r)) {
            out.emplace_back();
            continue;
        }
        auto scalar = arr->GetScalar(r);
        if (!scalar.ok())
            return scalar.status();
        out.push_back((*scalar)->ToString());
    }
    return arrow::Status::OK();
}
#endif

bool DataManager::loadParquetFile(const std::string& path, ProgressCallback progress, size_t maxRows) {
#ifndef HAS_PARQUET
    m_error = "Parquet support not available (install apache-arrow and rebuild)";
    return false;
#else
    using Clock = std::chrono::steady_clock;
    auto tStart = Clock::now();
    auto elapsed = [](Clock::time_point since) {
        return std::chrono::duration<double>(Clock::now() - since).count();
    };

    m_error.clear();

    std::shared_ptr<arrow::Table> table;
    try {
        auto result = arrow::io::ReadableFile::Open(path);
        if (!result.ok()) {
            m_error = "Cannot open parquet file: " + result.status().ToString();
            return false;
        }
        auto infile = *result;

        auto readerResult = parquet::arrow::FileReader::Make(
            arrow::default_memory_pool(), parquet::ParquetFileReader::Open(infile));
        if (!readerResult.ok()) {
            m_error = "Cannot read parquet file: " + readerResult.status().ToString();
            return false;
        }
        auto reader = std::move(*readerResult);

        auto st = reader->ReadTable(&table);
        if (!st.ok()) {
            m_error = "Failed to read parquet table: " + st.ToString();
            return false;
        }
    } catch (const parquet::ParquetException& e) {
        m_error = std::string("Cannot read parquet file: ") + e.what();
        return false;
    }

    fprintf(stderr, "TIMING:   parquet read      %.3f s\n", elapsed(tStart));

    if (maxRows > 0 && table->num_rows() > static_cast<int64_t>(maxRows))
        table = table->Slice(0, static_cast<int64_t>(maxRows));

    DataSet data;
    data.numCols = static_cast<size_t>(table->num_columns());
    data.numRows = static_cast<size_t>(table->num_rows());
    data.cells.resize(data.numCols);
    for (size_t col = 0; col < data.numCols; col++) {
        data.columnLabels.push_back(table->field(static_cast<int>(col))->name());
        auto chunked = table->column(static_cast<int>(col));
        auto& column = data.cells[col];
        column.reserve(data.numRows);
        for (int chunk = 0; chunk < chunked->num_chunks(); chunk++) {
            auto st = appendChunkText(chunked->chunk(chunk), column);
            if (!st.ok()) {
                m_error = "Failed to convert column '" + data.columnLabels.back() + "': " + st.ToString();
                return false;
            }
        }

        if (progress && !progress(col + 1, data.numCols)) {
            m_error = "Loading cancelled";
            return false;
        }
    }

    makeUniqueLabels(data.columnLabels);
    finishLoad(std::move(data), path);
    fprintf(stderr, "TIMING:   parquet total     %.3f s\n", elapsed(tStart));
    return true;
#endif // HAS_PARQUET
}
