// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <cstddef>

struct ViewerConfig;

// Half-open row range [begin, end).
struct RowRange {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }
    bool empty() const { return end <= begin; }
    bool contains(size_t row) const { return row >= begin && row < end; }
    bool operator==(const RowRange& o) const { return begin == o.begin && end == o.end; }
};

// Splits [0, totalRows) into consecutive segments of chunkSize rows (the last
// one may be shorter) and tracks which segment is shown.
class Segmenter {
public:
    Segmenter() = default;
    Segmenter(size_t totalRows, size_t chunkSize);

    // chunkSize 0 puts every row in a single segment. Resets to segment 0.
    void reset(size_t totalRows, size_t chunkSize);

    size_t count() const { return m_count; }
    size_t totalRows() const { return m_totalRows; }
    size_t chunkSize() const { return m_chunkSize; }

    // Out-of-range indices are clamped. Empty when there are no segments.
    RowRange segment(size_t index) const;
    size_t segmentOf(size_t row) const;

    size_t currentIndex() const { return m_current; }
    RowRange current() const { return segment(m_current); }

    // Each returns true if the current segment changed.
    bool next();
    bool prev();
    bool goTo(size_t index);

private:
    size_t m_totalRows = 0;
    size_t m_chunkSize = 0;
    size_t m_count = 0;
    size_t m_current = 0;
};

// Rows per segment for a table: the configured chunk size once the table
// exceeds the chunking threshold, otherwise 0 (one segment).
size_t ChunkSizeFor(size_t totalRows, const ViewerConfig& config);
