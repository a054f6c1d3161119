// Tracemark (MIT License) - See LICENSE file
#include "Segmenter.h"
#include "ViewerConfig.h"
#include <algorithm>

Segmenter::Segmenter(size_t totalRows, size_t chunkSize) {
    reset(totalRows, chunkSize);
}

void Segmenter::reset(size_t totalRows, size_t chunkSize) {
    m_totalRows = totalRows;
    m_chunkSize = (chunkSize == 0) ? totalRows : chunkSize;
    if (totalRows == 0)
        m_count = 0;
    else
        m_count = (totalRows + m_chunkSize - 1) / m_chunkSize;
    m_current = 0;
}

RowRange Segmenter::segment(size_t index) const {
    if (m_count == 0)
        return {};
    index = std::min(index, m_count - 1);
    RowRange range;
    range.begin = index * m_chunkSize;
    range.end = std::min(range.begin + m_chunkSize, m_totalRows);
    return range;
}

size_t Segmenter::segmentOf(size_t row) const {
    if (m_count == 0)
        return 0;
    return std::min(row / m_chunkSize, m_count - 1);
}

bool Segmenter::next() {
    if (m_current + 1 >= m_count)
        return false;
    m_current++;
    return true;
}

bool Segmenter::prev() {
    if (m_current == 0)
        return false;
    m_current--;
    return true;
}

bool Segmenter::goTo(size_t index) {
    if (m_count == 0)
        return false;
    index = std::min(index, m_count - 1);
    if (index == m_current)
        return false;
    m_current = index;
    return true;
}

size_t ChunkSizeFor(size_t totalRows, const ViewerConfig& config) {
    if (totalRows > config.chunkThreshold && config.chunkSize > 0)
        return config.chunkSize;
    return 0;
}
