// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <cstddef>

// Startup settings. Defaults may be overridden from the command line.
struct ViewerConfig {
    size_t chunkSize = 45000;        // rows per segment once chunking kicks in
    size_t chunkThreshold = 90000;   // tables with more rows than this are chunked
    size_t maxCategories = 30;       // distinct values above this count are "too many"
    size_t maxRows = 0;              // 0 = no limit
};
