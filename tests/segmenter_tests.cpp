// Tracemark (MIT License) - See LICENSE file
#include <catch2/catch.hpp>

#include "Segmenter.h"
#include "ViewerConfig.h"

#include <vector>

namespace segmenter {

TEST_CASE("Segments cover every row exactly once in order", "[segmenter]") {
    const std::vector<size_t> rowCounts = {1, 2, 5, 44999, 45000, 45001, 90000, 90001, 100000};
    const std::vector<size_t> chunkSizes = {1, 7, 1000, 45000};

    for (size_t n : rowCounts) {
        for (size_t c : chunkSizes) {
            INFO("rows " << n << " chunk " << c);
            Segmenter seg(n, c);
            REQUIRE(seg.count() == (n + c - 1) / c);

            size_t expectedBegin = 0;
            for (size_t i = 0; i < seg.count(); i++) {
                RowRange r = seg.segment(i);
                REQUIRE(r.begin == expectedBegin);
                if (i + 1 < seg.count())
                    REQUIRE(r.size() == c);
                else
                    REQUIRE(r.size() >= 1);
                REQUIRE(r.size() <= c);
                expectedBegin = r.end;
            }
            REQUIRE(expectedBegin == n);
        }
    }
}

TEST_CASE("Chunk size zero puts every row in one segment", "[segmenter]") {
    Segmenter seg(1234, 0);
    REQUIRE(seg.count() == 1);
    CHECK(seg.current() == RowRange{0, 1234});
}

TEST_CASE("Empty table has no segments", "[segmenter]") {
    Segmenter seg(0, 45000);
    CHECK(seg.count() == 0);
    CHECK(seg.current().empty());
    CHECK_FALSE(seg.next());
    CHECK_FALSE(seg.prev());
    CHECK_FALSE(seg.goTo(3));
}

TEST_CASE("Segment navigation stops at the ends", "[segmenter]") {
    Segmenter seg(25, 10);
    REQUIRE(seg.count() == 3);
    CHECK(seg.currentIndex() == 0);

    CHECK_FALSE(seg.prev());
    CHECK(seg.next());
    CHECK(seg.current() == RowRange{10, 20});
    CHECK(seg.next());
    CHECK(seg.current() == RowRange{20, 25});
    CHECK_FALSE(seg.next());
    CHECK(seg.currentIndex() == 2);

    CHECK(seg.prev());
    CHECK(seg.currentIndex() == 1);
}

TEST_CASE("Go-to clamps out of range indices", "[segmenter]") {
    Segmenter seg(25, 10);
    CHECK(seg.goTo(99));
    CHECK(seg.currentIndex() == 2);
    CHECK_FALSE(seg.goTo(2));
    CHECK(seg.goTo(0));
    CHECK(seg.current() == RowRange{0, 10});
    CHECK(seg.segment(42) == RowRange{20, 25});
}

TEST_CASE("Reset returns to the first segment", "[segmenter]") {
    Segmenter seg(100, 10);
    seg.goTo(5);
    seg.reset(30, 10);
    CHECK(seg.currentIndex() == 0);
    CHECK(seg.count() == 3);
    CHECK(seg.totalRows() == 30);
    CHECK(seg.segment(2) == RowRange{20, 30});
}

TEST_CASE("Row to segment lookup", "[segmenter]") {
    Segmenter seg(25, 10);
    CHECK(seg.segmentOf(0) == 0);
    CHECK(seg.segmentOf(9) == 0);
    CHECK(seg.segmentOf(10) == 1);
    CHECK(seg.segmentOf(24) == 2);
    CHECK(seg.segmentOf(500) == 2);
}

TEST_CASE("Tables are chunked only above the threshold", "[segmenter][config]") {
    ViewerConfig config;
    CHECK(ChunkSizeFor(0, config) == 0);
    CHECK(ChunkSizeFor(90000, config) == 0);
    CHECK(ChunkSizeFor(90001, config) == 45000);

    Segmenter seg(90001, ChunkSizeFor(90001, config));
    CHECK(seg.count() == 3);
    CHECK(seg.segment(2) == RowRange{90000, 90001});

    config.chunkThreshold = 10;
    config.chunkSize = 4;
    CHECK(ChunkSizeFor(11, config) == 4);
    CHECK(ChunkSizeFor(10, config) == 0);
}

} // namespace segmenter
