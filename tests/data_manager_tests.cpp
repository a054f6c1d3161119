// Tracemark (MIT License) - See LICENSE file
#include <catch2/catch.hpp>

#include "DataManager.h"
#include "TestFiles.h"

#include <cmath>
#include <locale>
#include <string>
#include <vector>

namespace data_manager {

using test_files::TempPath;
using test_files::WriteTempFile;

TEST_CASE("CSV load reads header, cells and numbers", "[data][csv]") {
    std::string path = WriteTempFile("basic.csv",
        "time,value,state\n"
        "0,1.5,idle\n"
        "1,,run\n"
        "2,-3e2,run\n");

    DataManager dm;
    REQUIRE(dm.loadFile(path));
    const auto& ds = dm.dataset();

    REQUIRE(ds.numCols == 3);
    REQUIRE(ds.numRows == 3);
    CHECK(ds.columnLabels == std::vector<std::string>{"time", "value", "state"});
    CHECK(ds.text(1, 2) == "run");
    CHECK(ds.value(0, 1) == Approx(1.5f));
    CHECK(std::isnan(ds.value(1, 1)));
    CHECK(ds.value(2, 1) == Approx(-300.0f));
    CHECK(std::isnan(ds.value(0, 2)));

    CHECK(ds.columnMeta[1].isNumeric);
    CHECK_FALSE(ds.columnMeta[2].isNumeric);
    CHECK(ds.columnMeta[2].values == std::vector<std::string>{"idle", "run"});

    CHECK(dm.filePath() == path);
    CHECK(dm.hasData());
    CHECK_FALSE(dm.hasUnsavedChanges());
    CHECK(dm.columnIndex("state") == 2);
    CHECK(dm.columnIndex("missing") == 3);
}

TEST_CASE("CSV quoting: commas, doubled quotes and line breaks", "[data][csv]") {
    std::string path = WriteTempFile("quoted.csv",
        "id,note\r\n"
        "1,\"a, b\"\r\n"
        "2,\"say \"\"hi\"\"\"\r\n"
        "3,\"line one\nline two\"\r\n"
        "4,plain\r\n");

    DataManager dm;
    REQUIRE(dm.loadFile(path));
    const auto& ds = dm.dataset();
    REQUIRE(ds.numRows == 4);
    CHECK(ds.text(0, 1) == "a, b");
    CHECK(ds.text(1, 1) == "say \"hi\"");
    CHECK(ds.text(2, 1) == "line one\nline two");
    CHECK(ds.text(3, 1) == "plain");
}

TEST_CASE("Quotes inside an unquoted field are literal", "[data][csv]") {
    std::string path = WriteTempFile("inch_marks.csv",
        "id,item\n"
        "1,5\" bolt\n"
        "2,3\" nut\n"
        "3,washer\n");

    DataManager dm;
    REQUIRE(dm.loadFile(path));
    REQUIRE(dm.dataset().numRows == 3);
    CHECK(dm.dataset().text(0, 1) == "5\" bolt");
    CHECK(dm.dataset().text(1, 1) == "3\" nut");
    CHECK(dm.dataset().text(2, 1) == "washer");

    std::string target = TempPath("inch_marks_out.csv");
    REQUIRE(dm.save(target));

    DataManager reloaded;
    REQUIRE(reloaded.loadFile(target));
    REQUIRE(reloaded.dataset().numRows == 3);
    CHECK(reloaded.dataset().text(0, 1) == "5\" bolt");
    CHECK(reloaded.dataset().text(1, 1) == "3\" nut");
    CHECK(reloaded.dataset().text(2, 0) == "3");
}

// Decimal comma, as in many European locales
struct CommaDecimal : std::numpunct<char> {
    char do_decimal_point() const override { return ','; }
};

TEST_CASE("Numbers parse the same under any global locale", "[data][csv]") {
    std::locale previous = std::locale::global(std::locale(std::locale::classic(), new CommaDecimal));

    float value = 0.0f;
    bool parsed = ParseNumber("1.5", value);
    bool commaParsed = ParseNumber("1,5", value);

    std::locale::global(previous);

    CHECK(parsed);
    CHECK_FALSE(commaParsed);

    REQUIRE(ParseNumber(" -2.25e1 ", value));
    CHECK(value == Approx(-22.5f));
    REQUIRE(ParseNumber("NA", value));
    CHECK(std::isnan(value));
    CHECK_FALSE(ParseNumber("12abc", value));
    CHECK_FALSE(ParseNumber("", value));
}

TEST_CASE("Header-only CSV loads with zero rows", "[data][csv]") {
    std::string path = WriteTempFile("header_only.csv", "a,b,c\n");
    DataManager dm;
    REQUIRE(dm.loadFile(path));
    CHECK(dm.dataset().numCols == 3);
    CHECK(dm.dataset().numRows == 0);
    CHECK(dm.hasData());
}

TEST_CASE("Blank and repeated labels are made unique", "[data][csv]") {
    std::string path = WriteTempFile("labels.csv", "\xEF\xBB\xBF,x,x\n1,2,3\n");
    DataManager dm;
    REQUIRE(dm.loadFile(path));
    CHECK(dm.dataset().columnLabels == std::vector<std::string>{"Unnamed: 0", "x", "x.1"});
}

TEST_CASE("Short rows are padded, long rows are rejected", "[data][csv]") {
    DataManager dm;
    std::string good = WriteTempFile("short_rows.csv", "a,b,c\n1,2\n4,5,6\n");
    REQUIRE(dm.loadFile(good));
    CHECK(dm.dataset().text(0, 2).empty());
    CHECK(dm.dataset().text(1, 2) == "6");

    std::string bad = WriteTempFile("long_rows.csv", "a,b\n1,2\n3,4,5\n");
    CHECK_FALSE(dm.loadFile(bad));
    CHECK(dm.errorMessage().find("Line 3") != std::string::npos);

    // Previous table is kept
    CHECK(dm.filePath() == good);
    CHECK(dm.dataset().numRows == 2);
}

TEST_CASE("Unreadable input reports an error", "[data][csv]") {
    DataManager dm;
    CHECK_FALSE(dm.loadFile(TempPath("does_not_exist.csv")));
    CHECK_FALSE(dm.errorMessage().empty());

    std::string empty = WriteTempFile("empty.csv", "");
    CHECK_FALSE(dm.loadFile(empty));
    CHECK_FALSE(dm.errorMessage().empty());

    std::string open = WriteTempFile("unterminated.csv", "a,b\n1,\"never closed\n");
    CHECK_FALSE(dm.loadFile(open));
    CHECK_FALSE(dm.hasData());
}

TEST_CASE("Row limit stops reading early", "[data][csv]") {
    std::string csv = "n\n";
    for (int i = 0; i < 100; i++)
        csv += std::to_string(i) + "\n";
    std::string path = WriteTempFile("limited.csv", csv);

    DataManager dm;
    REQUIRE(dm.loadFile(path, nullptr, 10));
    CHECK(dm.dataset().numRows == 10);
    CHECK(dm.dataset().text(9, 0) == "9");
}

TEST_CASE("Columns with too many values are flagged", "[data][category]") {
    std::string csv = "id,group\n";
    for (int i = 0; i < 40; i++)
        csv += std::to_string(i) + ",g" + std::to_string(i % 4) + "\n";
    std::string path = WriteTempFile("categories.csv", csv);

    DataManager dm;
    dm.setCategoryLimit(30);
    REQUIRE(dm.loadFile(path));
    const auto& ds = dm.dataset();
    CHECK(ds.columnMeta[0].tooManyValues);
    CHECK(ds.columnMeta[0].values.empty());
    CHECK_FALSE(ds.columnMeta[1].tooManyValues);
    CHECK(ds.columnMeta[1].values.size() == 4);
}

TEST_CASE("Assigning a value touches exactly the closed interval", "[data][edit]") {
    std::string csv = "t,label\n";
    for (int i = 0; i < 12; i++)
        csv += std::to_string(i) + ",a\n";
    std::string path = WriteTempFile("assign.csv", csv);

    DataManager dm;
    REQUIRE(dm.loadFile(path));
    REQUIRE(dm.assignValue(1, 3, 7, "b"));

    const auto& ds = dm.dataset();
    for (size_t r = 0; r < ds.numRows; r++) {
        INFO("row " << r);
        CHECK(ds.text(r, 1) == ((r >= 3 && r <= 7) ? "b" : "a"));
    }
    CHECK(ds.columnMeta[1].values == std::vector<std::string>{"a", "b"});
    CHECK(dm.hasUnsavedChanges());

    // Single row at the end of the table
    REQUIRE(dm.assignValue(1, 11, 11, "c"));
    CHECK(ds.text(11, 1) == "c");
    CHECK(ds.text(10, 1) == "a");
}

TEST_CASE("Numeric assignments update the plotted values", "[data][edit]") {
    std::string path = WriteTempFile("assign_numeric.csv", "v\n1\n2\n3\n");
    DataManager dm;
    REQUIRE(dm.loadFile(path));
    REQUIRE(dm.assignValue(0, 0, 1, "42"));
    CHECK(dm.dataset().value(0, 0) == Approx(42.0f));
    CHECK(dm.dataset().value(1, 0) == Approx(42.0f));
    CHECK(dm.dataset().value(2, 0) == Approx(3.0f));
}

TEST_CASE("Out of range assignments are rejected", "[data][edit]") {
    std::string path = WriteTempFile("assign_bounds.csv", "a\nx\ny\n");
    DataManager dm;
    REQUIRE(dm.loadFile(path));

    CHECK_FALSE(dm.assignValue(1, 0, 0, "z"));
    CHECK_FALSE(dm.assignValue(0, 1, 0, "z"));
    CHECK_FALSE(dm.assignValue(0, 0, 2, "z"));
    CHECK_FALSE(dm.errorMessage().empty());
    CHECK_FALSE(dm.hasUnsavedChanges());
    CHECK(dm.dataset().text(0, 0) == "x");
}

TEST_CASE("Save then reload reproduces the edited table", "[data][save]") {
    std::string source = WriteTempFile("roundtrip_in.csv",
        "time,value,state\n"
        "0,0.5,idle\n"
        "1,0.7,\"a, b\"\n"
        "2,,idle\n"
        "3,1.25,idle\n"
        "4,2,idle\n");

    DataManager dm;
    REQUIRE(dm.loadFile(source));
    REQUIRE(dm.assignValue(2, 1, 2, "say \"go\""));
    REQUIRE(dm.assignValue(2, 4, 4, "two\nlines"));
    REQUIRE(dm.assignValue(2, 3, 3, "  padded "));

    std::string target = TempPath("roundtrip_out.csv");
    REQUIRE(dm.save(target));

    DataManager reloaded;
    REQUIRE(reloaded.loadFile(target));
    const auto& a = dm.dataset();
    const auto& b = reloaded.dataset();
    REQUIRE(b.numCols == a.numCols);
    REQUIRE(b.numRows == a.numRows);
    CHECK(b.columnLabels == a.columnLabels);
    for (size_t c = 0; c < a.numCols; c++) {
        for (size_t r = 0; r < a.numRows; r++) {
            INFO("row " << r << " col " << c);
            CHECK(b.text(r, c) == a.text(r, c));
        }
    }
    CHECK(b.text(4, 2) == "two\nlines");
}

TEST_CASE("Single-column tables keep empty cells across a save", "[data][save]") {
    std::string source = WriteTempFile("single_col_in.csv", "only\nx\n\"\"\ny\n");
    DataManager dm;
    REQUIRE(dm.loadFile(source));
    REQUIRE(dm.dataset().numRows == 3);

    std::string target = TempPath("single_col_out.csv");
    REQUIRE(dm.save(target));

    DataManager reloaded;
    REQUIRE(reloaded.loadFile(target));
    REQUIRE(reloaded.dataset().numRows == 3);
    CHECK(reloaded.dataset().text(1, 0).empty());
}

TEST_CASE("Unsaved flag follows edits and saves", "[data][save]") {
    std::string source = WriteTempFile("flag_in.csv", "k,v\n1,a\n2,b\n");
    DataManager dm;
    REQUIRE(dm.loadFile(source));
    CHECK_FALSE(dm.hasUnsavedChanges());

    REQUIRE(dm.assignValue(1, 0, 0, "c"));
    CHECK(dm.hasUnsavedChanges());

    // Failed save keeps the flag and the current path
    std::string badTarget = TempPath("no_such_dir") + "/sub/out.csv";
    CHECK_FALSE(dm.save(badTarget));
    CHECK_FALSE(dm.errorMessage().empty());
    CHECK(dm.hasUnsavedChanges());
    CHECK(dm.filePath() == source);

    std::string target = TempPath("flag_out.csv");
    REQUIRE(dm.save(target));
    CHECK_FALSE(dm.hasUnsavedChanges());
    CHECK(dm.filePath() == target);

    REQUIRE(dm.assignValue(1, 1, 1, "d"));
    CHECK(dm.hasUnsavedChanges());
}

TEST_CASE("Loading another file replaces pending edits", "[data][save]") {
    std::string first = WriteTempFile("pending_first.csv", "k,v\n1,a\n2,b\n");
    std::string second = WriteTempFile("pending_second.csv", "x\n9\n");
    DataManager dm;
    REQUIRE(dm.loadFile(first));
    REQUIRE(dm.assignValue(1, 0, 1, "z"));

    // A failed load leaves the edited table and its flag in place
    CHECK_FALSE(dm.loadFile(TempPath("pending_missing.csv")));
    CHECK(dm.hasUnsavedChanges());
    CHECK(dm.dataset().text(0, 1) == "z");

    // A successful load drops the edits, so they must be saved before it
    REQUIRE(dm.loadFile(second));
    CHECK_FALSE(dm.hasUnsavedChanges());
    CHECK(dm.filePath() == second);
    CHECK(test_files::ReadWholeFile(first) == "k,v\n1,a\n2,b\n");
}

TEST_CASE("Saved CSV quotes only where needed", "[data][save]") {
    std::string source = WriteTempFile("quote_out_in.csv", "a,b\n1,x\n");
    DataManager dm;
    REQUIRE(dm.loadFile(source));
    REQUIRE(dm.assignValue(1, 0, 0, "p,q"));

    std::string target = TempPath("quote_out.csv");
    REQUIRE(dm.save(target));
    CHECK(test_files::ReadWholeFile(target) == "a,b\n1,\"p,q\"\n");
}

#ifdef HAS_PARQUET
TEST_CASE("Parquet save then reload keeps every cell", "[data][parquet]") {
    std::string source = WriteTempFile("parquet_in.csv", "t,v,s\n0,1.5,a\n1,,b\n2,3,\"c, d\"\n");
    DataManager dm;
    REQUIRE(dm.loadFile(source));

    std::string target = TempPath("parquet_out.parquet");
    REQUIRE(dm.save(target));

    DataManager reloaded;
    REQUIRE(reloaded.loadFile(target));
    REQUIRE(reloaded.dataset().numRows == 3);
    CHECK(reloaded.dataset().columnLabels == dm.dataset().columnLabels);
    CHECK(reloaded.dataset().text(2, 2) == "c, d");
    CHECK(reloaded.dataset().text(1, 1).empty());
}
#else
TEST_CASE("Parquet paths fail cleanly without Arrow", "[data][parquet]") {
    DataManager dm;
    CHECK_FALSE(dm.loadFile(TempPath("anything.parquet")));
    CHECK(dm.errorMessage().find("Parquet") != std::string::npos);
}
#endif

} // namespace data_manager
