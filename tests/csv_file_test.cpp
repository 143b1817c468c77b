/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the csvidx library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file csv_file_test.cpp
 * @brief Tests for the CsvFile lifecycle, indexing and random access
 *
 * Test categories:
 *   1. Lifecycle and state errors
 *   2. Indexing (counts, sizes, caps, progress)
 *   3. Random access (getLine)
 *   4. File shape edge cases (CRLF, BOM, no trailing newline, mixed divisors)
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <csvidx/csvidx.h>

namespace fs = std::filesystem;

using csvidx::Cell;
using csvidx::CsvFile;
using csvidx::FileState;
using csvidx::Header;
using csvidx::LineDivisor;

// ============================================================================
// Test fixture
// ============================================================================

class CsvFileTest : public ::testing::Test {
protected:
    fs::path tmpDir_;

    void SetUp() override {
        // Per-test subdirectory prevents parallel TearDown races.
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = fs::temp_directory_path() / "csvidx_file_test"
                  / (std::string(info->test_suite_name()) + "_" + info->name());
        fs::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tmpDir_, ec);
    }

    /// Write content byte-exact (binary mode, no newline translation)
    fs::path writeFile(const std::string& name, const std::string& content) const {
        fs::path path = tmpDir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

// ============================================================================
// 1. Lifecycle and state errors
// ============================================================================

TEST_F(CsvFileTest, ConstructedEngineIsClosed) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n"));
    EXPECT_EQ(csv.state(), FileState::CLOSED);
    EXPECT_FALSE(csv.isOpen());
    EXPECT_FALSE(csv.isIndexed());
    EXPECT_EQ(csv.delimiter(), ',');
    EXPECT_FALSE(csv.lineDivisor().has_value());
}

TEST_F(CsvFileTest, OperationsOnClosedEngineThrowStateError) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n"));
    EXPECT_THROW(csv.close(), csvidx::StateError);
    EXPECT_THROW(csv.rewind(), csvidx::StateError);
    EXPECT_THROW(csv.buildIndex(), csvidx::StateError);
    EXPECT_THROW(csv.getLine(1), csvidx::StateError);
    EXPECT_THROW(csv.iterator(), csvidx::StateError);
    EXPECT_EQ(csv.state(), FileState::CLOSED);
}

TEST_F(CsvFileTest, OpenTwiceThrowsStateError) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n"));
    csv.open();
    EXPECT_EQ(csv.state(), FileState::OPEN);
    EXPECT_THROW(csv.open(), csvidx::StateError);
    EXPECT_EQ(csv.state(), FileState::OPEN);
}

TEST_F(CsvFileTest, OpenMissingFileThrowsIOError) {
    CsvFile csv(tmpDir_ / "missing.csv");
    try {
        csv.open();
        FAIL() << "expected IOError";
    } catch (const csvidx::IOError& ex) {
        EXPECT_NE(std::string(ex.what()).find("missing.csv"), std::string::npos);
    }
    EXPECT_EQ(csv.state(), FileState::CLOSED);
}

TEST_F(CsvFileTest, OpenOnConstruct) {
    CsvFile csv(writeFile("a.csv", "a;b\n1;2\n"), CsvFile::Options{';', true});
    EXPECT_TRUE(csv.isOpen());
    EXPECT_EQ(csv.delimiter(), ';');
    EXPECT_EQ(csv.lineDivisor(), LineDivisor::LF);
}

TEST_F(CsvFileTest, BuildIndexTwiceThrowsStateError) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n"));
    csv.open();
    csv.buildIndex();
    EXPECT_THROW(csv.buildIndex(), csvidx::StateError);
    EXPECT_TRUE(csv.isIndexed());
}

TEST_F(CsvFileTest, AccessorsBeforeIndexCarryStateError) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n"));
    csv.open();

    EXPECT_FALSE(csv.lines().ok());
    EXPECT_FALSE(csv.header());
    EXPECT_NE(csv.columns().error(), nullptr);
    EXPECT_THROW(csv.size().value(), csvidx::StateError);
    EXPECT_THROW(csv.maxRowLength().value(), csvidx::StateError);
    EXPECT_EQ(csv.lines().valueOr(42), 42u);
    EXPECT_THROW(csv.getLine(1), csvidx::StateError);
}

TEST_F(CsvFileTest, PreservingCloseKeepsIndex) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n3,4\n"));
    csv.open();
    csv.buildIndex();

    csv.close(CsvFile::CloseOptions{true});
    EXPECT_EQ(csv.state(), FileState::CLOSED);
    csv.open();
    EXPECT_EQ(csv.state(), FileState::INDEXED);
    EXPECT_EQ(csv.lines().value(), 2u);
    EXPECT_EQ(*csv.getLine(2).line, "3,4");
}

TEST_F(CsvFileTest, FullCloseDiscardsIndex) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n3,4\n"));
    csv.open();
    csv.buildIndex();
    csv.close();

    csv.open();
    EXPECT_EQ(csv.state(), FileState::OPEN);
    EXPECT_FALSE(csv.lines().ok());
    EXPECT_THROW(csv.getLine(1), csvidx::StateError);
}

TEST_F(CsvFileTest, RewindKeepsIndex) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n3,4\n"));
    csv.open();
    csv.buildIndex();
    csv.rewind();
    EXPECT_EQ(csv.state(), FileState::INDEXED);
    EXPECT_EQ(*csv.getLine(1).line, "1,2");
}

// ============================================================================
// 2. Indexing
// ============================================================================

TEST_F(CsvFileTest, IndexCountsRowsAndBytes) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n33,4\n"));
    csv.open();
    csv.buildIndex();

    EXPECT_EQ(csv.state(), FileState::INDEXED);
    EXPECT_EQ(csv.header().value(), (Header{"a", "b"}));
    EXPECT_EQ(csv.columns().value(), 2u);
    EXPECT_EQ(csv.lines().value(), 2u);
    EXPECT_EQ(csv.size().value(), 13u);
    EXPECT_EQ(csv.maxRowLength().value(), 5u);
}

TEST_F(CsvFileTest, MaxRowsCapsScan) {
    fs::path path = writeFile("a.csv", "h\n1\n2\n3\n4\n5\n");
    {
        CsvFile csv(path);
        csv.open();
        csv.buildIndex(CsvFile::IndexOptions{3, {}});
        EXPECT_EQ(csv.lines().value(), 3u);
        EXPECT_EQ(csv.size().value(), 8u);
        EXPECT_THROW(csv.getLine(4), csvidx::RangeError);
        EXPECT_EQ(*csv.getLine(3).line, "3");
    }
    {
        CsvFile csv(path);
        csv.open();
        csv.buildIndex(CsvFile::IndexOptions{0, {}});
        EXPECT_EQ(csv.lines().value(), 0u);
        EXPECT_EQ(csv.header().value(), (Header{"h"}));
    }
    {
        CsvFile csv(path);
        csv.open();
        csv.buildIndex(CsvFile::IndexOptions{100, {}});
        EXPECT_EQ(csv.lines().value(), 5u);
    }
}

TEST_F(CsvFileTest, ProgressReportsBytesWithoutCap) {
    CsvFile csv(writeFile("a.csv", "a\n1\n22\n333\n"));
    csv.open();

    std::vector<uint64_t> calls;
    CsvFile::IndexOptions options;
    options.progress = [&calls](uint64_t current) { calls.push_back(current); };
    csv.buildIndex(options);

    EXPECT_EQ(calls, (std::vector<uint64_t>{4, 7, 11}));
    EXPECT_EQ(calls.back(), csv.size().value());
}

TEST_F(CsvFileTest, ProgressReportsRowsWithCap) {
    CsvFile csv(writeFile("a.csv", "a\n1\n22\n333\n"));
    csv.open();

    std::vector<uint64_t> calls;
    csv.buildIndex(CsvFile::IndexOptions{2, [&calls](uint64_t current) { calls.push_back(current); }});

    EXPECT_EQ(calls, (std::vector<uint64_t>{1, 2}));
}

TEST_F(CsvFileTest, EmptyFileHasNoHeaderAndNoRows) {
    CsvFile csv(writeFile("empty.csv", ""));
    csv.open();
    csv.buildIndex();

    EXPECT_TRUE(csv.header().value().empty());
    EXPECT_EQ(csv.columns().value(), 0u);
    EXPECT_EQ(csv.lines().value(), 0u);
    EXPECT_EQ(csv.size().value(), 0u);
    EXPECT_THROW(csv.getLine(1), csvidx::RangeError);
}

TEST_F(CsvFileTest, HeaderOnlyFile) {
    CsvFile csv(writeFile("a.csv", "x,y,z\n"));
    csv.open();
    csv.buildIndex();

    EXPECT_EQ(csv.columns().value(), 3u);
    EXPECT_EQ(csv.lines().value(), 0u);
    EXPECT_EQ(csv.size().value(), 6u);
}

// ============================================================================
// 3. Random access
// ============================================================================

TEST_F(CsvFileTest, GetLineDecodesRow) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,\n"));
    csv.open();
    csv.buildIndex();

    csvidx::RowRecord rec = csv.getLine(1);
    EXPECT_EQ(rec.index, 1u);
    EXPECT_EQ(*rec.line, "1,");
    EXPECT_EQ(std::get<Cell>(rec.field("a")), Cell{"1"});
    EXPECT_EQ(std::get<Cell>(rec.field("b")), std::nullopt);
    EXPECT_TRUE(rec.unnamed.empty());
    EXPECT_FALSE(rec.hasExcessCells);
}

TEST_F(CsvFileTest, GetLineOutOfRangeThrowsRangeError) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n3,4\n"));
    csv.open();
    csv.buildIndex();

    EXPECT_THROW(csv.getLine(0), csvidx::RangeError);
    try {
        csv.getLine(3);
        FAIL() << "expected RangeError";
    } catch (const csvidx::RangeError& ex) {
        EXPECT_NE(std::string(ex.what()).find("between 1 and 2"), std::string::npos);
    }
    // Failure does not change state
    EXPECT_EQ(csv.state(), FileState::INDEXED);
    EXPECT_EQ(*csv.getLine(2).line, "3,4");
}

TEST_F(CsvFileTest, GetLineIsOrderIndependent) {
    std::string content = "n,sq\n";
    for (int i = 1; i <= 500; ++i) {
        content += std::to_string(i) + "," + std::to_string(i * i) + "\n";
    }
    CsvFile csv(writeFile("a.csv", content));
    csv.open();
    csv.buildIndex();

    for (size_t row : {500u, 1u, 250u, 499u, 2u, 250u}) {
        csvidx::RowRecord rec = csv.getLine(row);
        EXPECT_EQ(rec.index, row);
        EXPECT_EQ(rec.values("n"), (std::vector<Cell>{std::to_string(row)}));
        EXPECT_EQ(rec.values("sq"), (std::vector<Cell>{std::to_string(row * row)}));
    }
}

TEST_F(CsvFileTest, GetLineTrimsSurroundingWhitespace) {
    CsvFile csv(writeFile("a.csv", "a,b\n  1,2 \t\n"));
    csv.open();
    csv.buildIndex();
    EXPECT_EQ(*csv.getLine(1).line, "1,2");
}

TEST_F(CsvFileTest, GetLineDetectsTruncatedFile) {
    fs::path path = writeFile("a.csv", "a,b\n1,2\n3,4\n5,6\n");
    CsvFile csv(path);
    csv.open();
    csv.buildIndex();

    fs::resize_file(path, 9);
    EXPECT_THROW(csv.getLine(3), csvidx::IOError);
    EXPECT_EQ(*csv.getLine(1).line, "1,2");
}

// ============================================================================
// 4. File shape edge cases
// ============================================================================

TEST_F(CsvFileTest, CrlfFileUsesTwoByteDivisor) {
    CsvFile csv(writeFile("a.csv", "a,b\r\n1,2\r\n33,4\r\n"));
    csv.open();
    EXPECT_EQ(csv.lineDivisor(), LineDivisor::CRLF);
    csv.buildIndex();

    EXPECT_EQ(csv.size().value(), 16u);
    EXPECT_EQ(csv.maxRowLength().value(), 6u);
    EXPECT_EQ(*csv.getLine(1).line, "1,2");
    EXPECT_EQ(*csv.getLine(2).line, "33,4");
}

TEST_F(CsvFileTest, LastRowWithoutTrailingNewline) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2\n3,4"));
    csv.open();
    csv.buildIndex();

    EXPECT_EQ(csv.lines().value(), 2u);
    EXPECT_EQ(*csv.getLine(2).line, "3,4");
}

TEST_F(CsvFileTest, ByteOrderMarkIsCountedButNotNamed) {
    CsvFile csv(writeFile("a.csv", "\xEF\xBB\xBF" "a,b\n1,2\n"));
    csv.open();
    csv.buildIndex();

    EXPECT_EQ(csv.header().value(), (Header{"a", "b"}));
    EXPECT_EQ(csv.size().value(), 11u);
    EXPECT_EQ(*csv.getLine(1).line, "1,2");
    EXPECT_TRUE(csv.getLine(1).hasField("a"));
}

TEST_F(CsvFileTest, BlankLineIsARowOfOneNullCell) {
    CsvFile csv(writeFile("a.csv", "a,b\n\n1,2\n"));
    csv.open();
    csv.buildIndex();

    ASSERT_EQ(csv.lines().value(), 2u);
    csvidx::RowRecord rec = csv.getLine(1);
    EXPECT_EQ(*rec.line, "");
    EXPECT_EQ(rec.cells, (std::vector<Cell>{std::nullopt}));
    EXPECT_TRUE(rec.hasMissingCells);
    EXPECT_EQ(*csv.getLine(2).line, "1,2");
}

TEST_F(CsvFileTest, MixedDivisorsMisalignLaterRows) {
    // The divisor is sniffed once for the whole file; LF rows after a CRLF
    // header are indexed one byte too long each.
    std::string content = "a,b\r\n";
    for (int i = 0; i < 10; ++i) {
        content += std::to_string(i) + "," + std::to_string(i) + "\n";
    }
    CsvFile csv(writeFile("mixed.csv", content));
    csv.open();
    ASSERT_EQ(csv.lineDivisor(), LineDivisor::CRLF);
    csv.buildIndex();

    auto rows = csv.iterator();
    std::vector<std::string> streamed;
    for (const auto& rec : *rows) {
        streamed.push_back(*rec.line);
    }
    ASSERT_EQ(streamed.size(), 10u);
    EXPECT_EQ(streamed[2], "2,2");
    EXPECT_NE(*csv.getLine(3).line, streamed[2]);
}

TEST_F(CsvFileTest, RowsWiderAndNarrowerThanHeader) {
    CsvFile csv(writeFile("a.csv", "a,b\n1,2,3,4\n5\n"));
    csv.open();
    csv.buildIndex();

    csvidx::RowRecord wide = csv.getLine(1);
    EXPECT_TRUE(wide.hasExcessCells);
    EXPECT_EQ(wide.unnamed, (std::vector<Cell>{"3", "4"}));

    csvidx::RowRecord narrow = csv.getLine(2);
    EXPECT_TRUE(narrow.hasMissingCells);
    EXPECT_EQ(std::get<Cell>(narrow.field("b")), std::nullopt);
}

TEST_F(CsvFileTest, RaggedRowsAgreeAcrossAccessPaths) {
    CsvFile csv(writeFile("ragged.csv", "a,b\n1,2\n3,4,5\n6\n"));
    csv.open();
    csv.buildIndex();

    EXPECT_EQ(csv.columns().value(), 2u);
    EXPECT_EQ(csv.lines().value(), 3u);

    csvidx::RowRecord first = csv.getLine(1);
    EXPECT_EQ(std::get<Cell>(first.field("a")), Cell{"1"});
    EXPECT_EQ(std::get<Cell>(first.field("b")), Cell{"2"});
    EXPECT_TRUE(first.unnamed.empty());

    csvidx::RowRecord wide = csv.getLine(2);
    EXPECT_EQ(std::get<Cell>(wide.field("a")), Cell{"3"});
    EXPECT_EQ(std::get<Cell>(wide.field("b")), Cell{"4"});
    EXPECT_EQ(wide.unnamed, (std::vector<Cell>{"5"}));
    EXPECT_TRUE(wide.hasExcessCells);

    csvidx::RowRecord narrow = csv.getLine(3);
    EXPECT_EQ(std::get<Cell>(narrow.field("a")), Cell{"6"});
    EXPECT_EQ(std::get<Cell>(narrow.field("b")), std::nullopt);
    EXPECT_TRUE(narrow.hasMissingCells);

    std::vector<csvidx::RowRecord> streamed;
    for (const auto& rec : *csv.iterator()) {
        streamed.push_back(rec);
    }
    ASSERT_EQ(streamed.size(), 3u);
    EXPECT_EQ(streamed[0], first);
    EXPECT_EQ(streamed[1], wide);
    EXPECT_EQ(streamed[2], narrow);
}

TEST_F(CsvFileTest, StateAndVersionStrings) {
    CsvFile csv(writeFile("a.csv", "a\n1\n"));
    EXPECT_EQ(csvidx::fileStateToString(csv.state()), "closed");
    csv.open();
    EXPECT_EQ(csvidx::fileStateToString(csv.state()), "open");
    csv.buildIndex();
    EXPECT_EQ(csvidx::fileStateToString(csv.state()), "indexed");

    EXPECT_EQ(csvidx::getVersion(), std::to_string(csvidx::VERSION_MAJOR) + "." +
                                    std::to_string(csvidx::VERSION_MINOR) + "." +
                                    std::to_string(csvidx::VERSION_PATCH));
}
