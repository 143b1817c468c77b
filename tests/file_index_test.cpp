/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the csvidx library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file file_index_test.cpp
 * @brief Tests for FileIndex: row bookkeeping and the sidecar format
 */

#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include <csvidx/csvidx.h>

using csvidx::FileIndex;
using csvidx::LineDivisor;
using csvidx::RowIndexEntry;

namespace {

    FileIndex makeIndex(size_t rows) {
        FileIndex index;
        index.setHeaderLine("a,b,c");
        index.setDivisor(LineDivisor::CRLF);
        uint64_t offset = 7;
        for (size_t i = 0; i < rows; ++i) {
            const uint64_t length = 4 + (i % 13);
            index.addRow(offset, length);
            offset += length;
        }
        index.setScannedSize(offset);
        index.setSourceSize(offset);
        return index;
    }

    std::string serialize(FileIndex& index) {
        std::ostringstream out(std::ios::binary);
        EXPECT_TRUE(index.write(out)) << index.getErrorMsg();
        return out.str();
    }

} // namespace

// ============================================================================
// Row bookkeeping
// ============================================================================

TEST(FileIndexTest, RowsAreOneBased) {
    FileIndex index;
    index.addRow(4, 6);
    index.addRow(10, 3);

    EXPECT_EQ(index.rowCount(), 2u);
    EXPECT_FALSE(index.hasRow(0));
    EXPECT_TRUE(index.hasRow(1));
    EXPECT_TRUE(index.hasRow(2));
    EXPECT_FALSE(index.hasRow(3));
    EXPECT_EQ(index.row(1), RowIndexEntry(4, 6));
    EXPECT_EQ(index.row(2), RowIndexEntry(10, 3));
    EXPECT_THROW(index.row(0), csvidx::RangeError);
    EXPECT_THROW(index.row(3), csvidx::RangeError);
}

TEST(FileIndexTest, TracksMaxRowLength) {
    FileIndex index;
    index.addRow(0, 5);
    index.addRow(5, 12);
    index.addRow(17, 2);
    EXPECT_EQ(index.maxRowLength(), 12u);
}

TEST(FileIndexTest, RejectsOverlappingRows) {
    FileIndex index;
    index.addRow(10, 5);
    EXPECT_THROW(index.addRow(14, 2), std::invalid_argument);
    EXPECT_NO_THROW(index.addRow(15, 2));
    EXPECT_EQ(index.rowCount(), 2u);
}

TEST(FileIndexTest, ClearResetsEverything) {
    FileIndex index = makeIndex(10);
    index.clear();
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.maxRowLength(), 0u);
    EXPECT_EQ(index.scannedSize(), 0u);
    EXPECT_EQ(index.sourceSize(), 0u);
    EXPECT_TRUE(index.headerLine().empty());
}

// ============================================================================
// Sidecar format
// ============================================================================

TEST(FileIndexTest, WriteReadRestoresIndex) {
    // More rows than one entry block
    FileIndex original = makeIndex(FileIndex::ENTRIES_PER_BLOCK + 123);
    std::istringstream in(serialize(original), std::ios::binary);

    FileIndex loaded;
    ASSERT_TRUE(loaded.read(in)) << loaded.getErrorMsg();
    EXPECT_EQ(loaded.entries(), original.entries());
    EXPECT_EQ(loaded.headerLine(), "a,b,c");
    EXPECT_EQ(loaded.divisor(), LineDivisor::CRLF);
    EXPECT_EQ(loaded.scannedSize(), original.scannedSize());
    EXPECT_EQ(loaded.sourceSize(), original.sourceSize());
    EXPECT_EQ(loaded.maxRowLength(), original.maxRowLength());
}

TEST(FileIndexTest, EmptyIndexRoundTrips) {
    FileIndex original;
    original.setHeaderLine("only,header");
    std::istringstream in(serialize(original), std::ios::binary);

    FileIndex loaded;
    ASSERT_TRUE(loaded.read(in)) << loaded.getErrorMsg();
    EXPECT_TRUE(loaded.empty());
    EXPECT_EQ(loaded.headerLine(), "only,header");
}

TEST(FileIndexTest, RejectsBadMagic) {
    FileIndex original = makeIndex(3);
    std::string bytes = serialize(original);
    bytes[0] = 'X';
    std::istringstream in(bytes, std::ios::binary);

    FileIndex loaded;
    EXPECT_FALSE(loaded.read(in));
    EXPECT_NE(loaded.getErrorMsg().find("magic"), std::string::npos);
}

TEST(FileIndexTest, RejectsCorruptedPayload) {
    FileIndex original = makeIndex(100);
    std::string bytes = serialize(original);
    // Flip a byte inside the header line
    const size_t headerOffset = 4 + 2 + 2 + 8 * 4 + 4;
    bytes[headerOffset] ^= 0x20;
    std::istringstream in(bytes, std::ios::binary);

    FileIndex loaded;
    EXPECT_FALSE(loaded.read(in));
    EXPECT_NE(loaded.getErrorMsg().find("checksum"), std::string::npos);
}

TEST(FileIndexTest, RejectsTruncatedFile) {
    FileIndex original = makeIndex(100);
    std::string bytes = serialize(original);
    bytes.resize(bytes.size() / 2);
    std::istringstream in(bytes, std::ios::binary);

    FileIndex loaded;
    EXPECT_FALSE(loaded.read(in));
    EXPECT_FALSE(loaded.getErrorMsg().empty());
}

TEST(FileIndexTest, FailedReadLeavesIndexUntouched) {
    FileIndex target = makeIndex(5);
    std::istringstream in(std::string("garbage"), std::ios::binary);
    EXPECT_FALSE(target.read(in));
    EXPECT_EQ(target.rowCount(), 5u);
}
