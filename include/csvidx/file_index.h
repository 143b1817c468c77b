/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the csvidx library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/**
 * @file file_index.h
 * @brief FileIndex: byte offset/length table of every data row of a text file.
 *
 * Rows are addressed 1-based, the header line is not a row. Offsets are
 * absolute (bytes from the start of the file) and strictly increasing; a
 * length includes the line divisor.
 *
 * The index can be persisted to a sidecar file so a later session can skip
 * the scan. Sidecar layout (native byte order):
 * ```
 * Size        | Field
 * ------------|----------------------------------------------------------
 * 4 bytes     | Magic: "CIDX"
 * 2 bytes     | format version
 * 2 bytes     | divisor length (1 = LF, 2 = CRLF)
 * 8 bytes     | size of the source file when indexed
 * 8 bytes     | row count N
 * 8 bytes     | scanned size (header + rows, bytes)
 * 8 bytes     | maximum row length
 * 4 bytes     | header line length H
 * H bytes     | header line (raw, without divisor)
 * repeated    | entry block: rawSize (4) | compressedSize (4) | LZ4 block
 * 4 bytes     | Magic: "EIDX"
 * 8 bytes     | xxHash64 of all preceding bytes
 * ```
 * Entry blocks hold up to ENTRIES_PER_BLOCK entries of 16 bytes each.
 */

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "definitions.h"

namespace csvidx {

    #pragma pack(push, 1)
    struct RowIndexEntry {
        uint64_t offset;        ///< Absolute file offset of the first byte of the row
        uint64_t length;        ///< Row length in bytes, including the line divisor

        RowIndexEntry() : offset(0), length(0) {}
        RowIndexEntry(uint64_t off, uint64_t len) : offset(off), length(len) {}

        bool operator==(const RowIndexEntry&) const = default;
    };
    #pragma pack(pop)
    static_assert(sizeof(RowIndexEntry) == 16, "RowIndexEntry must be exactly 16 bytes");

    class FileIndex {
    public:
        static constexpr size_t ENTRIES_PER_BLOCK = 64 * 1024;

    private:
        std::vector<RowIndexEntry> entries_;
        std::string             header_line_;           // raw first line of the file
        uint64_t                scanned_size_ = 0;      // header + all indexed rows, in bytes
        uint64_t                max_row_length_ = 0;
        uint64_t                source_size_ = 0;       // file size at indexing time
        LineDivisor             divisor_ = LineDivisor::LF;
        std::string             err_msg_;

    public:
        FileIndex() = default;

        void                    clear();
        void                    reserve(size_t rows)            { entries_.reserve(rows); }

        /// Append the next row. Throws std::invalid_argument if offset does not follow the previous row.
        void                    addRow(uint64_t offset, uint64_t length);

        size_t                  rowCount() const                { return entries_.size(); }
        bool                    empty() const                   { return entries_.empty(); }
        bool                    hasRow(size_t rowNumber) const  { return rowNumber >= 1 && rowNumber <= entries_.size(); }
        const RowIndexEntry&    row(size_t rowNumber) const;
        const std::vector<RowIndexEntry>& entries() const       { return entries_; }

        uint64_t                maxRowLength() const            { return max_row_length_; }
        uint64_t                scannedSize() const             { return scanned_size_; }
        void                    setScannedSize(uint64_t size)   { scanned_size_ = size; }
        uint64_t                sourceSize() const              { return source_size_; }
        void                    setSourceSize(uint64_t size)    { source_size_ = size; }
        LineDivisor             divisor() const                 { return divisor_; }
        void                    setDivisor(LineDivisor divisor) { divisor_ = divisor; }
        const std::string&      headerLine() const              { return header_line_; }
        void                    setHeaderLine(std::string line) { header_line_ = std::move(line); }

        const std::string&      getErrorMsg() const             { return err_msg_; }
        bool                    write(std::ostream& stream);
        bool                    read(std::istream& stream);
    };

} // namespace csvidx
