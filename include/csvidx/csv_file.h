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
 * @file csv_file.h
 * @brief CsvFile: random-access and streaming reader for large delimited text files.
 *
 * Lifecycle: CLOSED -> open() -> OPEN -> buildIndex() -> INDEXED.
 *
 *   - open()        acquires a line stream and a positioned-read handle,
 *                   sniffs the line divisor on first open
 *   - buildIndex()  one forward scan recording offset/length of every row
 *   - getLine(n)    one positioned read of row n (1-based), needs the index
 *   - iterator()    sequential session in file order, no index needed
 *   - rewind()      restart the stream, keep handle and index
 *   - close()       release everything; close({true}) keeps handle and index
 *
 * Accessors that need the index return Result<T>; value() throws StateError
 * until indexing has completed.
 *
 * Usage:
 *     csvidx::CsvFile csv("data.csv");
 *     csv.open();
 *     csv.buildIndex();
 *     size_t rows = csv.lines().value();
 *     csvidx::RowRecord rec = csv.getLine(1000);
 *     for (const auto& row : *csv.iterator()) { ... }
 *     csv.close();
 *
 * A CsvFile is not thread-safe. The positioned-read handle is shared by all
 * getLine() calls: issue one at a time.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "definitions.h"
#include "errors.h"
#include "file_index.h"
#include "line_stream.h"
#include "random_access_reader.h"
#include "row_decoder.h"
#include "row_iterator.h"
#include "row_record.h"

namespace csvidx {

    class CsvFile {
    public:
        using FilePath          = std::filesystem::path;

        struct Options {
            char    delimiter       = DEFAULT_DELIMITER;
            bool    openOnConstruct = false;            // call open() from the constructor
        };

        struct CloseOptions {
            bool    preserveHandle  = false;            // keep read handle and index for a following open()
        };

        struct IndexOptions {
            std::optional<size_t> maxRows;              // stop after this many data rows
            ProgressCallback      progress;             // optional observer, see ProgressCallback
        };

    private:
        FilePath                filename_;
        Options                 options_;
        FileState               state_ = FileState::CLOSED;

        LineStream              stream_;                // sequential stream, consumed by buildIndex()
        RandomAccessReader      reader_;                // positioned-read handle
        FileIndex               index_;
        RowDecoder              decoder_;
        bool                    has_index_ = false;     // index_ valid, survives close({preserveHandle})
        std::optional<LineDivisor> divisor_;            // sniffed once per engine
        std::shared_ptr<RowIterator> active_iterator_;  // held until endIterator()

    public:
        explicit CsvFile(FilePath filename);
        CsvFile(FilePath filename, Options options);
        ~CsvFile();

        CsvFile(const CsvFile&) = delete;
        CsvFile& operator=(const CsvFile&) = delete;

        void                    open();
        void                    close();
        void                    close(const CloseOptions& options);
        void                    rewind();
        void                    buildIndex();
        void                    buildIndex(const IndexOptions& options);

        RowRecord               getLine(size_t rowNumber);
        std::shared_ptr<RowIterator> iterator();

        /// Persist the index to a sidecar file. Throws StateError if not indexed, IOError on write failure.
        void                    saveIndex(const FilePath& indexPath);
        /// Restore an index written by saveIndex() instead of scanning. Throws IOError if the
        /// sidecar is invalid or does not match the current file.
        void                    loadIndex(const FilePath& indexPath);

        const FilePath&         filename() const                { return filename_; }
        FileState               state() const                   { return state_; }
        bool                    isOpen() const                  { return state_ != FileState::CLOSED; }
        bool                    isIndexed() const               { return state_ == FileState::INDEXED; }
        char                    delimiter() const               { return options_.delimiter; }
        std::optional<LineDivisor> lineDivisor() const          { return divisor_; }

        Result<Header>          header() const;
        Result<size_t>          lines() const;
        Result<size_t>          columns() const;
        Result<uint64_t>        size() const;
        Result<uint64_t>        maxRowLength() const;

    private:
        std::string             context(const char* operation) const;
        StateError              notIndexedError(const char* accessor) const;
        void                    endIterator();
        void                    installIndex(FileIndex&& index);
    };

} // namespace csvidx
