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
 * @file csv_file.hpp
 * @brief CsvFile implementations.
 */

#include "csv_file.h"
#include "file_index.hpp"
#include "index_builder.hpp"
#include "line_stream.hpp"
#include "random_access_reader.hpp"
#include "row_decoder.hpp"
#include "row_iterator.hpp"

#include <fstream>
#include <iostream>
#include <utility>

namespace csvidx {

    // ── Constructor / Destructor ────────────────────────────────────────

    inline CsvFile::CsvFile(FilePath filename)
        : CsvFile(std::move(filename), Options{})
    {
    }

    inline CsvFile::CsvFile(FilePath filename, Options options)
        : filename_(std::move(filename))
        , options_(options)
        , decoder_(Header{}, options.delimiter)
    {
        if (options_.openOnConstruct) {
            open();
        }
    }

    inline CsvFile::~CsvFile() {
        if (isOpen()) {
            close();
        }
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    inline void CsvFile::open() {
        if (isOpen()) {
            throw StateError(context("open") + "Cannot open file '" + filename_.string() +
                             "': file is already open. Use <CsvFile.close()> first.");
        }

        const bool openedHandle = !reader_.isOpen();
        try {
            if (openedHandle) {
                reader_.open(filename_);
            }
            stream_.open(filename_);
            if (!divisor_) {
                divisor_ = reader_.sniffDivisor();
            }
        } catch (const IOError& ex) {
            stream_.close();
            if (openedHandle) {
                reader_.close();
            }
            throw IOError(context("open") + "Cannot open file '" + filename_.string() + "': " + ex.what());
        }

        state_ = has_index_ ? FileState::INDEXED : FileState::OPEN;
    }

    inline void CsvFile::close() {
        close(CloseOptions{});
    }

    inline void CsvFile::close(const CloseOptions& options) {
        if (!isOpen()) {
            throw StateError(context("close") + "Cannot close file '" + filename_.string() +
                             "': file is not open. Use <CsvFile.open()> first.");
        }

        endIterator();
        stream_.close();

        if (!options.preserveHandle) {
            reader_.close();
            index_.clear();
            decoder_ = RowDecoder(Header{}, options_.delimiter);
            has_index_ = false;
        }
        state_ = FileState::CLOSED;
    }

    inline void CsvFile::rewind() {
        if (!isOpen()) {
            throw StateError(context("rewind") + "Cannot rewind file '" + filename_.string() +
                             "': file is not open. Use <CsvFile.open()> first.");
        }
        close(CloseOptions{true});
        open();
    }

    // ── Indexing ────────────────────────────────────────────────────────

    inline void CsvFile::buildIndex() {
        buildIndex(IndexOptions{});
    }

    /// On IOError the engine stays OPEN with its stream partially consumed; rewind() before retrying.
    inline void CsvFile::buildIndex(const IndexOptions& options) {
        if (!isOpen()) {
            throw StateError(context("buildIndex") + "Cannot build index of file '" + filename_.string() +
                             "': file is not open. Use <CsvFile.open()> first.");
        }
        if (isIndexed()) {
            throw StateError(context("buildIndex") + "Cannot build index of file '" + filename_.string() +
                             "': file is already indexed. Use <CsvFile.close()> first.");
        }

        FileIndex index;
        try {
            IndexBuilder(*divisor_, options.maxRows, options.progress).scan(stream_, index);
        } catch (const IOError& ex) {
            throw IOError(context("buildIndex") + "Cannot build index of file '" + filename_.string() +
                          "': " + ex.what());
        }
        index.setSourceSize(reader_.fileSize());
        installIndex(std::move(index));

        // Restart the stream so later sequential consumption starts at byte 0
        close(CloseOptions{true});
        open();
    }

    inline void CsvFile::saveIndex(const FilePath& indexPath) {
        if (!isIndexed()) {
            throw StateError(context("saveIndex") + "Cannot save index of file '" + filename_.string() +
                             "': file is not indexed. Use <CsvFile.buildIndex()> first.");
        }
        std::ofstream out(indexPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IOError(context("saveIndex") + "Cannot open index file for writing: " + indexPath.string());
        }
        if (!index_.write(out)) {
            throw IOError(context("saveIndex") + "Cannot write index file '" + indexPath.string() +
                          "': " + index_.getErrorMsg());
        }
    }

    inline void CsvFile::loadIndex(const FilePath& indexPath) {
        if (!isOpen()) {
            throw StateError(context("loadIndex") + "Cannot load index of file '" + filename_.string() +
                             "': file is not open. Use <CsvFile.open()> first.");
        }
        if (isIndexed()) {
            throw StateError(context("loadIndex") + "Cannot load index of file '" + filename_.string() +
                             "': file is already indexed. Use <CsvFile.close()> first.");
        }

        std::ifstream in(indexPath, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            throw IOError(context("loadIndex") + "Cannot open index file: " + indexPath.string());
        }
        FileIndex index;
        if (!index.read(in)) {
            throw IOError(context("loadIndex") + "Cannot read index file '" + indexPath.string() +
                          "': " + index.getErrorMsg());
        }
        if (index.sourceSize() != reader_.fileSize()) {
            throw IOError(context("loadIndex") + "Index file '" + indexPath.string() + "' is stale: indexed " +
                          std::to_string(index.sourceSize()) + " bytes, file has " +
                          std::to_string(reader_.fileSize()));
        }
        if (index.divisor() != *divisor_) {
            throw IOError(context("loadIndex") + "Index file '" + indexPath.string() +
                          "' was built with a different line divisor");
        }

        installIndex(std::move(index));
        state_ = FileState::INDEXED;
    }

    inline void CsvFile::installIndex(FileIndex&& index) {
        index_ = std::move(index);
        // An empty file has no header line at all, not an empty one
        decoder_ = index_.scannedSize() == 0
            ? RowDecoder(Header{}, options_.delimiter)
            : RowDecoder::fromHeaderLine(index_.headerLine(), options_.delimiter);
        reader_.reserve(static_cast<size_t>(index_.maxRowLength()));
        has_index_ = true;
    }

    // ── Reading ─────────────────────────────────────────────────────────

    inline RowRecord CsvFile::getLine(size_t rowNumber) {
        if (!isOpen()) {
            throw StateError(context("getLine") + "Cannot fetch indexed line for file '" + filename_.string() +
                             "': file is not open. Use <CsvFile.open()> first.");
        }
        if (!isIndexed()) {
            throw StateError(context("getLine") + "Cannot fetch indexed line for file '" + filename_.string() +
                             "': file is not indexed. Use <CsvFile.buildIndex()> first.");
        }
        if (!index_.hasRow(rowNumber)) {
            throw RangeError(context("getLine") + "Cannot fetch indexed line '" + std::to_string(rowNumber) +
                             "' for file '" + filename_.string() + "': line index out of range. " +
                             "Expected an index between 1 and " + std::to_string(index_.rowCount()));
        }

        try {
            return reader_.read(index_.row(rowNumber), rowNumber, decoder_);
        } catch (const IOError& ex) {
            throw IOError(context("getLine") + "Cannot fetch indexed line '" + std::to_string(rowNumber) +
                          "' for file '" + filename_.string() + "': error during read. " + ex.what());
        }
    }

    inline std::shared_ptr<RowIterator> CsvFile::iterator() {
        if (!isOpen()) {
            throw StateError(context("iterator") + "Cannot get iterator for file '" + filename_.string() +
                             "': file is not open. Use <CsvFile.open()> first.");
        }

        // Only one session is active at a time
        if (active_iterator_ && active_iterator_->isActive()) {
            return active_iterator_;
        }

        std::optional<Header> header;
        if (has_index_) {
            header = decoder_.header();
        }
        try {
            auto session = std::make_shared<RowIterator>(filename_, std::move(header), options_.delimiter);
            active_iterator_ = session;
            return session;
        } catch (const IOError& ex) {
            throw IOError(context("iterator") + "Cannot get iterator for file '" + filename_.string() +
                          "': " + ex.what());
        }
    }

    inline void CsvFile::endIterator() {
        if (active_iterator_) {
            active_iterator_->close();
        }
        active_iterator_.reset();
    }

    // ── Accessors ───────────────────────────────────────────────────────

    inline Result<Header> CsvFile::header() const {
        if (!isIndexed()) return notIndexedError("header");
        return decoder_.header();
    }

    inline Result<size_t> CsvFile::lines() const {
        if (!isIndexed()) return notIndexedError("lines");
        return index_.rowCount();
    }

    inline Result<size_t> CsvFile::columns() const {
        if (!isIndexed()) return notIndexedError("columns");
        return decoder_.columns();
    }

    inline Result<uint64_t> CsvFile::size() const {
        if (!isIndexed()) return notIndexedError("size");
        return index_.scannedSize();
    }

    inline Result<uint64_t> CsvFile::maxRowLength() const {
        if (!isIndexed()) return notIndexedError("maxRowLength");
        return index_.maxRowLength();
    }

    // ── Private helpers ─────────────────────────────────────────────────

    inline std::string CsvFile::context(const char* operation) const {
        return std::string("[CsvFile.") + operation + "()] ";
    }

    inline StateError CsvFile::notIndexedError(const char* accessor) const {
        return StateError(context(accessor) + "Cannot fetch " + accessor + ", file '" + filename_.string() +
                          "' is not indexed. Use <CsvFile.buildIndex()> first, "
                          "or use an iterator object <CsvFile.iterator()>.");
    }

} // namespace csvidx
