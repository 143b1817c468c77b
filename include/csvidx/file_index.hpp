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
 * @file file_index.hpp
 * @brief FileIndex implementations, including sidecar serialization.
 */

#include "file_index.h"
#include "checksum.hpp"
#include "errors.h"

#include <lz4.h>

#include <algorithm>
#include <climits>
#include <iostream>
#include <istream>
#include <ostream>
#include <stdexcept>

// LZ4 APIs use int for sizes
static_assert(csvidx::FileIndex::ENTRIES_PER_BLOCK * sizeof(csvidx::RowIndexEntry) < static_cast<size_t>(INT_MAX),
              "An entry block must fit in int for LZ4 APIs");

namespace csvidx {

    inline void FileIndex::clear() {
        entries_.clear();
        header_line_.clear();
        scanned_size_ = 0;
        max_row_length_ = 0;
        source_size_ = 0;
        divisor_ = LineDivisor::LF;
        err_msg_.clear();
    }

    inline void FileIndex::addRow(uint64_t offset, uint64_t length) {
        if (!entries_.empty()) {
            const RowIndexEntry& last = entries_.back();
            if (offset < last.offset + last.length) {
                throw std::invalid_argument("FileIndex: row offset " + std::to_string(offset) +
                                            " overlaps previous row ending at " +
                                            std::to_string(last.offset + last.length));
            }
        }
        entries_.emplace_back(offset, length);
        max_row_length_ = std::max(max_row_length_, length);
    }

    inline const RowIndexEntry& FileIndex::row(size_t rowNumber) const {
        if (!hasRow(rowNumber)) {
            throw RangeError("FileIndex: row " + std::to_string(rowNumber) +
                             " out of range [1, " + std::to_string(entries_.size()) + "]");
        }
        return entries_[rowNumber - 1];
    }

    // ── Sidecar serialization ───────────────────────────────────────────

    inline bool FileIndex::write(std::ostream& stream) {
        err_msg_.clear();
        if (header_line_.size() > MAX_HEADER_LENGTH) {
            err_msg_ = "Error: Header line too long for index file (" + std::to_string(header_line_.size()) + " bytes)";
            return false;
        }

        Checksum::Streaming hash;
        auto put = [&](const void* data, size_t length) {
            stream.write(static_cast<const char*>(data), static_cast<std::streamsize>(length));
            hash.update(data, length);
        };
        auto putValue = [&](const auto& value) {
            put(&value, sizeof(value));
        };

        putValue(INDEX_START_MAGIC);
        putValue(INDEX_FILE_VERSION);
        putValue(static_cast<uint16_t>(divisorLength(divisor_)));
        putValue(source_size_);
        putValue(static_cast<uint64_t>(entries_.size()));
        putValue(scanned_size_);
        putValue(max_row_length_);
        putValue(static_cast<uint32_t>(header_line_.size()));
        put(header_line_.data(), header_line_.size());

        std::vector<char> compressed;
        for (size_t first = 0; first < entries_.size(); first += ENTRIES_PER_BLOCK) {
            const size_t count = std::min(ENTRIES_PER_BLOCK, entries_.size() - first);
            const int rawSize = static_cast<int>(count * sizeof(RowIndexEntry));
            compressed.resize(static_cast<size_t>(LZ4_compressBound(rawSize)));

            const int compressedSize = LZ4_compress_default(
                reinterpret_cast<const char*>(entries_.data() + first), compressed.data(),
                rawSize, static_cast<int>(compressed.size()));
            if (compressedSize <= 0) {
                err_msg_ = "Error: LZ4 compression of index block failed";
                return false;
            }

            putValue(static_cast<uint32_t>(rawSize));
            putValue(static_cast<uint32_t>(compressedSize));
            put(compressed.data(), static_cast<size_t>(compressedSize));
        }

        putValue(INDEX_END_MAGIC);
        const uint64_t digest = hash.finalize();
        stream.write(reinterpret_cast<const char*>(&digest), sizeof(digest));

        if (!stream.good()) {
            err_msg_ = "Error: Failed to write index file";
            return false;
        }
        return true;
    }

    inline bool FileIndex::read(std::istream& stream) {
        err_msg_.clear();

        Checksum::Streaming hash;
        auto get = [&](void* data, size_t length) -> bool {
            stream.read(static_cast<char*>(data), static_cast<std::streamsize>(length));
            if (static_cast<size_t>(stream.gcount()) != length) {
                return false;
            }
            hash.update(data, length);
            return true;
        };
        auto getValue = [&](auto& value) -> bool {
            return get(&value, sizeof(value));
        };
        auto fail = [&](const std::string& msg) {
            err_msg_ = msg;
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        };

        uint32_t startMagic = 0;
        uint16_t version = 0;
        uint16_t divisorLen = 0;
        uint64_t sourceSize = 0;
        uint64_t rowCount = 0;
        uint64_t scannedSize = 0;
        uint64_t maxRowLength = 0;
        uint32_t headerLength = 0;

        if (!getValue(startMagic) || startMagic != INDEX_START_MAGIC) {
            return fail("Error: Invalid index file start magic");
        }
        if (!getValue(version) || version != INDEX_FILE_VERSION) {
            return fail("Error: Unsupported index file version: " + std::to_string(version));
        }
        if (!getValue(divisorLen) || (divisorLen != 1 && divisorLen != 2)) {
            return fail("Error: Invalid line divisor length in index file");
        }
        if (!getValue(sourceSize) || !getValue(rowCount) || !getValue(scannedSize) ||
            !getValue(maxRowLength) || !getValue(headerLength)) {
            return fail("Error: Truncated index file header");
        }
        if (headerLength > MAX_HEADER_LENGTH) {
            return fail("Error: Invalid header line length in index file: " + std::to_string(headerLength));
        }

        std::string headerLine(headerLength, '\0');
        if (!get(headerLine.data(), headerLine.size())) {
            return fail("Error: Truncated header line in index file");
        }

        std::vector<RowIndexEntry> entries;
        std::vector<char> compressed;
        while (entries.size() < rowCount) {
            const size_t count = static_cast<size_t>(
                std::min<uint64_t>(ENTRIES_PER_BLOCK, rowCount - entries.size()));
            uint32_t rawSize = 0;
            uint32_t compressedSize = 0;
            if (!getValue(rawSize) || !getValue(compressedSize)) {
                return fail("Error: Truncated index block header");
            }
            if (rawSize != count * sizeof(RowIndexEntry) ||
                compressedSize > static_cast<uint32_t>(LZ4_compressBound(static_cast<int>(rawSize)))) {
                return fail("Error: Invalid index block size");
            }
            compressed.resize(compressedSize);
            if (!get(compressed.data(), compressed.size())) {
                return fail("Error: Truncated index block");
            }

            const size_t first = entries.size();
            entries.resize(first + count);
            const int result = LZ4_decompress_safe(
                compressed.data(), reinterpret_cast<char*>(entries.data() + first),
                static_cast<int>(compressedSize), static_cast<int>(rawSize));
            if (result != static_cast<int>(rawSize)) {
                return fail("Error: LZ4 decompression of index block failed");
            }
        }

        uint32_t endMagic = 0;
        if (!getValue(endMagic) || endMagic != INDEX_END_MAGIC) {
            return fail("Error: Invalid index file end magic");
        }
        const uint64_t calculated = hash.finalize();
        uint64_t stored = 0;
        stream.read(reinterpret_cast<char*>(&stored), sizeof(stored));
        if (static_cast<size_t>(stream.gcount()) != sizeof(stored) || stored != calculated) {
            return fail("Error: Index file checksum mismatch");
        }

        // Rebuild through addRow so the ordering invariant holds for loaded data too
        FileIndex loaded;
        loaded.reserve(entries.size());
        try {
            for (const RowIndexEntry& e : entries) {
                loaded.addRow(e.offset, e.length);
            }
        } catch (const std::invalid_argument& ex) {
            return fail(std::string("Error: Corrupt index entries: ") + ex.what());
        }
        if (loaded.max_row_length_ != maxRowLength) {
            return fail("Error: Index file maximum row length does not match its entries");
        }

        loaded.header_line_ = std::move(headerLine);
        loaded.scanned_size_ = scannedSize;
        loaded.source_size_ = sourceSize;
        loaded.divisor_ = divisorLen == 2 ? LineDivisor::CRLF : LineDivisor::LF;
        *this = std::move(loaded);
        return true;
    }

} // namespace csvidx
