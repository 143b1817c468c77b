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
 * @file random_access_reader.h
 * @brief Positioned exact-length reads of indexed rows.
 *
 * RandomAccessReader owns the positioned-read handle of a file. Every read
 * borrows a buffer from a ReadBufferPool through a Lease, so two reads never
 * share a buffer. The handle itself is shared: at most one outstanding read
 * per reader.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "definitions.h"
#include "file_index.h"
#include "row_decoder.h"
#include "row_record.h"

namespace csvidx {

    /**
     * @brief Pool of equally sized byte buffers, checked out per read.
     *
     * A Lease hands its buffer back on destruction and must not outlive the pool.
     */
    class ReadBufferPool {
    public:
        class Lease {
            ReadBufferPool*     pool_ = nullptr;
            std::vector<char>   buffer_;

        public:
            Lease(ReadBufferPool* pool, std::vector<char> buffer)
                : pool_(pool), buffer_(std::move(buffer)) {}
            ~Lease();

            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;
            Lease(Lease&& other) noexcept
                : pool_(other.pool_), buffer_(std::move(other.buffer_)) { other.pool_ = nullptr; }
            Lease& operator=(Lease&&) = delete;

            std::vector<char>&  buffer()                        { return buffer_; }
            char*               data()                          { return buffer_.data(); }
            size_t              size() const                    { return buffer_.size(); }
        };

    private:
        std::vector<std::vector<char>> free_;
        size_t                  buffer_size_ = 0;

    public:
        explicit ReadBufferPool(size_t bufferSize = 0) : buffer_size_(bufferSize) {}

        /// Drop idle buffers and size future ones to bufferSize
        void                    resize(size_t bufferSize);
        Lease                   checkout();
        size_t                  bufferSize() const              { return buffer_size_; }
        size_t                  idle() const                    { return free_.size(); }

    private:
        void                    giveBack(std::vector<char>&& buffer);
    };

    class RandomAccessReader {
    public:
        using FilePath          = std::filesystem::path;

    private:
        FilePath                file_path_;
        std::ifstream           handle_;                // positioned-read handle
        uint64_t                file_size_ = 0;
        ReadBufferPool          pool_;

    public:
        RandomAccessReader() = default;
        ~RandomAccessReader()                           { close(); }

        RandomAccessReader(const RandomAccessReader&) = delete;
        RandomAccessReader& operator=(const RandomAccessReader&) = delete;

        void                    open(const FilePath& filepath);
        void                    close();
        bool                    isOpen() const                  { return handle_.is_open(); }
        const FilePath&         filePath() const                { return file_path_; }
        uint64_t                fileSize() const                { return file_size_; }

        /// Size read buffers for rows up to maxRowLength bytes
        void                    reserve(size_t maxRowLength)    { pool_.resize(maxRowLength); }

        /// Detect the line divisor from the leading DIVISOR_SNIFF_BYTES of the file
        LineDivisor             sniffDivisor();

        /// Read exactly entry.length bytes at entry.offset, trimmed of surrounding whitespace
        std::string             readText(const RowIndexEntry& entry);

        RowRecord               read(const RowIndexEntry& entry, size_t rowNumber, const RowDecoder& decoder);
    };

} // namespace csvidx
