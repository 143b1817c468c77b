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
 * @file random_access_reader.hpp
 * @brief ReadBufferPool and RandomAccessReader implementations.
 */

#include "random_access_reader.h"
#include "errors.h"
#include "row_decoder.hpp"
#include "row_splitter.h"

#include <cstring>
#include <ios>
#include <iostream>
#include <system_error>

namespace csvidx {

    // ── ReadBufferPool ──────────────────────────────────────────────────

    inline ReadBufferPool::Lease::~Lease() {
        if (pool_) {
            pool_->giveBack(std::move(buffer_));
        }
    }

    inline void ReadBufferPool::resize(size_t bufferSize) {
        buffer_size_ = bufferSize;
        free_.clear();
    }

    inline ReadBufferPool::Lease ReadBufferPool::checkout() {
        if (free_.empty()) {
            return Lease(this, std::vector<char>(buffer_size_));
        }
        std::vector<char> buffer = std::move(free_.back());
        free_.pop_back();
        return Lease(this, std::move(buffer));
    }

    inline void ReadBufferPool::giveBack(std::vector<char>&& buffer) {
        // Buffers sized before the last resize() are dropped
        if (buffer.size() == buffer_size_) {
            free_.push_back(std::move(buffer));
        }
    }

    // ── RandomAccessReader ──────────────────────────────────────────────

    inline void RandomAccessReader::open(const FilePath& filepath) {
        close();

        std::error_code ec;
        const auto size = std::filesystem::file_size(filepath, ec);
        if (ec) {
            throw IOError("Cannot stat file " + filepath.string() + ": " + ec.message());
        }

        handle_.open(filepath, std::ios::in | std::ios::binary);
        if (!handle_.is_open()) {
            throw IOError("Cannot open file for reading: " + filepath.string());
        }
        file_path_ = filepath;
        file_size_ = static_cast<uint64_t>(size);
    }

    inline void RandomAccessReader::close() {
        if (handle_.is_open()) {
            handle_.close();
        }
        file_path_.clear();
        file_size_ = 0;
    }

    inline LineDivisor RandomAccessReader::sniffDivisor() {
        if (!isOpen()) {
            throw IOError("Cannot sniff line divisor: read handle is not open");
        }
        std::vector<char> sample(DIVISOR_SNIFF_BYTES);
        handle_.clear();
        handle_.seekg(0);
        handle_.read(sample.data(), static_cast<std::streamsize>(sample.size()));
        const auto got = static_cast<size_t>(handle_.gcount());
        if (handle_.bad()) {
            throw IOError("Read error while sniffing line divisor of " + file_path_.string());
        }
        handle_.clear();

        std::string_view text(sample.data(), got);
        LineDivisor divisor = text.find("\r\n") != std::string_view::npos ? LineDivisor::CRLF : LineDivisor::LF;
        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "Detected line divisor " << divisorString(divisor)
                      << " in " << file_path_ << std::endl;
        }
        return divisor;
    }

    inline std::string RandomAccessReader::readText(const RowIndexEntry& entry) {
        if (!isOpen()) {
            throw IOError("Cannot read at offset " + std::to_string(entry.offset) + ": read handle is not open");
        }

        ReadBufferPool::Lease lease = pool_.checkout();
        std::vector<char>& buffer = lease.buffer();
        if (buffer.size() < entry.length) {
            buffer.resize(entry.length);
        }

        handle_.clear();
        handle_.seekg(static_cast<std::streamoff>(entry.offset));
        handle_.read(buffer.data(), static_cast<std::streamsize>(entry.length));
        const auto got = static_cast<uint64_t>(handle_.gcount());
        const bool bad = handle_.bad();
        handle_.clear();

        // A short read is only legal for the last row of a file without trailing divisor
        if (bad || (got < entry.length && entry.offset + got != file_size_)) {
            throw IOError("Short read at offset " + std::to_string(entry.offset) + ": expected " +
                          std::to_string(entry.length) + " bytes, got " + std::to_string(got));
        }

        return std::string(trimWhitespace(std::string_view(buffer.data(), static_cast<size_t>(got))));
    }

    inline RowRecord RandomAccessReader::read(const RowIndexEntry& entry, size_t rowNumber, const RowDecoder& decoder) {
        return decoder.decode(readText(entry), rowNumber);
    }

} // namespace csvidx
