/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the csvidx library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the csvidx library */
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace csvidx {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

#ifdef CSVIDX_DEBUG_OUTPUTS
    constexpr bool DEBUG_OUTPUTS = true;
#else
    constexpr bool DEBUG_OUTPUTS = false;
#endif

    // Text format
    constexpr char   DEFAULT_DELIMITER   = ',';
    constexpr size_t DIVISOR_SNIFF_BYTES = 8 * 1024;    // leading chunk scanned for "\r\n"
    constexpr size_t LINE_BUFFER_RESERVE = 4096;

    // Index sidecar format
    constexpr uint32_t INDEX_START_MAGIC  = 0x58444943; // "CIDX" in little-endian
    constexpr uint32_t INDEX_END_MAGIC    = 0x58444945; // "EIDX" in little-endian
    constexpr uint16_t INDEX_FILE_VERSION = 1;
    constexpr size_t   MAX_HEADER_LENGTH  = 16 * 1024 * 1024;

    /// Byte sequence terminating every physical line of a file
    enum class LineDivisor : uint8_t {
        LF   = 1,   // "\n"
        CRLF = 2    // "\r\n"
    };

    constexpr size_t divisorLength(LineDivisor divisor) {
        return static_cast<size_t>(divisor);
    }

    inline std::string_view divisorString(LineDivisor divisor) {
        return divisor == LineDivisor::CRLF ? std::string_view("\\r\\n") : std::string_view("\\n");
    }

    /// Lifecycle of a CsvFile
    enum class FileState : uint8_t {
        CLOSED  = 0,
        OPEN    = 1,
        INDEXED = 2
    };

    inline std::string_view fileStateToString(FileState state) {
        switch (state) {
            case FileState::CLOSED:  return "closed";
            case FileState::OPEN:    return "open";
            case FileState::INDEXED: return "indexed";
            default:                 return "undefined";
        }
    }

    /// Advisory observer invoked by CsvFile::buildIndex once per processed row.
    /// Receives the row count when a row cap is given, the cumulative byte count otherwise.
    using ProgressCallback = std::function<void(uint64_t current)>;

} // namespace csvidx
