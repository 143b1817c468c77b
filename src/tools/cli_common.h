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
 * @file cli_common.h
 * @brief Shared utilities for csvidx CLI tools
 *
 *   - formatBytes()         byte count -> "1.23 MB" / "456 KB" / "789 bytes"
 *   - formatCell()          Cell -> text, null shown as "null"
 *   - printHeaderSummary()  tabular column listing to any ostream
 *   - printRecord()         one "name = value" line per field of a RowRecord
 *   - parseCount()          positive integer argument, throws on bad input
 */

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <csvidx/csvidx.h>

namespace csvidx_cli {

/// Format a byte count as human-readable string.
inline std::string formatBytes(uintmax_t bytes) {
    std::ostringstream oss;
    if (bytes >= 1024 * 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / (1024.0 * 1024.0)) << " MB";
    } else if (bytes >= 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / 1024.0) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

inline std::string formatCell(const csvidx::Cell& cell) {
    return cell ? *cell : std::string("null");
}

inline std::string formatField(const csvidx::FieldValue& value) {
    if (const auto* seq = std::get_if<std::vector<csvidx::Cell>>(&value)) {
        std::string out = "[";
        for (size_t i = 0; i < seq->size(); ++i) {
            if (i > 0) out += ", ";
            out += formatCell((*seq)[i]);
        }
        return out + "]";
    }
    return formatCell(std::get<csvidx::Cell>(value));
}

/// Print column index and name table.
inline void printHeaderSummary(const csvidx::Header& header, std::ostream& os = std::cerr) {
    if (header.empty()) {
        os << "Header: (empty)\n";
        return;
    }
    size_t max_name_len = 4;   // minimum width for "Name"
    for (const auto& name : header) {
        if (name.size() > max_name_len) max_name_len = name.size();
    }
    size_t idx_width = 1;
    for (size_t v = header.size() - 1; v >= 10; v /= 10) ++idx_width;
    if (idx_width < 3) idx_width = 3;

    os << "Header (" << header.size() << " columns)\n";
    os << "  " << std::right << std::setw(static_cast<int>(idx_width)) << "Idx"
       << "  " << std::left << "Name" << "\n";
    os << "  " << std::string(idx_width, '-')
       << "  " << std::string(max_name_len, '-') << "\n";
    for (size_t i = 0; i < header.size(); ++i) {
        os << "  " << std::right << std::setw(static_cast<int>(idx_width)) << i
           << "  " << std::left << header[i] << "\n";
    }
}

/// Print a record in header order, followed by its unnamed cells.
inline void printRecord(const csvidx::RowRecord& rec, const csvidx::Header& header, std::ostream& os = std::cout) {
    os << "#" << rec.index;
    if (rec.hasExcessCells)  os << " (excess cells)";
    if (rec.hasMissingCells) os << " (missing cells)";
    os << "\n";

    std::map<std::string, bool, std::less<>> printed;
    for (const auto& name : header) {
        if (printed[name]) continue;   // repeated column: value already shown as a sequence
        printed[name] = true;
        os << "  " << name << " = " << formatField(rec.field(name)) << "\n";
    }
    if (!rec.unnamed.empty()) {
        os << "  (unnamed) = " << formatField(rec.unnamed) << "\n";
    }
}

/// Parse a count (positive unless allowZero). Throws std::runtime_error on invalid input.
inline size_t parseCount(const std::string& text, const char* what, bool allowZero = false) {
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size() || value < 0 || (value == 0 && !allowZero)) {
            throw std::runtime_error("");
        }
        return static_cast<size_t>(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid ") + what + ": " + text);
    }
}

} // namespace csvidx_cli
