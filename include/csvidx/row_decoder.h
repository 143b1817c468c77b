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
 * @file row_decoder.h
 * @brief RowDecoder: raw line + header -> RowRecord.
 *
 * The decoder is pure given its inputs and is the only decoding path used by
 * both CsvFile::getLine() and the sequential RowIterator, so both paths agree
 * on every row.
 *
 * Rules:
 *   - cells > columns: hasExcessCells, the surplus goes to the unnamed bucket
 *   - cells < columns: hasMissingCells, missing positions are null
 *   - a column name assigned twice turns into a sequence of all its values
 *   - empty cells are null
 *
 * Usage outside a CsvFile:
 *     auto decoder = csvidx::RowDecoder::fromHeaderLine("a,b");
 *     csvidx::RowRecord rec = decoder.decode("1,2", 1);
 */

#include <cstddef>
#include <string>
#include <string_view>

#include "definitions.h"
#include "row_record.h"

namespace csvidx {

    /// Remove a leading UTF-8 byte order mark (EF BB BF)
    inline std::string_view stripByteOrderMark(std::string_view line) {
        if (line.size() >= 3 &&
            static_cast<unsigned char>(line[0]) == 0xEF &&
            static_cast<unsigned char>(line[1]) == 0xBB &&
            static_cast<unsigned char>(line[2]) == 0xBF) {
            line.remove_prefix(3);
        }
        return line;
    }

    class RowDecoder {
        Header                  header_;
        char                    delimiter_ = DEFAULT_DELIMITER;

    public:
        RowDecoder() = default;
        explicit RowDecoder(Header header, char delimiter = DEFAULT_DELIMITER);

        static RowDecoder       fromHeaderLine(std::string_view headerLine, char delimiter = DEFAULT_DELIMITER);

        const Header&           header() const                  { return header_; }
        size_t                  columns() const                 { return header_.size(); }
        char                    delimiter() const               { return delimiter_; }

        RowRecord               decode(std::string_view line, size_t index) const;

    private:
        static void             assign(FieldMap& fields, const std::string& name, const Cell& cell);
    };

} // namespace csvidx
