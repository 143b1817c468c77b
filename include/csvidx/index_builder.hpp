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
 * @file index_builder.hpp
 * @brief IndexBuilder implementations.
 */

#include "index_builder.h"
#include "file_index.hpp"
#include "line_stream.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace csvidx {

    inline IndexBuilder::IndexBuilder(LineDivisor divisor, std::optional<size_t> maxRows, ProgressCallback progress)
        : divisor_(divisor)
        , max_rows_(maxRows)
        , progress_(std::move(progress))
    {
    }

    inline void IndexBuilder::scan(LineStream& stream, FileIndex& index) const {
        const uint64_t divLen = divisorLength(divisor_);
        index.clear();
        index.setDivisor(divisor_);

        std::string line;
        line.reserve(LINE_BUFFER_RESERVE);

        if (!stream.next(line)) {
            return; // empty file: no header, no rows
        }
        uint64_t size = line.size() + divLen;
        index.setHeaderLine(line);

        while (!(max_rows_ && index.rowCount() >= *max_rows_)) {
            if (!stream.next(line)) {
                break;
            }
            const uint64_t length = line.size() + divLen;
            index.addRow(size, length);
            size += length;

            if (progress_) {
                progress_(max_rows_ ? static_cast<uint64_t>(index.rowCount()) : size);
            }
        }
        index.setScannedSize(size);

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "Indexed " << index.rowCount() << " rows (" << size << " bytes, max row "
                      << index.maxRowLength() << " bytes) of " << stream.filePath() << std::endl;
        }
    }

} // namespace csvidx
