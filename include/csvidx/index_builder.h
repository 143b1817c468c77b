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
 * @file index_builder.h
 * @brief IndexBuilder: the single forward scan that fills a FileIndex.
 *
 * Line 1 is the header and is not indexed. Every further line is recorded as
 * (running size, line length + divisor length) before the running size
 * advances. With a row cap, the scan stops after maxRows data rows and the
 * index reflects only the rows actually scanned.
 */

#include <cstddef>
#include <cstdint>
#include <optional>

#include "definitions.h"
#include "file_index.h"
#include "line_stream.h"

namespace csvidx {

    class IndexBuilder {
        LineDivisor             divisor_;
        std::optional<size_t>   max_rows_;
        ProgressCallback        progress_;

    public:
        explicit IndexBuilder(LineDivisor divisor,
                              std::optional<size_t> maxRows = std::nullopt,
                              ProgressCallback progress = {});

        /// Consume stream from its current position (expected: start of file) into index.
        /// Throws IOError if the stream fails.
        void                    scan(LineStream& stream, FileIndex& index) const;
    };

} // namespace csvidx
