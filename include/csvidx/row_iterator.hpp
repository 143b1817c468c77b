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
 * @file row_iterator.hpp
 * @brief RowIterator implementations.
 */

#include "row_iterator.h"
#include "line_stream.hpp"
#include "row_splitter.h"
#include "row_decoder.hpp"

#include <utility>

namespace csvidx {

    inline void RowIterator::iterator::advance() {
        if (!owner_) {
            return;
        }
        current_ = owner_->next();
        if (!current_) {
            owner_ = nullptr;
        }
    }

    inline RowIterator::RowIterator(const FilePath& filepath, std::optional<Header> header, char delimiter)
        : delimiter_(delimiter)
    {
        if (header) {
            decoder_.emplace(std::move(*header), delimiter_);
        }
        stream_.open(filepath);
        line_buf_.reserve(LINE_BUFFER_RESERVE);
    }

    inline std::optional<RowRecord> RowIterator::next() {
        if (!isActive()) {
            return std::nullopt;
        }

        if (!header_consumed_) {
            if (!stream_.next(line_buf_)) {
                exhausted_ = true;
                stream_.close();
                return std::nullopt;
            }
            header_consumed_ = true;
            if (!decoder_) {
                decoder_ = RowDecoder::fromHeaderLine(line_buf_, delimiter_);
            }
        }

        if (!stream_.next(line_buf_)) {
            exhausted_ = true;
            stream_.close();
            return std::nullopt;
        }
        ++row_pos_;
        // Same normalization as the positioned read path
        return decoder_->decode(trimWhitespace(line_buf_), row_pos_);
    }

    inline void RowIterator::close() {
        closed_ = true;
        stream_.close();
    }

} // namespace csvidx
