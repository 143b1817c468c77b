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
 * @file row_iterator.h
 * @brief RowIterator: one sequential iteration session over a file.
 *
 * A session owns its own LineStream, starts at byte 0 and lazily decodes data
 * rows in file order. The first line is always consumed as the header and never
 * yielded; if no header is known yet it becomes the session's header. A session
 * is finite and not restartable: once exhausted or closed, next() keeps
 * returning std::nullopt.
 *
 * Usage:
 *     auto rows = file.iterator();
 *     for (const csvidx::RowRecord& rec : *rows) {
 *         ...
 *     }
 */

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>

#include "definitions.h"
#include "line_stream.h"
#include "row_decoder.h"
#include "row_record.h"

namespace csvidx {

    class RowIterator {
    public:
        using FilePath          = std::filesystem::path;

        /// Single-pass input iterator over the remaining rows of a session
        class iterator {
            RowIterator*        owner_ = nullptr;       // nullptr once the session is exhausted
            std::optional<RowRecord> current_;

        public:
            using iterator_category = std::input_iterator_tag;
            using value_type        = RowRecord;
            using difference_type   = std::ptrdiff_t;
            using pointer           = const RowRecord*;
            using reference         = const RowRecord&;

            iterator() = default;
            explicit iterator(RowIterator* owner) : owner_(owner) { advance(); }

            reference           operator*() const               { return *current_; }
            pointer             operator->() const              { return &*current_; }
            iterator&           operator++()                    { advance(); return *this; }
            void                operator++(int)                 { advance(); }
            bool                operator==(const iterator& other) const { return owner_ == other.owner_; }

        private:
            void                advance();
        };

    private:
        LineStream              stream_;
        std::optional<RowDecoder> decoder_;             // empty until the header is known
        char                    delimiter_;
        std::string             line_buf_;
        size_t                  row_pos_ = 0;           // 1-based number of the last yielded row
        bool                    header_consumed_ = false;
        bool                    exhausted_ = false;
        bool                    closed_ = false;

    public:
        /// Open a session on filepath. header, if given, is used instead of the file's first line.
        RowIterator(const FilePath& filepath, std::optional<Header> header, char delimiter = DEFAULT_DELIMITER);

        RowIterator(const RowIterator&) = delete;
        RowIterator& operator=(const RowIterator&) = delete;

        std::optional<RowRecord> next();
        void                    close();

        bool                    isActive() const                { return !closed_ && !exhausted_; }
        bool                    isExhausted() const             { return exhausted_; }
        bool                    isClosed() const                { return closed_; }
        size_t                  rowPos() const                  { return row_pos_; }

        /// Header in use, nullptr before the first line has been read from a file without known header
        const Header*           header() const                  { return decoder_ ? &decoder_->header() : nullptr; }

        iterator                begin()                         { return iterator(this); }
        iterator                end()                           { return iterator(); }
    };

} // namespace csvidx
