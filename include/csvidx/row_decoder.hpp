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
 * @file row_decoder.hpp
 * @brief RowDecoder implementations.
 */

#include "row_decoder.h"
#include "row_splitter.h"

#include <utility>
#include <vector>

namespace csvidx {

    inline RowDecoder::RowDecoder(Header header, char delimiter)
        : header_(std::move(header))
        , delimiter_(delimiter)
    {
    }

    inline RowDecoder RowDecoder::fromHeaderLine(std::string_view headerLine, char delimiter) {
        return RowDecoder(splitLine(stripByteOrderMark(headerLine), delimiter), delimiter);
    }

    inline RowRecord RowDecoder::decode(std::string_view line, size_t index) const {
        RowRecord rec;
        rec.index = index;
        rec.line = std::string(line);

        std::vector<std::string_view> tokens;
        splitLine(line, delimiter_, tokens);

        rec.cells.reserve(tokens.size());
        for (std::string_view token : tokens) {
            rec.cells.push_back(token.empty() ? Cell{} : Cell{std::string(token)});
        }

        const size_t cellCount = rec.cells.size();
        const size_t columnCount = header_.size();

        if (cellCount > columnCount) {
            rec.hasExcessCells = true;
            for (size_t i = 0; i < cellCount; ++i) {
                if (i < columnCount) {
                    assign(rec.fields, header_[i], rec.cells[i]);
                } else {
                    rec.unnamed.push_back(rec.cells[i]);
                }
            }
        } else {
            rec.hasMissingCells = cellCount < columnCount;
            for (size_t i = 0; i < columnCount; ++i) {
                assign(rec.fields, header_[i], i < cellCount ? rec.cells[i] : Cell{});
            }
        }
        return rec;
    }

    // First assignment stores the cell, any further one turns the field into a sequence
    inline void RowDecoder::assign(FieldMap& fields, const std::string& name, const Cell& cell) {
        auto [it, inserted] = fields.try_emplace(name, cell);
        if (inserted) {
            return;
        }
        if (auto* seq = std::get_if<std::vector<Cell>>(&it->second)) {
            seq->push_back(cell);
        } else {
            Cell first = std::get<Cell>(it->second);
            it->second = std::vector<Cell>{ std::move(first), cell };
        }
    }

} // namespace csvidx
