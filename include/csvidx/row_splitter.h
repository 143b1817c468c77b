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
 * @file row_splitter.h
 * @brief Split one raw text line into cells on a single fixed delimiter.
 *
 * No quoting, escaping or embedded-delimiter support: every delimiter byte
 * ends a cell. Adjacent delimiters yield empty tokens, an empty line yields
 * a single empty token.
 */

#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"

namespace csvidx {

    /// Split a line into views on delimiter. Views point into line.
    inline void splitLine(std::string_view line, char delimiter, std::vector<std::string_view>& cells) {
        cells.clear();
        size_t start = 0;
        for (size_t i = 0; i <= line.size(); ++i) {
            if (i == line.size() || line[i] == delimiter) {
                cells.emplace_back(line.substr(start, i - start));
                start = i + 1;
            }
        }
    }

    inline std::vector<std::string> splitLine(std::string_view line, char delimiter = DEFAULT_DELIMITER) {
        std::vector<std::string_view> views;
        splitLine(line, delimiter, views);
        return std::vector<std::string>(views.begin(), views.end());
    }

    /// Inverse of splitLine for cells that contain no delimiter
    inline std::string joinCells(const std::vector<std::string>& cells, char delimiter = DEFAULT_DELIMITER) {
        std::string line;
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) line.push_back(delimiter);
            line += cells[i];
        }
        return line;
    }

    /// Remove leading and trailing whitespace
    inline std::string_view trimWhitespace(std::string_view text) {
        constexpr std::string_view ws = " \t\r\n\f\v";
        const size_t first = text.find_first_not_of(ws);
        if (first == std::string_view::npos) {
            return {};
        }
        const size_t last = text.find_last_not_of(ws);
        return text.substr(first, last - first + 1);
    }

} // namespace csvidx
