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
 * @file row_record.h
 * @brief RowRecord: the value object produced for every decoded data line.
 */

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace csvidx {

    /// A cell value; empty cells and missing positions are null
    using Cell = std::optional<std::string>;

    /// Value of a named field: a single cell, or every cell assigned to a repeated name in encounter order
    using FieldValue = std::variant<Cell, std::vector<Cell>>;

    using FieldMap = std::map<std::string, FieldValue, std::less<>>;

    /// Ordered column names of a file
    using Header = std::vector<std::string>;

    /**
     * @brief Decoded representation of one data line (never the header).
     *
     * fields always holds every header column name as a key. unnamed collects
     * the cells beyond the header width, in order.
     */
    struct RowRecord {
        size_t              index = 0;              // 1-based data row number
        std::optional<std::string> line;            // raw text of the row, nullopt if synthesized
        std::vector<Cell>   cells;                  // one entry per delimiter-split token
        FieldMap            fields;
        std::vector<Cell>   unnamed;
        bool                hasMissingCells = false; // fewer cells than header columns
        bool                hasExcessCells = false;  // more cells than header columns

        bool hasField(std::string_view name) const {
            return fields.find(name) != fields.end();
        }

        const FieldValue& field(std::string_view name) const {
            auto it = fields.find(name);
            if (it == fields.end()) {
                throw std::out_of_range("RowRecord: no field named '" + std::string(name) + "'");
            }
            return it->second;
        }

        /// True if the name was assigned more than once
        bool isRepeated(std::string_view name) const {
            return std::holds_alternative<std::vector<Cell>>(field(name));
        }

        /// All values of a field, a single-valued field yields one entry
        std::vector<Cell> values(std::string_view name) const {
            const FieldValue& value = field(name);
            if (const auto* seq = std::get_if<std::vector<Cell>>(&value)) {
                return *seq;
            }
            return { std::get<Cell>(value) };
        }

        bool operator==(const RowRecord&) const = default;
    };

} // namespace csvidx
