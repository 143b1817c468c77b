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
 * @file errors.h
 * @brief Exception taxonomy and the tagged accessor result of the csvidx library.
 *
 *   - StateError  operation invoked in an invalid lifecycle state
 *   - RangeError  row number outside [1, lines]
 *   - IOError     open / read / positioned-read failure, with context
 *
 * Every failure aborts only the current call; the engine keeps its prior state.
 */

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace csvidx {

    class StateError : public std::logic_error {
    public:
        explicit StateError(const std::string& msg) : std::logic_error(msg) {}
    };

    class RangeError : public std::out_of_range {
    public:
        explicit RangeError(const std::string& msg) : std::out_of_range(msg) {}
    };

    class IOError : public std::runtime_error {
    public:
        explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * @brief Either a value or the StateError explaining why it is not available.
     *
     * Returned by the CsvFile accessors that require an indexed file.
     * value() rethrows the carried StateError.
     */
    template<typename T>
    class Result {
        std::variant<T, StateError> data_;

    public:
        Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(StateError error) : data_(std::in_place_index<1>, std::move(error)) {}

        bool ok() const noexcept                { return data_.index() == 0; }
        explicit operator bool() const noexcept { return ok(); }

        const T& value() const {
            if (!ok()) {
                throw std::get<1>(data_);
            }
            return std::get<0>(data_);
        }

        T valueOr(T fallback) const {
            return ok() ? std::get<0>(data_) : std::move(fallback);
        }

        /// nullptr when the result holds a value
        const StateError* error() const noexcept {
            return std::get_if<1>(&data_);
        }
    };

} // namespace csvidx
