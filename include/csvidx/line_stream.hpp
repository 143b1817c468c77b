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
 * @file line_stream.hpp
 * @brief LineStream implementations.
 */

#include "line_stream.h"
#include "errors.h"

#include <ios>

namespace csvidx {

    inline void LineStream::open(const FilePath& filepath) {
        close();
        stream_.open(filepath, std::ios::in | std::ios::binary);
        if (!stream_.is_open()) {
            throw IOError("Cannot open file for reading: " + filepath.string());
        }
        file_path_ = filepath;
        line_no_ = 0;
    }

    inline void LineStream::close() {
        if (stream_.is_open()) {
            stream_.close();
        }
        file_path_.clear();
        line_no_ = 0;
    }

    inline bool LineStream::next(std::string& line) {
        if (!stream_.is_open()) {
            return false;
        }
        if (!std::getline(stream_, line)) {
            if (stream_.bad()) {
                throw IOError("Read error in file " + file_path_.string() +
                              " after line " + std::to_string(line_no_));
            }
            return false; // clean EOF
        }
        // Strip trailing \r for Windows line endings
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        line_no_++;
        return true;
    }

} // namespace csvidx
