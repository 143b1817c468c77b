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
 * @file line_stream.h
 * @brief LineStream: line-oriented sequential read stream over a text file.
 *
 * Yields every physical line without its divisor ("\n" or "\r\n"). A file
 * ending with a divisor does not yield a trailing empty line.
 */

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>

namespace csvidx {

    class LineStream {
    public:
        using FilePath          = std::filesystem::path;

    private:
        FilePath                file_path_;
        std::ifstream           stream_;
        size_t                  line_no_ = 0;           // lines yielded so far

    public:
        LineStream() = default;
        explicit LineStream(const FilePath& filepath)   { open(filepath); }
        ~LineStream()                                   { close(); }

        LineStream(const LineStream&) = delete;
        LineStream& operator=(const LineStream&) = delete;

        void                    open(const FilePath& filepath);
        void                    close();
        bool                    isOpen() const                  { return stream_.is_open(); }
        const FilePath&         filePath() const                { return file_path_; }
        size_t                  lineNo() const                  { return line_no_; }

        /// Read the next line into line. Returns false at end of file.
        bool                    next(std::string& line);
    };

} // namespace csvidx
