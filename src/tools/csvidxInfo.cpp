/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the csvidx library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file csvidxInfo.cpp
 * @brief CLI tool to index a CSV file and print its shape
 *
 * Builds the row index of a CSV file and reports columns, rows, cells, scanned
 * size and indexing time. Optionally persists the index as a sidecar file for
 * csvidxRow --load-index.
 */

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <csvidx/csvidx.h>
#include "cli_common.h"

using csvidx_cli::formatBytes;
using csvidx_cli::parseCount;
using csvidx_cli::printHeaderSummary;

struct Config {
    std::string input_file;
    std::string save_index;             // empty: do not persist the index
    std::optional<size_t> max_rows;
    char delimiter = ',';
    bool show_header = false;
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "csvidxInfo (csvidx " << csvidx::getVersion() << ")\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT_FILE\n\n";
    std::cout << "Index a CSV file and print its shape.\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  INPUT_FILE     Input CSV file path\n\n";
    std::cout << "Options:\n";
    std::cout << "  -m, --max N             Index only the first N data rows\n";
    std::cout << "  -d, --delimiter CHAR    Field delimiter (default: ',')\n";
    std::cout << "  -s, --save-index PATH   Write the index to a sidecar file\n";
    std::cout << "  --header                Print the column table\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " data.csv\n";
    std::cout << "  " << program_name << " --max 1000 --header data.csv\n";
    std::cout << "  " << program_name << " -s data.csv.idx data.csv\n";
}

Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.help = true;
            return config;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--header") {
            config.show_header = true;
        } else if ((arg == "-m" || arg == "--max") && i + 1 < argc) {
            config.max_rows = parseCount(argv[++i], "row cap", true);
        } else if ((arg == "-s" || arg == "--save-index") && i + 1 < argc) {
            config.save_index = argv[++i];
        } else if ((arg == "-d" || arg == "--delimiter") && i + 1 < argc) {
            std::string delim = argv[++i];
            if (delim.length() != 1) {
                throw std::runtime_error("Delimiter must be a single character: " + delim);
            }
            config.delimiter = delim[0];
        } else if (arg.substr(0, 1) == "-") {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            if (!config.input_file.empty()) {
                throw std::runtime_error("Too many arguments. Only one input file expected.");
            }
            config.input_file = arg;
        }
    }

    if (config.input_file.empty()) {
        throw std::runtime_error("Input file is required");
    }
    return config;
}

int main(int argc, char* argv[]) {
    try {
        Config config = parseArgs(argc, argv);

        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }

        csvidx::CsvFile csv(config.input_file, csvidx::CsvFile::Options{config.delimiter, true});
        if (config.verbose) {
            std::cerr << "Reading: " << config.input_file << std::endl;
            std::cerr << "Line divisor: " << csvidx::divisorString(*csv.lineDivisor()) << std::endl;
            std::cerr << "State:        " << csvidx::fileStateToString(csv.state()) << std::endl;
        }

        csvidx::CsvFile::IndexOptions options;
        options.maxRows = config.max_rows;
        if (config.verbose) {
            const bool byRows = config.max_rows.has_value();
            const uint64_t step = byRows ? 100000 : 64ull * 1024 * 1024;
            options.progress = [byRows, step, next = step](uint64_t current) mutable {
                if (current >= next) {
                    std::cerr << "  ... " << (byRows ? std::to_string(current) + " rows"
                                                     : formatBytes(current)) << std::endl;
                    next = (current / step + 1) * step;
                }
            };
        }

        auto start = std::chrono::steady_clock::now();
        csv.buildIndex(options);
        if (config.verbose) {
            std::cerr << "State:        " << csvidx::fileStateToString(csv.state()) << std::endl;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        const size_t columns = csv.columns().value();
        const size_t lines = csv.lines().value();

        std::cout << "File:           " << csv.filename().string() << "\n";
        std::cout << "Columns:        " << columns << "\n";
        std::cout << "Lines:          " << lines << "\n";
        std::cout << "Cells:          " << columns * lines << "\n";
        std::cout << "Scanned size:   " << formatBytes(csv.size().value()) << "\n";
        std::cout << "Max row length: " << csv.maxRowLength().value() << " bytes\n";
        std::cout << "Index time:     " << elapsed << " ms\n";

        if (config.show_header) {
            printHeaderSummary(csv.header().value(), std::cout);
        }

        if (!config.save_index.empty()) {
            csv.saveIndex(config.save_index);
            if (config.verbose) {
                std::cerr << "Index written to " << config.save_index << std::endl;
            }
        }

        csv.close();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
