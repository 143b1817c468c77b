/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the csvidx library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file csvidxRow.cpp
 * @brief CLI tool to print individual rows of a CSV file by row number
 *
 * Rows are fetched by positioned reads through the row index, which is either
 * built on the fly or restored from a sidecar written by csvidxInfo -s.
 */

#include <iostream>
#include <string>
#include <vector>
#include <csvidx/csvidx.h>
#include "cli_common.h"

using csvidx_cli::parseCount;
using csvidx_cli::printRecord;

struct Config {
    std::string input_file;
    std::string load_index;             // empty: build the index by scanning
    std::vector<size_t> rows;
    char delimiter = ',';
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "csvidxRow (csvidx " << csvidx::getVersion() << ")\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT_FILE ROW [ROW...]\n\n";
    std::cout << "Print rows of a CSV file by 1-based row number (the header is not a row).\n\n";
    std::cout << "Options:\n";
    std::cout << "  -l, --load-index PATH   Use an index sidecar instead of scanning the file\n";
    std::cout << "  -d, --delimiter CHAR    Field delimiter (default: ',')\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " data.csv 1 1000 250000\n";
    std::cout << "  " << program_name << " -l data.csv.idx data.csv 42\n";
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
        } else if ((arg == "-l" || arg == "--load-index") && i + 1 < argc) {
            config.load_index = argv[++i];
        } else if ((arg == "-d" || arg == "--delimiter") && i + 1 < argc) {
            std::string delim = argv[++i];
            if (delim.length() != 1) {
                throw std::runtime_error("Delimiter must be a single character: " + delim);
            }
            config.delimiter = delim[0];
        } else if (arg.substr(0, 1) == "-") {
            throw std::runtime_error("Unknown option: " + arg);
        } else if (config.input_file.empty()) {
            config.input_file = arg;
        } else {
            config.rows.push_back(parseCount(arg, "row number"));
        }
    }

    if (config.input_file.empty()) {
        throw std::runtime_error("Input file is required");
    }
    if (config.rows.empty()) {
        throw std::runtime_error("At least one row number is required");
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
        if (config.load_index.empty()) {
            csv.buildIndex();
        } else {
            csv.loadIndex(config.load_index);
        }
        if (config.verbose) {
            std::cerr << "Indexed " << csv.lines().value() << " rows of " << config.input_file
                      << (config.load_index.empty() ? " (scanned)" : " (from sidecar)") << std::endl;
        }

        const csvidx::Header header = csv.header().value();
        for (size_t row : config.rows) {
            printRecord(csv.getLine(row), header);
        }

        csv.close();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
