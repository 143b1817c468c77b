/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 * 
 * This file is part of the csvidx library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file csvidxHead.cpp
 * @brief CLI tool to display the first few rows of a CSV file
 *
 * Streams the file through a sequential iteration session; no index is built,
 * so the tool returns immediately even on very large files.
 */

#include <iostream>
#include <string>
#include <csvidx/csvidx.h>
#include "cli_common.h"

using csvidx_cli::parseCount;
using csvidx_cli::printRecord;

struct Config {
    std::string input_file;
    size_t num_rows = 10;        // Default: show first 10 rows
    char delimiter = ',';
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "csvidxHead (csvidx " << csvidx::getVersion() << ")\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT_FILE\n\n";
    std::cout << "Display the first few rows of a CSV file, one field per line.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -n, --lines N           Number of rows to display (default: 10)\n";
    std::cout << "  -d, --delimiter CHAR    Field delimiter (default: ',')\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  -h, --help              Show this help message\n";
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
        } else if ((arg == "-n" || arg == "--lines") && i + 1 < argc) {
            config.num_rows = parseCount(argv[++i], "number of lines");
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
        auto rows = csv.iterator();

        size_t rows_printed = 0;
        while (rows_printed < config.num_rows) {
            std::optional<csvidx::RowRecord> rec = rows->next();
            if (!rec) {
                break;
            }
            printRecord(*rec, *rows->header());
            rows_printed++;
        }

        rows->close();
        csv.close();

        if (config.verbose) {
            std::cerr << "Successfully displayed " << rows_printed << " rows" << std::endl;
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
