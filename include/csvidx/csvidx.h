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
 * @file csvidx.h
 * @brief csvidx library - main header with declarations and implementations
 *
 * A C++20 header-only library for indexed random access and streaming reads
 * of delimited text files too large to load into memory.
 *
 * This header includes all csvidx components:
 * - RowRecord / RowDecoder: row-to-field decoding shared by both read paths
 * - FileIndex: per-row byte offset table, persistable as a sidecar
 * - IndexBuilder: one-pass index scan
 * - RandomAccessReader: positioned reads of indexed rows
 * - RowIterator: sequential iteration sessions
 * - CsvFile: the engine tying all of the above together
 */

// Core definitions first
#include "definitions.h"
#include "errors.h"

// Core component declarations
#include "row_splitter.h"
#include "row_record.h"
#include "row_decoder.h"
#include "line_stream.h"
#include "file_index.h"
#include "index_builder.h"
#include "random_access_reader.h"
#include "row_iterator.h"
#include "csv_file.h"

// Include implementations
#include "row_decoder.hpp"
#include "line_stream.hpp"
#include "file_index.hpp"
#include "index_builder.hpp"
#include "random_access_reader.hpp"
#include "row_iterator.hpp"
#include "csv_file.hpp"
