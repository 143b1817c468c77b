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
 * @file checksum.hpp
 * @brief xxHash64 wrapper used to seal index sidecar files.
 */

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace csvidx {

class Checksum {
public:
    using hash_t = uint64_t;
    static constexpr hash_t DEFAULT_SEED = 0;

    /**
     * @brief Incremental hash over the pieces of a sidecar as they are written or read.
     *
     * @code
     * Checksum::Streaming hasher;
     * hasher.update(&magic, sizeof(magic));
     * hasher.update(headerLine.data(), headerLine.size());
     * uint64_t hash = hasher.finalize();
     * @endcode
     */
    class Streaming {
    public:
        explicit Streaming(hash_t seed = DEFAULT_SEED) {
            state_ = XXH64_createState();
            if (!state_) {
                throw std::runtime_error("Failed to create xxHash state");
            }
            XXH64_reset(state_, seed);
        }

        ~Streaming() {
            if (state_) {
                XXH64_freeState(state_);
            }
        }

        Streaming(const Streaming&) = delete;
        Streaming& operator=(const Streaming&) = delete;

        void update(const void* data, size_t length) {
            XXH64_update(state_, data, length);
        }

        hash_t finalize() const {
            return XXH64_digest(state_);
        }

    private:
        XXH64_state_t* state_;
    };
};

} // namespace csvidx
