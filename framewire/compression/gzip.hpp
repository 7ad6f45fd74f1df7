// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <zlib.h>

#include <framewire/common/byte_sequence.hpp>

namespace framewire::compression {

//! Size of the output chunk requested to the sequence on each deflate/inflate round
inline constexpr size_t kZlibChunkSize = 16 * 1024;

//! Window bits selecting the gzip wrapper (15-bit window + 16)
inline constexpr int kGzipWindowBits = 15 + 16;

//! Raised when the input is not a complete and valid gzip stream
class DecompressionError : public std::runtime_error {
  public:
    explicit DecompressionError(const std::string& message) : std::runtime_error(message) {}
};

//! One-shot gzip compression of a whole byte sequence
class GzipCompressor {
  public:
    explicit GzipCompressor(int level = Z_BEST_SPEED);
    ~GzipCompressor();

    GzipCompressor(const GzipCompressor&) = delete;
    GzipCompressor& operator=(const GzipCompressor&) = delete;

    //! Compress the whole \p input as one gzip member appended to \p output
    void compress(const ByteSequence& input, ByteSequence& output);

  private:
    z_stream stream_;
};

//! One-shot gzip decompression of a whole byte sequence
class GzipDecompressor {
  public:
    GzipDecompressor();
    ~GzipDecompressor();

    GzipDecompressor(const GzipDecompressor&) = delete;
    GzipDecompressor& operator=(const GzipDecompressor&) = delete;

    //! Decompress the whole \p input, which must hold one or more complete gzip members, appending to \p output
    //! \throws DecompressionError if \p input is corrupted or truncated
    void decompress(const ByteSequence& input, ByteSequence& output);

  private:
    z_stream stream_;
};

}  // namespace framewire::compression
