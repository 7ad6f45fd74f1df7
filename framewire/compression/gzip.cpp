// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "gzip.hpp"

#include <cstring>
#include <vector>

#include <framewire/infra/common/ensure.hpp>
#include <framewire/infra/common/log.hpp>

namespace framewire::compression {

static std::string zlib_error_message(const z_stream& stream, int code) {
    std::string message{"zlib error " + std::to_string(code)};
    if (stream.msg) {
        message.append(": ").append(stream.msg);
    }
    return message;
}

GzipCompressor::GzipCompressor(int level) {
    std::memset(&stream_, 0, sizeof(z_stream));
    stream_.zalloc = Z_NULL;
    stream_.zfree = Z_NULL;
    stream_.opaque = Z_NULL;

    if (deflateInit2(&stream_, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("zlib deflate initialization error");
    }
}

GzipCompressor::~GzipCompressor() {
    deflateEnd(&stream_);
}

void GzipCompressor::compress(const ByteSequence& input, ByteSequence& output) {
    const int reset_result = deflateReset(&stream_);
    if (reset_result != Z_OK) {
        throw std::runtime_error(zlib_error_message(stream_, reset_result));
    }

    // Feed every segment, finishing the stream with the last one (or immediately if there is none)
    const auto segments = input.segments();
    const size_t segment_count = segments.size();
    size_t index = 0;
    do {
        const bool last = index + 1 >= segment_count;
        if (index < segment_count) {
            stream_.next_in = const_cast<Bytef*>(segments[index].data());
            stream_.avail_in = static_cast<uInt>(segments[index].size());
        } else {
            stream_.next_in = Z_NULL;
            stream_.avail_in = 0;
        }

        int result{Z_OK};
        do {
            auto memory = output.get_memory(kZlibChunkSize);
            stream_.next_out = memory.data();
            stream_.avail_out = static_cast<uInt>(memory.size());

            result = deflate(&stream_, last ? Z_FINISH : Z_NO_FLUSH);
            if (result == Z_STREAM_ERROR) {
                throw std::runtime_error(zlib_error_message(stream_, result));
            }
            output.advance(memory.size() - stream_.avail_out);
        } while (stream_.avail_out == 0 || (last && result != Z_STREAM_END));
        ensure_invariant(stream_.avail_in == 0, "deflate left input unconsumed");

        ++index;
    } while (index < segment_count);

    FWIRE_TRACE << "GzipCompressor::compress in: " << input.size() << " out: " << output.size();
}

GzipDecompressor::GzipDecompressor() {
    std::memset(&stream_, 0, sizeof(z_stream));
    stream_.zalloc = Z_NULL;
    stream_.zfree = Z_NULL;
    stream_.opaque = Z_NULL;

    if (inflateInit2(&stream_, kGzipWindowBits) != Z_OK) {
        throw std::runtime_error("zlib inflate initialization error");
    }
}

GzipDecompressor::~GzipDecompressor() {
    inflateEnd(&stream_);
}

void GzipDecompressor::decompress(const ByteSequence& input, ByteSequence& output) {
    const int reset_result = inflateReset(&stream_);
    if (reset_result != Z_OK) {
        throw std::runtime_error(zlib_error_message(stream_, reset_result));
    }

    bool member_complete{false};
    for (const auto& segment : input.segments()) {
        stream_.next_in = const_cast<Bytef*>(segment.data());
        stream_.avail_in = static_cast<uInt>(segment.size());

        while (stream_.avail_in > 0) {
            if (member_complete) {
                // Another gzip member follows the one just completed
                inflateReset(&stream_);
                member_complete = false;
            }

            auto memory = output.get_memory(kZlibChunkSize);
            stream_.next_out = memory.data();
            stream_.avail_out = static_cast<uInt>(memory.size());

            const int result = inflate(&stream_, Z_NO_FLUSH);
            output.advance(memory.size() - stream_.avail_out);

            if (result == Z_STREAM_END) {
                member_complete = true;
            } else if (result == Z_NEED_DICT || result == Z_DATA_ERROR || result == Z_MEM_ERROR || result == Z_STREAM_ERROR) {
                throw DecompressionError{zlib_error_message(stream_, result)};
            } else if (result == Z_BUF_ERROR && stream_.avail_out != 0) {
                throw DecompressionError{zlib_error_message(stream_, result)};
            }
        }
    }

    // Drain any output still pending inside zlib once the whole input has been consumed
    while (!member_complete && input.size() > 0) {
        auto memory = output.get_memory(kZlibChunkSize);
        stream_.next_out = memory.data();
        stream_.avail_out = static_cast<uInt>(memory.size());

        const int result = inflate(&stream_, Z_NO_FLUSH);
        output.advance(memory.size() - stream_.avail_out);
        if (result == Z_STREAM_END) {
            member_complete = true;
        } else if (result != Z_OK) {
            break;
        }
    }

    if (!member_complete) {
        throw DecompressionError{"truncated gzip stream: " + std::to_string(input.size()) + " bytes"};
    }

    FWIRE_TRACE << "GzipDecompressor::decompress in: " << input.size() << " out: " << output.size();
}

}  // namespace framewire::compression
