// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "gzip.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

namespace framewire::compression {

static ByteSequence make_sequence(BufferPool& pool, std::string_view content, size_t segment_size = 4096) {
    ByteSequence sequence{pool, segment_size};
    sequence.write(string_view_to_byte_view(content));
    return sequence;
}

static std::string decompress_to_string(const ByteSequence& compressed) {
    ByteSequence output;
    GzipDecompressor{}.decompress(compressed, output);
    return output.to_string();
}

//! Produce a gzip member using plain zlib at the given level
static Bytes zlib_gzip(std::string_view content, int level) {
    z_stream stream{};
    REQUIRE(deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) == Z_OK);
    Bytes compressed(deflateBound(&stream, content.size()), 0);
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(content.data()));
    stream.avail_in = static_cast<uInt>(content.size());
    stream.next_out = compressed.data();
    stream.avail_out = static_cast<uInt>(compressed.size());
    REQUIRE(deflate(&stream, Z_FINISH) == Z_STREAM_END);
    compressed.resize(stream.total_out);
    deflateEnd(&stream);
    return compressed;
}

TEST_CASE("GzipCompressor::compress", "[framewire][compression][gzip]") {
    BufferPool pool;

    SECTION("output carries the gzip magic header") {
        const auto input = make_sequence(pool, R"({"jsonrpc":"2.0","method":"ping"})");
        ByteSequence output{pool};
        GzipCompressor{}.compress(input, output);
        const auto bytes = output.to_bytes();
        REQUIRE(bytes.size() > 10);
        CHECK(bytes[0] == 0x1f);
        CHECK(bytes[1] == 0x8b);
        CHECK(decompress_to_string(output) == R"({"jsonrpc":"2.0","method":"ping"})");
    }

    SECTION("empty input produces a valid empty member") {
        const ByteSequence input{pool};
        ByteSequence output{pool};
        GzipCompressor{}.compress(input, output);
        CHECK(!output.empty());
        CHECK(decompress_to_string(output).empty());
    }

    SECTION("multi-segment input is compressed as one stream") {
        std::string content;
        for (int i = 0; i < 2000; ++i) {
            content += "{\"id\":" + std::to_string(i) + "}";
        }
        const auto input = make_sequence(pool, content, 64);
        REQUIRE(input.segments().size() > 1);
        ByteSequence output{pool};
        GzipCompressor{}.compress(input, output);
        CHECK(output.size() < input.size());
        CHECK(decompress_to_string(output) == content);
    }

    SECTION("compressor is reusable") {
        GzipCompressor compressor;
        ByteSequence first{pool}, second{pool};
        compressor.compress(make_sequence(pool, "first"), first);
        compressor.compress(make_sequence(pool, "second"), second);
        CHECK(decompress_to_string(first) == "first");
        CHECK(decompress_to_string(second) == "second");
    }
}

TEST_CASE("GzipDecompressor::decompress", "[framewire][compression][gzip]") {
    BufferPool pool;

    SECTION("accepts gzip produced by zlib at any level") {
        const std::string content(10'000, 'a');
        for (const int level : {Z_BEST_SPEED, Z_DEFAULT_COMPRESSION, Z_BEST_COMPRESSION}) {
            const auto compressed = zlib_gzip(content, level);
            ByteSequence input{pool, 7};
            input.write(compressed);
            CHECK(decompress_to_string(input) == content);
        }
    }

    SECTION("accepts concatenated members") {
        ByteSequence input{pool};
        input.write(zlib_gzip("hello ", Z_BEST_SPEED));
        input.write(zlib_gzip("world", Z_BEST_SPEED));
        CHECK(decompress_to_string(input) == "hello world");
    }

    SECTION("output larger than one chunk") {
        std::string content;
        for (size_t i = 0; i < 5 * kZlibChunkSize; ++i) {
            content.push_back(static_cast<char>('a' + (i * 7) % 26));
        }
        ByteSequence input{pool};
        input.write(zlib_gzip(content, Z_BEST_SPEED));
        CHECK(decompress_to_string(input) == content);
    }

    SECTION("rejects plain text") {
        const auto input = make_sequence(pool, R"({"jsonrpc":"2.0"})");
        CHECK_THROWS_AS(decompress_to_string(input), DecompressionError);
    }

    SECTION("rejects corrupted data") {
        auto compressed = zlib_gzip("some content to be corrupted", Z_BEST_SPEED);
        compressed[compressed.size() - 5] ^= 0xff;  // break the CRC32 trailer
        ByteSequence input{pool};
        input.write(compressed);
        CHECK_THROWS_AS(decompress_to_string(input), DecompressionError);
    }

    SECTION("rejects truncated data") {
        auto compressed = zlib_gzip("some content to be truncated", Z_BEST_SPEED);
        compressed.resize(compressed.size() / 2);
        ByteSequence input{pool};
        input.write(compressed);
        CHECK_THROWS_AS(decompress_to_string(input), DecompressionError);
    }

    SECTION("rejects empty input") {
        const ByteSequence input{pool};
        CHECK_THROWS_AS(decompress_to_string(input), DecompressionError);
    }

    SECTION("rejects trailing garbage after a member") {
        ByteSequence input{pool};
        input.write(zlib_gzip("payload", Z_BEST_SPEED));
        input.write(string_view_to_byte_view("garbage"));
        CHECK_THROWS_AS(decompress_to_string(input), DecompressionError);
    }
}

}  // namespace framewire::compression
