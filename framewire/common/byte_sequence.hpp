// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "buffer_pool.hpp"
#include "bytes.hpp"

namespace framewire {

//! Growable byte buffer made of discontiguous segments rented from a BufferPool.
//! All segments are given back to the pool when the sequence is reset or destroyed.
class ByteSequence {
  public:
    static constexpr size_t kDefaultMinimumSegmentSize{4096};

    explicit ByteSequence(BufferPool& pool = BufferPool::shared(),
                          size_t minimum_segment_size = kDefaultMinimumSegmentSize);

    ByteSequence(const ByteSequence&) = delete;
    ByteSequence& operator=(const ByteSequence&) = delete;
    ByteSequence(ByteSequence&&) noexcept = default;
    ByteSequence& operator=(ByteSequence&&) noexcept = default;

    //! Get writable memory at the end of the sequence, at least \p size_hint bytes long (at least one byte if zero)
    //! \remarks The memory becomes part of the sequence only after a call to advance
    std::span<uint8_t> get_memory(size_t size_hint = 0);

    //! Commit \p count bytes written into the memory returned by the last get_memory call
    void advance(size_t count);

    //! Append a copy of \p data
    void write(ByteView data);

    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    //! The committed non-empty segments, in order
    std::vector<ByteView> segments() const;

    //! Copy the whole content into a contiguous buffer
    Bytes to_bytes() const;
    std::string to_string() const;

    //! Give all segments back to the pool
    void reset() noexcept;

  private:
    struct Segment {
        PooledBuffer buffer;
        size_t length{0};

        size_t available() const { return buffer.capacity() - length; }
    };

    BufferPool* pool_;
    size_t minimum_segment_size_;
    std::vector<Segment> segments_;
    size_t size_{0};
};

}  // namespace framewire
