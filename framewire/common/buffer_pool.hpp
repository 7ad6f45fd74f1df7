// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace framewire {

class BufferPool;

//! Byte array rented from a BufferPool, given back to the pool on destruction
class PooledBuffer {
  public:
    PooledBuffer() = default;
    ~PooledBuffer() { release(); }

    PooledBuffer(const PooledBuffer&) = delete;
    PooledBuffer& operator=(const PooledBuffer&) = delete;

    PooledBuffer(PooledBuffer&& other) noexcept;
    PooledBuffer& operator=(PooledBuffer&& other) noexcept;

    uint8_t* data() const noexcept { return data_.get(); }
    size_t capacity() const noexcept { return capacity_; }
    std::span<uint8_t> span() const noexcept { return {data_.get(), capacity_}; }

    //! Give the array back to the pool in advance, leaving this buffer empty
    void release() noexcept;

  private:
    friend class BufferPool;

    PooledBuffer(BufferPool* pool, std::unique_ptr<uint8_t[]> data, size_t capacity)
        : pool_{pool}, data_{std::move(data)}, capacity_{capacity} {}

    BufferPool* pool_{nullptr};
    std::unique_ptr<uint8_t[]> data_;
    size_t capacity_{0};
};

//! Thread-safe pool of byte arrays bucketed by power-of-two sizes
class BufferPool {
  public:
    static constexpr size_t kMinBufferSize{16};
    static constexpr size_t kMaxBufferSize{1024 * 1024};
    static constexpr size_t kDefaultMaxBuffersPerBucket{32};

    explicit BufferPool(size_t max_buffers_per_bucket = kDefaultMaxBuffersPerBucket);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    //! The process-wide pool
    static BufferPool& shared();

    //! Rent an array of at least \p minimum_size bytes
    //! \remarks Arrays bigger than kMaxBufferSize are allocated with exact size and never cached
    PooledBuffer rent(size_t minimum_size);

    //! Number of arrays currently cached and ready to be rented
    size_t cached() const;

    //! Number of arrays currently rented and not yet given back
    size_t outstanding() const;

  private:
    friend class PooledBuffer;

    static constexpr size_t kBucketCount{17};  // 16B, 32B, ..., 1MiB

    static size_t bucket_index(size_t size);
    static size_t bucket_size(size_t index) { return kMinBufferSize << index; }

    void give_back(std::unique_ptr<uint8_t[]> data, size_t capacity) noexcept;

    const size_t max_buffers_per_bucket_;
    std::array<std::vector<std::unique_ptr<uint8_t[]>>, kBucketCount> buckets_;
    size_t outstanding_{0};
    mutable std::mutex mutex_;
};

}  // namespace framewire
