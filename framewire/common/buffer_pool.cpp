// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "buffer_pool.hpp"

#include <bit>
#include <utility>

namespace framewire {

PooledBuffer::PooledBuffer(PooledBuffer&& other) noexcept
    : pool_{std::exchange(other.pool_, nullptr)},
      data_{std::move(other.data_)},
      capacity_{std::exchange(other.capacity_, 0)} {}

PooledBuffer& PooledBuffer::operator=(PooledBuffer&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        data_ = std::move(other.data_);
        capacity_ = std::exchange(other.capacity_, 0);
    }
    return *this;
}

void PooledBuffer::release() noexcept {
    if (pool_ && data_) {
        pool_->give_back(std::move(data_), capacity_);
    }
    pool_ = nullptr;
    data_.reset();
    capacity_ = 0;
}

BufferPool::BufferPool(size_t max_buffers_per_bucket) : max_buffers_per_bucket_{max_buffers_per_bucket} {
    // give_back cannot allocate
    for (auto& bucket : buckets_) {
        bucket.reserve(max_buffers_per_bucket_);
    }
}

BufferPool& BufferPool::shared() {
    static BufferPool shared_pool;
    return shared_pool;
}

size_t BufferPool::bucket_index(size_t size) {
    if (size <= kMinBufferSize) return 0;
    return static_cast<size_t>(std::bit_width(size - 1)) - static_cast<size_t>(std::bit_width(kMinBufferSize - 1));
}

PooledBuffer BufferPool::rent(size_t minimum_size) {
    if (minimum_size > kMaxBufferSize) {
        std::scoped_lock lock{mutex_};
        ++outstanding_;
        return PooledBuffer{this, std::make_unique_for_overwrite<uint8_t[]>(minimum_size), minimum_size};
    }

    const auto index = bucket_index(minimum_size);
    const auto capacity = bucket_size(index);
    {
        std::scoped_lock lock{mutex_};
        ++outstanding_;
        auto& bucket = buckets_[index];
        if (!bucket.empty()) {
            auto data = std::move(bucket.back());
            bucket.pop_back();
            return PooledBuffer{this, std::move(data), capacity};
        }
    }
    return PooledBuffer{this, std::make_unique_for_overwrite<uint8_t[]>(capacity), capacity};
}

void BufferPool::give_back(std::unique_ptr<uint8_t[]> data, size_t capacity) noexcept {
    std::scoped_lock lock{mutex_};
    --outstanding_;
    if (capacity > kMaxBufferSize) return;

    const auto index = bucket_index(capacity);
    auto& bucket = buckets_[index];
    if (bucket_size(index) == capacity && bucket.size() < max_buffers_per_bucket_) {
        bucket.push_back(std::move(data));
    }
}

size_t BufferPool::cached() const {
    std::scoped_lock lock{mutex_};
    size_t count{0};
    for (const auto& bucket : buckets_) {
        count += bucket.size();
    }
    return count;
}

size_t BufferPool::outstanding() const {
    std::scoped_lock lock{mutex_};
    return outstanding_;
}

}  // namespace framewire
