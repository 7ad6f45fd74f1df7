// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "buffer_pool.hpp"

#include <stdexcept>
#include <utility>

#include <catch2/catch_test_macros.hpp>

namespace framewire {

TEST_CASE("BufferPool::rent", "[framewire][common][buffer_pool]") {
    BufferPool pool;

    SECTION("capacity is rounded up to the bucket size") {
        CHECK(pool.rent(1).capacity() == BufferPool::kMinBufferSize);
        CHECK(pool.rent(16).capacity() == 16);
        CHECK(pool.rent(17).capacity() == 32);
        CHECK(pool.rent(4096).capacity() == 4096);
        CHECK(pool.rent(4097).capacity() == 8192);
        CHECK(pool.rent(BufferPool::kMaxBufferSize).capacity() == BufferPool::kMaxBufferSize);
    }

    SECTION("oversized rental has exact capacity") {
        const auto size = BufferPool::kMaxBufferSize + 1;
        auto buffer = pool.rent(size);
        CHECK(buffer.capacity() == size);
        CHECK(buffer.data() != nullptr);
    }

    SECTION("zero size rental is valid") {
        CHECK(pool.rent(0).capacity() == BufferPool::kMinBufferSize);
    }
}

TEST_CASE("BufferPool give back", "[framewire][common][buffer_pool]") {
    BufferPool pool{2};

    SECTION("released array is reused by the next rental of the same bucket") {
        const uint8_t* first_data{nullptr};
        {
            auto buffer = pool.rent(100);
            first_data = buffer.data();
            CHECK(pool.outstanding() == 1);
        }
        CHECK(pool.outstanding() == 0);
        CHECK(pool.cached() == 1);
        auto buffer = pool.rent(128);
        CHECK(buffer.data() == first_data);
        CHECK(pool.cached() == 0);
    }

    SECTION("bucket retains at most the configured number of arrays") {
        {
            auto b1 = pool.rent(64);
            auto b2 = pool.rent(64);
            auto b3 = pool.rent(64);
            CHECK(pool.outstanding() == 3);
        }
        CHECK(pool.outstanding() == 0);
        CHECK(pool.cached() == 2);
    }

    SECTION("oversized arrays are not cached") {
        { auto buffer = pool.rent(BufferPool::kMaxBufferSize * 2); }
        CHECK(pool.cached() == 0);
        CHECK(pool.outstanding() == 0);
    }

    SECTION("moved-from buffer does not give back twice") {
        auto buffer = pool.rent(32);
        PooledBuffer other{std::move(buffer)};
        CHECK(buffer.data() == nullptr);
        CHECK(buffer.capacity() == 0);
        buffer.release();
        CHECK(pool.outstanding() == 1);
        other.release();
        CHECK(pool.outstanding() == 0);
        CHECK(pool.cached() == 1);
    }

    SECTION("array is given back when the stack unwinds") {
        try {
            auto buffer = pool.rent(256);
            throw std::runtime_error{"unwind"};
        } catch (const std::runtime_error&) {
        }
        CHECK(pool.outstanding() == 0);
        CHECK(pool.cached() == 1);
    }
}

TEST_CASE("BufferPool::shared", "[framewire][common][buffer_pool]") {
    CHECK(&BufferPool::shared() == &BufferPool::shared());
}

}  // namespace framewire
