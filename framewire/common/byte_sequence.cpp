// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "byte_sequence.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include <framewire/infra/common/ensure.hpp>

namespace framewire {

ByteSequence::ByteSequence(BufferPool& pool, size_t minimum_segment_size)
    : pool_{&pool}, minimum_segment_size_{std::max<size_t>(minimum_segment_size, 1)} {}

std::span<uint8_t> ByteSequence::get_memory(size_t size_hint) {
    const size_t required = std::max<size_t>(size_hint, 1);
    if (segments_.empty() || segments_.back().available() < required) {
        auto buffer = pool_->rent(std::max(required, minimum_segment_size_));
        if (!segments_.empty() && segments_.back().length == 0) {
            // Tail memory was handed out but never committed: swap it for a bigger one
            segments_.back().buffer = std::move(buffer);
        } else {
            segments_.push_back(Segment{std::move(buffer), 0});
        }
    }
    auto& tail = segments_.back();
    return tail.buffer.span().subspan(tail.length);
}

void ByteSequence::advance(size_t count) {
    if (count == 0) return;
    ensure(!segments_.empty() && count <= segments_.back().available(), [&]() {
        return "ByteSequence::advance count " + std::to_string(count) + " exceeds available memory";
    });
    segments_.back().length += count;
    size_ += count;
}

void ByteSequence::write(ByteView data) {
    while (!data.empty()) {
        auto memory = get_memory();
        const auto length = std::min(memory.size(), data.size());
        std::memcpy(memory.data(), data.data(), length);
        advance(length);
        data.remove_prefix(length);
    }
}

std::vector<ByteView> ByteSequence::segments() const {
    std::vector<ByteView> views;
    views.reserve(segments_.size());
    for (const auto& segment : segments_) {
        if (segment.length > 0) {
            views.emplace_back(segment.buffer.data(), segment.length);
        }
    }
    return views;
}

Bytes ByteSequence::to_bytes() const {
    Bytes content;
    content.reserve(size_);
    for (const auto& segment : segments()) {
        content.append(segment);
    }
    return content;
}

std::string ByteSequence::to_string() const {
    std::string content;
    content.reserve(size_);
    for (const auto& segment : segments()) {
        content.append(byte_view_to_string_view(segment));
    }
    return content;
}

void ByteSequence::reset() noexcept {
    segments_.clear();
    size_ = 0;
}

}  // namespace framewire
