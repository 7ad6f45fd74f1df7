// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "socket_message_handler.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <boost/system/system_error.hpp>

#include <framewire/formatter/json_formatter.hpp>
#include <framewire/infra/common/ensure.hpp>
#include <framewire/infra/common/log.hpp>
#include <framewire/infra/concurrency/cancellation.hpp>

namespace framewire::rpc {

using transport::ChannelState;
using transport::CloseStatus;
using transport::FrameKind;

SocketMessageHandler::SocketMessageHandler(std::unique_ptr<transport::SocketChannel> channel, bool compress)
    : SocketMessageHandler{std::move(channel),
                           std::make_unique<JsonFormatter>(),
                           MessageHandlerSettings{.compress = compress}} {}

SocketMessageHandler::SocketMessageHandler(std::unique_ptr<transport::SocketChannel> channel,
                                           std::unique_ptr<MessageFormatter> formatter,
                                           const MessageHandlerSettings& settings,
                                           BufferPool& pool)
    : channel_{std::move(channel)},
      formatter_{std::move(formatter)},
      compress_{settings.compress},
      segment_size_hint_{settings.segment_size_hint},
      pool_{pool} {
    ensure_pre_condition(channel_ != nullptr, [] { return "channel must not be null"; });
    ensure_pre_condition(formatter_ != nullptr, [] { return "formatter must not be null"; });
    ensure_pre_condition(segment_size_hint_ > 0, [] { return "segment size hint must be positive"; });

    if (compress_) {
        compressor_ = std::make_unique<compression::GzipCompressor>();
        decompressor_ = std::make_unique<compression::GzipDecompressor>();
    }
    FWIRE_TRACE << "SocketMessageHandler::SocketMessageHandler channel: " << channel_.get()
                << " compress: " << compress_ << " segment_size_hint: " << segment_size_hint_;
}

SocketMessageHandler::~SocketMessageHandler() {
    FWIRE_TRACE << "SocketMessageHandler::~SocketMessageHandler channel: " << channel_.get();
}

Task<std::optional<Message>> SocketMessageHandler::read() {
    ByteSequence received{pool_, segment_size_hint_};
    while (true) {
        const auto memory = received.get_memory(segment_size_hint_);
        const auto result = co_await channel_->receive(memory.first(std::min(memory.size(), segment_size_hint_)));
        received.advance(result.count);
        advance_timestamp(last_receive_);

        if (result.kind == FrameKind::kClose) {
            FWIRE_DEBUG << "SocketMessageHandler::read close frame received, state: " << channel_->state()
                        << " discarded: " << received.size();
            co_await close_channel();
            co_return std::nullopt;
        }
        FWIRE_TRACE << "SocketMessageHandler::read frame kind: " << result.kind << " count: " << result.count
                    << " end_of_message: " << result.end_of_message;
        if (result.end_of_message) break;
    }

    if (received.empty()) {
        co_return std::nullopt;
    }

    if (!compress_) {
        co_return formatter_->deserialize(received);
    }

    ByteSequence decompressed{pool_, segment_size_hint_};
    try {
        decompressor_->decompress(received, decompressed);
    } catch (const compression::DecompressionError& e) {
        FWIRE_DEBUG << "SocketMessageHandler::read cannot decompress " << received.size() << " bytes: " << e.what();
        throw;
    }
    FWIRE_TRACE << "SocketMessageHandler::read decompressed " << received.size() << " into " << decompressed.size() << " bytes";
    if (decompressed.empty()) {
        co_return std::nullopt;
    }
    co_return formatter_->deserialize(decompressed);
}

Task<void> SocketMessageHandler::write(const Message& message) {
    ensure_pre_condition(!message.is_null(), [] { return "message must not be null"; });

    const auto kind = dynamic_cast<TextFormatter*>(formatter_.get()) ? FrameKind::kText : FrameKind::kBinary;

    ByteSequence encoded{pool_, segment_size_hint_};
    formatter_->serialize(encoded, message);

    co_await concurrency::throw_if_cancelled();

    if (auto tracing = dynamic_cast<FormatterTracingCallbacks*>(formatter_.get())) {
        tracing->on_serialization_complete(message, encoded);
    }

    if (!compress_) {
        co_await send(encoded, kind);
        co_return;
    }

    ByteSequence compressed{pool_, segment_size_hint_};
    compressor_->compress(encoded, compressed);
    FWIRE_TRACE << "SocketMessageHandler::write compressed " << encoded.size() << " into " << compressed.size() << " bytes";
    co_await send(compressed, FrameKind::kBinary);
}

Task<void> SocketMessageHandler::send(const ByteSequence& content, FrameKind kind) {
    const auto segments = content.segments();
    if (segments.empty()) {
        co_await channel_->send(ByteView{}, kind, /*end_of_message=*/true);
        advance_timestamp(last_send_);
        co_return;
    }

    size_t offset{0};
    for (const auto& segment : segments) {
        offset += segment.size();
        const bool end_of_message = offset == content.size();
        co_await channel_->send(segment, kind, end_of_message);
        advance_timestamp(last_send_);
        FWIRE_TRACE << "SocketMessageHandler::send frame kind: " << kind << " size: " << segment.size()
                    << " end_of_message: " << end_of_message;
    }
}

Task<void> SocketMessageHandler::close_channel() {
    const auto state = channel_->state();
    if (state != ChannelState::kOpen && state != ChannelState::kCloseReceived && state != ChannelState::kCloseSent) {
        co_return;
    }

    try {
        co_await channel_->close(CloseStatus::kNormalClosure, std::string{kCloseReason});
        FWIRE_DEBUG << "SocketMessageHandler::close_channel handshake completed, state: " << channel_->state();
    } catch (const boost::system::system_error& se) {
        if (concurrency::is_cancellation(se)) {
            throw;
        }
        FWIRE_DEBUG << "SocketMessageHandler::close_channel handshake failed: " << se.what();
    }
}

void SocketMessageHandler::advance_timestamp(std::atomic<Clock::time_point>& timestamp) {
    const auto now = Clock::now();
    auto current = timestamp.load();
    while (current < now && !timestamp.compare_exchange_weak(current, now)) {
    }
}

}  // namespace framewire::rpc
