// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

#include <framewire/common/buffer_pool.hpp>
#include <framewire/common/byte_sequence.hpp>
#include <framewire/compression/gzip.hpp>
#include <framewire/formatter/message_formatter.hpp>
#include <framewire/infra/concurrency/task.hpp>
#include <framewire/transport/socket_channel.hpp>

#include "message_handler.hpp"

namespace framewire::rpc {

struct MessageHandlerSettings {
    //! Whether each message is gzip-compressed as a whole and sent as binary frames
    bool compress{false};
    //! Size of the buffer offered to each receive call and of the segments of outgoing buffers
    size_t segment_size_hint{ByteSequence::kDefaultMinimumSegmentSize};
};

//! Reason sent in the close frame answering a close requested by the peer
inline constexpr std::string_view kCloseReason{"Closed as requested."};

//! MessageHandler exchanging one message per transport message over a SocketChannel.
//! Incoming frames are accumulated until the end of message, then optionally decompressed and decoded.
//! Outgoing messages are encoded, optionally compressed and sent as one frame per buffer segment.
//! One read and one write may be in progress at the same time.
class SocketMessageHandler : public MessageHandler {
  public:
    using Clock = std::chrono::system_clock;

    //! Use JSON formatting with default segment size hint
    SocketMessageHandler(std::unique_ptr<transport::SocketChannel> channel, bool compress);

    SocketMessageHandler(std::unique_ptr<transport::SocketChannel> channel,
                         std::unique_ptr<MessageFormatter> formatter,
                         const MessageHandlerSettings& settings = {},
                         BufferPool& pool = BufferPool::shared());

    ~SocketMessageHandler() override;

    bool can_read() const override { return true; }
    bool can_write() const override { return true; }

    Task<std::optional<Message>> read() override;
    Task<void> write(const Message& message) override;

    //! Messages are sent as soon as written, so there is nothing to flush
    Task<void> flush() override { co_return; }

    //! Time of the latest frame sent
    Clock::time_point last_send() const { return last_send_.load(); }

    //! Time of the latest frame received
    Clock::time_point last_receive() const { return last_receive_.load(); }

    bool compress() const { return compress_; }
    size_t segment_size_hint() const { return segment_size_hint_; }
    MessageFormatter& formatter() const { return *formatter_; }
    transport::SocketChannel& channel() const { return *channel_; }

  private:
    //! Send each segment of \p content as one frame, the last one ending the message
    Task<void> send(const ByteSequence& content, transport::FrameKind kind);

    //! Complete the closing handshake started by the peer, if the channel is still in a state allowing it
    Task<void> close_channel();

    static void advance_timestamp(std::atomic<Clock::time_point>& timestamp);

    std::unique_ptr<transport::SocketChannel> channel_;
    std::unique_ptr<MessageFormatter> formatter_;
    const bool compress_;
    const size_t segment_size_hint_;
    BufferPool& pool_;

    //! Used only by write
    std::unique_ptr<compression::GzipCompressor> compressor_;
    //! Used only by read
    std::unique_ptr<compression::GzipDecompressor> decompressor_;

    std::atomic<Clock::time_point> last_send_{};
    std::atomic<Clock::time_point> last_receive_{};
};

}  // namespace framewire::rpc
