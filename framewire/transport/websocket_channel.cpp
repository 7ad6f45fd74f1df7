// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "websocket_channel.hpp"

#include <chrono>
#include <stdexcept>

#include <boost/asio/buffer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/system/system_error.hpp>

#include <framewire/infra/common/ensure.hpp>
#include <framewire/infra/common/log.hpp>

namespace framewire::transport {

namespace websocket = boost::beast::websocket;

WebSocketChannel::WebSocketChannel(WebSocketStream&& stream) : stream_{std::move(stream)} {
    FWIRE_TRACE << "WebSocketChannel::WebSocketChannel stream created: " << &stream_;
}

WebSocketChannel::~WebSocketChannel() {
    FWIRE_TRACE << "WebSocketChannel::~WebSocketChannel stream deleted: " << &stream_ << " state: " << state_.load();
}

void WebSocketChannel::configure(bool server) {
    // The websocket timeouts replace the ones of the underlying TCP stream
    boost::beast::get_lowest_layer(stream_).expires_never();

    auto timeout = websocket::stream_base::timeout::suggested(server ? boost::beast::role_type::server
                                                                     : boost::beast::role_type::client);
    timeout.handshake_timeout = std::chrono::seconds(30);
    stream_.set_option(timeout);
    stream_.write_buffer_bytes(65536);
    stream_.auto_fragment(false);
}

Task<void> WebSocketChannel::accept() {
    configure(/*server=*/true);
    try {
        co_await stream_.async_accept(boost::asio::use_awaitable);
    } catch (const boost::system::system_error& se) {
        FWIRE_DEBUG << "WebSocketChannel::accept system_error: " << se.what();
        state_ = ChannelState::kAborted;
        throw;
    }
    state_ = ChannelState::kOpen;
}

Task<void> WebSocketChannel::accept(const boost::beast::http::request<boost::beast::http::string_body>& req) {
    configure(/*server=*/true);
    try {
        co_await stream_.async_accept(req, boost::asio::use_awaitable);
    } catch (const boost::system::system_error& se) {
        FWIRE_DEBUG << "WebSocketChannel::accept system_error: " << se.what();
        state_ = ChannelState::kAborted;
        throw;
    }
    state_ = ChannelState::kOpen;
}

Task<void> WebSocketChannel::handshake(std::string host, std::string target) {
    configure(/*server=*/false);
    try {
        co_await stream_.async_handshake(host, target, boost::asio::use_awaitable);
    } catch (const boost::system::system_error& se) {
        FWIRE_DEBUG << "WebSocketChannel::handshake system_error: " << se.what();
        state_ = ChannelState::kAborted;
        throw;
    }
    state_ = ChannelState::kOpen;
}

Task<ReceiveResult> WebSocketChannel::receive(std::span<uint8_t> buffer) {
    try {
        const auto bytes_read = co_await stream_.async_read_some(boost::asio::buffer(buffer.data(), buffer.size()),
                                                                 boost::asio::use_awaitable);
        const auto kind = stream_.got_text() ? FrameKind::kText : FrameKind::kBinary;
        FWIRE_TRACE << "WebSocketChannel::receive bytes_read: " << bytes_read << " kind: " << kind
                    << " message_done: " << stream_.is_message_done();
        co_return ReceiveResult{kind, bytes_read, stream_.is_message_done()};
    } catch (const boost::system::system_error& se) {
        if (se.code() == websocket::error::closed) {
            // Beast has already answered the close frame sent by the peer
            FWIRE_DEBUG << "WebSocketChannel::receive close received: " << stream_.reason().reason;
            state_ = ChannelState::kClosed;
            co_return ReceiveResult{FrameKind::kClose, 0, true};
        }
        FWIRE_TRACE << "WebSocketChannel::receive system_error: " << se.what();
        state_ = ChannelState::kAborted;
        throw;
    }
}

Task<void> WebSocketChannel::send(ByteView data, FrameKind kind, bool end_of_message) {
    ensure_pre_condition(kind != FrameKind::kClose, [] { return "close frames are sent by WebSocketChannel::close"; });

    try {
        stream_.binary(kind == FrameKind::kBinary);
        const auto written = co_await stream_.async_write_some(end_of_message,
                                                               boost::asio::buffer(data.data(), data.size()),
                                                               boost::asio::use_awaitable);
        FWIRE_TRACE << "WebSocketChannel::send written: " << written << " kind: " << kind << " last: " << end_of_message;
    } catch (const boost::system::system_error& se) {
        FWIRE_TRACE << "WebSocketChannel::send system_error: " << se.what();
        state_ = ChannelState::kAborted;
        throw;
    }
}

Task<void> WebSocketChannel::close(CloseStatus status, std::string reason) {
    state_ = ChannelState::kCloseSent;
    try {
        const websocket::close_reason close_reason{static_cast<websocket::close_code>(status), reason};
        co_await stream_.async_close(close_reason, boost::asio::use_awaitable);
    } catch (const boost::system::system_error& se) {
        FWIRE_DEBUG << "WebSocketChannel::close system_error: " << se.what();
        state_ = ChannelState::kAborted;
        throw;
    }
    state_ = ChannelState::kClosed;
    FWIRE_DEBUG << "WebSocketChannel::close completed status: " << static_cast<uint16_t>(status) << " reason: " << reason;
}

}  // namespace framewire::transport
