// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <string>

#include <framewire/infra/concurrency/task.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "socket_channel.hpp"

namespace framewire::transport {

using WebSocketStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

//! SocketChannel over a Beast WebSocket stream.
//! Automatic fragmentation is disabled, so each send produces exactly one WebSocket frame.
class WebSocketChannel : public SocketChannel {
  public:
    explicit WebSocketChannel(WebSocketStream&& stream);
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    //! Server side: read the upgrade request from the stream and accept the WebSocket handshake
    Task<void> accept();

    //! Server side: accept the WebSocket handshake for an already read upgrade request
    Task<void> accept(const boost::beast::http::request<boost::beast::http::string_body>& req);

    //! Client side: perform the WebSocket handshake against \p host requesting \p target
    Task<void> handshake(std::string host, std::string target);

    Task<ReceiveResult> receive(std::span<uint8_t> buffer) override;
    Task<void> send(ByteView data, FrameKind kind, bool end_of_message) override;
    Task<void> close(CloseStatus status, std::string reason) override;

    ChannelState state() const override { return state_; }

    WebSocketStream& stream() { return stream_; }

  private:
    void configure(bool server);

    //! The WebSocket TCP stream
    WebSocketStream stream_;

    std::atomic<ChannelState> state_{ChannelState::kConnecting};
};

}  // namespace framewire::transport
