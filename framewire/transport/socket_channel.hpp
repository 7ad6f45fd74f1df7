// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <framewire/common/bytes.hpp>
#include <framewire/infra/concurrency/task.hpp>

namespace framewire::transport {

//! Kind of a transport frame
enum class FrameKind {
    kText,
    kBinary,
    kClose,
};

//! Connection state of a socket channel, following the WebSocket lifecycle
enum class ChannelState {
    kNone,
    kConnecting,
    kOpen,
    kCloseSent,
    kCloseReceived,
    kClosed,
    kAborted,
};

//! Status codes carried by a close frame (RFC 6455 section 7.4.1)
enum class CloseStatus : uint16_t {
    kNormalClosure = 1000,
    kEndpointUnavailable = 1001,
    kProtocolError = 1002,
    kInvalidMessageType = 1003,
    kInvalidPayloadData = 1007,
    kPolicyViolation = 1008,
    kMessageTooBig = 1009,
    kInternalServerError = 1011,
};

//! Outcome of one receive operation
struct ReceiveResult {
    FrameKind kind{FrameKind::kBinary};
    //! Number of bytes written into the receive buffer
    size_t count{0};
    //! Whether these bytes complete the current message
    bool end_of_message{false};
};

std::string_view to_string(FrameKind kind);
std::string_view to_string(ChannelState state);
std::ostream& operator<<(std::ostream& out, FrameKind kind);
std::ostream& operator<<(std::ostream& out, ChannelState state);

//! Full-duplex frame-oriented connection.
//! At most one receive and one send may be outstanding at any time.
//! Failures are reported by throwing boost::system::system_error.
class SocketChannel {
  public:
    virtual ~SocketChannel() = default;

    //! Receive the next (possibly partial) frame into \p buffer
    //! \remarks A close frame from the peer is reported with kind kClose and zero count
    virtual Task<ReceiveResult> receive(std::span<uint8_t> buffer) = 0;

    //! Send \p data as one frame of the given \p kind, marking the end of the message if \p end_of_message is set
    virtual Task<void> send(ByteView data, FrameKind kind, bool end_of_message) = 0;

    //! Perform the closing handshake
    virtual Task<void> close(CloseStatus status, std::string reason) = 0;

    virtual ChannelState state() const = 0;
};

}  // namespace framewire::transport
