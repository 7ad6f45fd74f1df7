// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "socket_channel.hpp"

namespace framewire::transport {

std::string_view to_string(FrameKind kind) {
    switch (kind) {
        case FrameKind::kText:
            return "text";
        case FrameKind::kBinary:
            return "binary";
        case FrameKind::kClose:
            return "close";
    }
    return "unknown";
}

std::string_view to_string(ChannelState state) {
    switch (state) {
        case ChannelState::kNone:
            return "none";
        case ChannelState::kConnecting:
            return "connecting";
        case ChannelState::kOpen:
            return "open";
        case ChannelState::kCloseSent:
            return "close-sent";
        case ChannelState::kCloseReceived:
            return "close-received";
        case ChannelState::kClosed:
            return "closed";
        case ChannelState::kAborted:
            return "aborted";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& out, FrameKind kind) {
    return out << to_string(kind);
}

std::ostream& operator<<(std::ostream& out, ChannelState state) {
    return out << to_string(state);
}

}  // namespace framewire::transport
