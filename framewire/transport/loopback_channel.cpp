// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "loopback_channel.hpp"

#include <algorithm>
#include <cstring>

#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <framewire/infra/common/ensure.hpp>
#include <framewire/infra/common/log.hpp>

namespace framewire::transport {

namespace channel_error = boost::asio::experimental::error;

static void throw_not_connected() {
    throw boost::system::system_error{make_error_code(boost::asio::error::not_connected)};
}

std::pair<std::unique_ptr<LoopbackChannel>, std::unique_ptr<LoopbackChannel>> LoopbackChannel::make_pair(
    const boost::asio::any_io_executor& executor, Settings settings) {
    auto first_inbox = std::make_shared<Inbox>(executor, settings.capacity);
    auto second_inbox = std::make_shared<Inbox>(executor, settings.capacity);
    std::unique_ptr<LoopbackChannel> first{new LoopbackChannel{first_inbox, second_inbox, settings}};
    std::unique_ptr<LoopbackChannel> second{new LoopbackChannel{second_inbox, first_inbox, settings}};
    return {std::move(first), std::move(second)};
}

LoopbackChannel::LoopbackChannel(std::shared_ptr<Inbox> inbox, std::shared_ptr<Inbox> peer_inbox, Settings settings)
    : inbox_{std::move(inbox)}, peer_inbox_{std::move(peer_inbox)}, settings_{settings} {}

LoopbackChannel::~LoopbackChannel() {
    inbox_->close();
}

void LoopbackChannel::abort() {
    FWIRE_DEBUG << "LoopbackChannel::abort state: " << state_.load();
    state_ = ChannelState::kAborted;
    inbox_->close();
    peer_inbox_->close();
}

bool LoopbackChannel::transition(ChannelState expected, ChannelState desired) {
    return state_.compare_exchange_strong(expected, desired);
}

Task<LoopbackChannel::Fragment> LoopbackChannel::receive_fragment() {
    try {
        co_return (co_await inbox_->async_receive(boost::asio::use_awaitable));
    } catch (const boost::system::system_error& se) {
        if (se.code() == channel_error::channel_cancelled || se.code() == boost::asio::error::operation_aborted) {
            state_ = ChannelState::kAborted;
            throw boost::system::system_error(make_error_code(boost::system::errc::operation_canceled));
        }
        if (se.code() == channel_error::channel_closed) {
            state_ = ChannelState::kAborted;
            throw boost::system::system_error(make_error_code(boost::asio::error::connection_reset));
        }
        throw;
    }
}

Task<void> LoopbackChannel::send_fragment(Fragment fragment) {
    try {
        co_await peer_inbox_->async_send(boost::system::error_code{}, std::move(fragment), boost::asio::use_awaitable);
        ++fragments_sent_;
    } catch (const boost::system::system_error& se) {
        if (se.code() == channel_error::channel_cancelled || se.code() == boost::asio::error::operation_aborted) {
            state_ = ChannelState::kAborted;
            throw boost::system::system_error(make_error_code(boost::system::errc::operation_canceled));
        }
        if (se.code() == channel_error::channel_closed) {
            state_ = ChannelState::kAborted;
            throw boost::system::system_error(make_error_code(boost::asio::error::connection_reset));
        }
        throw;
    }
}

Task<ReceiveResult> LoopbackChannel::receive(std::span<uint8_t> buffer) {
    const auto state = state_.load();
    if (state != ChannelState::kOpen && state != ChannelState::kCloseSent) {
        throw_not_connected();
    }

    if (!pending_) {
        auto fragment = co_await receive_fragment();
        if (fragment.kind == FrameKind::kClose) {
            close_status_.emplace(fragment.status, byte_view_to_string_view(fragment.payload));
            if (!transition(ChannelState::kOpen, ChannelState::kCloseReceived)) {
                transition(ChannelState::kCloseSent, ChannelState::kClosed);
            }
            FWIRE_DEBUG << "LoopbackChannel::receive close received state: " << state_.load();
            co_return ReceiveResult{FrameKind::kClose, 0, true};
        }
        pending_ = std::move(fragment);
        pending_offset_ = 0;
    }

    const auto remaining = pending_->payload.size() - pending_offset_;
    const auto count = std::min(buffer.size(), remaining);
    if (count > 0) {
        std::memcpy(buffer.data(), pending_->payload.data() + pending_offset_, count);
    }
    pending_offset_ += count;

    ReceiveResult result{pending_->kind, count, false};
    if (pending_offset_ == pending_->payload.size()) {
        result.end_of_message = pending_->end_of_message;
        pending_.reset();
    }
    FWIRE_TRACE << "LoopbackChannel::receive count: " << result.count << " kind: " << result.kind
                << " end_of_message: " << result.end_of_message;
    co_return result;
}

Task<void> LoopbackChannel::send(ByteView data, FrameKind kind, bool end_of_message) {
    ensure_pre_condition(kind != FrameKind::kClose, [] { return "close frames are sent by LoopbackChannel::close"; });
    const auto state = state_.load();
    if (state != ChannelState::kOpen && state != ChannelState::kCloseReceived) {
        throw_not_connected();
    }

    const size_t fragment_size = settings_.max_frame_size > 0 ? settings_.max_frame_size : data.size();
    size_t offset = 0;
    do {
        const auto length = std::min(fragment_size, data.size() - offset);
        const bool last = offset + length == data.size();
        co_await send_fragment(Fragment{kind, Bytes{data.substr(offset, length)}, last && end_of_message});
        offset += length;
    } while (offset < data.size());
}

Task<void> LoopbackChannel::close(CloseStatus status, std::string reason) {
    ChannelState next_state{ChannelState::kCloseSent};
    if (!transition(ChannelState::kOpen, ChannelState::kCloseSent)) {
        if (!transition(ChannelState::kCloseReceived, ChannelState::kClosed)) {
            const auto state = state_.load();
            if (state == ChannelState::kCloseSent || state == ChannelState::kClosed) {
                co_return;  // close frame already sent
            }
            throw_not_connected();
        }
        next_state = ChannelState::kClosed;
    }

    FWIRE_DEBUG << "LoopbackChannel::close status: " << static_cast<uint16_t>(status) << " reason: " << reason
                << " state: " << next_state;
    Fragment fragment{FrameKind::kClose, Bytes{string_view_to_byte_view(reason)}, true, status};
    co_await send_fragment(std::move(fragment));
}

}  // namespace framewire::transport
