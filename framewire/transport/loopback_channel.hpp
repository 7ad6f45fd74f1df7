// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <framewire/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include "socket_channel.hpp"

namespace framewire::transport {

//! In-memory connected socket channel.
//! Each send delivers one or more wire fragments into the inbox of the peer end.
class LoopbackChannel : public SocketChannel {
  public:
    struct Settings {
        //! Maximum payload of one wire fragment, zero means no fragmentation
        size_t max_frame_size{0};
        //! Number of fragments buffered in each inbox before send suspends
        size_t capacity{64};
    };

    //! Create two connected ends in the open state
    static std::pair<std::unique_ptr<LoopbackChannel>, std::unique_ptr<LoopbackChannel>> make_pair(
        const boost::asio::any_io_executor& executor, Settings settings);
    static std::pair<std::unique_ptr<LoopbackChannel>, std::unique_ptr<LoopbackChannel>> make_pair(
        const boost::asio::any_io_executor& executor) {
        return make_pair(executor, Settings{});
    }

    ~LoopbackChannel() override;

    LoopbackChannel(const LoopbackChannel&) = delete;
    LoopbackChannel& operator=(const LoopbackChannel&) = delete;

    Task<ReceiveResult> receive(std::span<uint8_t> buffer) override;
    Task<void> send(ByteView data, FrameKind kind, bool end_of_message) override;
    Task<void> close(CloseStatus status, std::string reason) override;

    ChannelState state() const override { return state_; }

    //! Drop the connection without closing handshake: pending and future operations on both ends fail
    void abort();

    //! Number of wire fragments sent so far, close frame included
    size_t fragments_sent() const { return fragments_sent_; }

    //! Status and reason of the close frame received from the peer, if any
    std::optional<std::pair<CloseStatus, std::string>> close_status() const { return close_status_; }

  private:
    struct Fragment {
        FrameKind kind{FrameKind::kBinary};
        Bytes payload;
        bool end_of_message{false};
        CloseStatus status{CloseStatus::kNormalClosure};
    };

    using Inbox = boost::asio::experimental::concurrent_channel<void(boost::system::error_code, Fragment)>;

    LoopbackChannel(std::shared_ptr<Inbox> inbox, std::shared_ptr<Inbox> peer_inbox, Settings settings);

    Task<Fragment> receive_fragment();
    Task<void> send_fragment(Fragment fragment);

    //! Move to \p desired if the current state is \p expected
    bool transition(ChannelState expected, ChannelState desired);

    std::shared_ptr<Inbox> inbox_;
    std::shared_ptr<Inbox> peer_inbox_;
    Settings settings_;
    std::atomic<ChannelState> state_{ChannelState::kOpen};

    //! Fragment being handed out to a receive buffer smaller than its payload
    std::optional<Fragment> pending_;
    size_t pending_offset_{0};

    std::atomic<size_t> fragments_sent_{0};
    std::optional<std::pair<CloseStatus, std::string>> close_status_;
};

}  // namespace framewire::transport
