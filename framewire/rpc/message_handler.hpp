// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <framewire/formatter/message.hpp>
#include <framewire/infra/concurrency/task.hpp>

namespace framewire::rpc {

//! Reads and writes whole messages over some transport
class MessageHandler {
  public:
    MessageHandler() = default;
    virtual ~MessageHandler() = default;

    MessageHandler(const MessageHandler&) = delete;
    MessageHandler& operator=(const MessageHandler&) = delete;

    virtual bool can_read() const = 0;
    virtual bool can_write() const = 0;

    //! Read the next message, std::nullopt meaning that no more messages will come
    virtual Task<std::optional<Message>> read() = 0;

    virtual Task<void> write(const Message& message) = 0;

    //! Push any buffered outgoing content to the transport
    virtual Task<void> flush() = 0;
};

}  // namespace framewire::rpc
