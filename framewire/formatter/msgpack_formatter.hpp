// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <framewire/formatter/message_formatter.hpp>

namespace framewire {

//! Formatter producing MessagePack binary content
//! \remarks Tracing needs the encoded bytes, so the formatter implements FormatterTracingCallbacks
class MessagePackFormatter : public MessageFormatter, public FormatterTracingCallbacks {
  public:
    void serialize(ByteSequence& buffer, const Message& message) override;
    Message deserialize(const ByteSequence& buffer) override;

    void on_serialization_complete(const Message& message, const ByteSequence& encoded) override;
};

}  // namespace framewire
