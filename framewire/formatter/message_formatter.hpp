// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <framewire/common/byte_sequence.hpp>

#include "message.hpp"

namespace framewire {

//! Encodes messages into bytes and decodes them back
class MessageFormatter {
  public:
    virtual ~MessageFormatter() = default;

    //! Append the encoded form of \p message to \p buffer
    virtual void serialize(ByteSequence& buffer, const Message& message) = 0;

    //! Decode one message from the whole content of \p buffer
    //! \throws on malformed input, the exception type being formatter-specific
    virtual Message deserialize(const ByteSequence& buffer) = 0;
};

//! Capability of formatters whose output is always valid text
class TextFormatter {
  public:
    virtual ~TextFormatter() = default;

    virtual std::string_view encoding() const = 0;
};

//! Capability of formatters needing the encoded bytes to trace outgoing messages
class FormatterTracingCallbacks {
  public:
    virtual ~FormatterTracingCallbacks() = default;

    virtual void on_serialization_complete(const Message& message, const ByteSequence& encoded) = 0;
};

}  // namespace framewire
