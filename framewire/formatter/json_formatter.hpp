// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <framewire/formatter/message_formatter.hpp>

namespace framewire {

//! Formatter producing UTF-8 JSON text
class JsonFormatter : public MessageFormatter, public TextFormatter {
  public:
    void serialize(ByteSequence& buffer, const Message& message) override;
    Message deserialize(const ByteSequence& buffer) override;

    std::string_view encoding() const override { return "utf-8"; }
};

}  // namespace framewire
