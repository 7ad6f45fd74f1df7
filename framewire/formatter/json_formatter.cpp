// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_formatter.hpp"

#include <string>

namespace framewire {

void JsonFormatter::serialize(ByteSequence& buffer, const Message& message) {
    const auto content = message.dump();
    buffer.write(string_view_to_byte_view(content));
}

Message JsonFormatter::deserialize(const ByteSequence& buffer) {
    const auto segments = buffer.segments();
    if (segments.size() == 1) {
        return nlohmann::json::parse(segments.front().begin(), segments.front().end());
    }
    const auto content = buffer.to_string();
    return nlohmann::json::parse(content);
}

}  // namespace framewire
