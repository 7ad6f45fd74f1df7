// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "msgpack_formatter.hpp"

#include <vector>

#include <framewire/infra/common/log.hpp>

namespace framewire {

void MessagePackFormatter::serialize(ByteSequence& buffer, const Message& message) {
    std::vector<uint8_t> content;
    nlohmann::json::to_msgpack(message, content);
    buffer.write(ByteView{content.data(), content.size()});
}

Message MessagePackFormatter::deserialize(const ByteSequence& buffer) {
    const auto segments = buffer.segments();
    if (segments.size() == 1) {
        return nlohmann::json::from_msgpack(segments.front().begin(), segments.front().end());
    }
    const auto content = buffer.to_bytes();
    return nlohmann::json::from_msgpack(content.begin(), content.end());
}

void MessagePackFormatter::on_serialization_complete(const Message& /*message*/, const ByteSequence& encoded) {
    if (!log::test_verbosity(log::Level::kTrace)) return;

    // Trace the decoded wire content, not the source message
    FWIRE_TRACE << "MessagePackFormatter::on_serialization_complete " << encoded.size() << " bytes: " << deserialize(encoded).dump();
}

}  // namespace framewire
