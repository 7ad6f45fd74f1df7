// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include <string>

#include <catch2/catch_test_macros.hpp>

#include <framewire/formatter/json_formatter.hpp>
#include <framewire/formatter/msgpack_formatter.hpp>
#include <framewire/infra/test_util/log.hpp>

namespace framewire {

static const Message kRequest = R"({
    "jsonrpc": "2.0",
    "id": 7,
    "method": "eth_getBalance",
    "params": ["0x407d73d8a49eeb85d32cf465507dd71d507100c1", "latest"]
})"_json;

TEST_CASE("JsonFormatter", "[framewire][formatter][json]") {
    JsonFormatter formatter;
    ByteSequence buffer;

    SECTION("serialize produces compact JSON text") {
        formatter.serialize(buffer, Message{{"jsonrpc", "2.0"}, {"method", "ping"}});
        CHECK(buffer.to_string() == R"({"jsonrpc":"2.0","method":"ping"})");
    }

    SECTION("deserialize single segment") {
        buffer.write(string_view_to_byte_view(R"({"jsonrpc":"2.0","result":true,"id":1})"));
        const auto message = formatter.deserialize(buffer);
        CHECK(message["result"] == true);
        CHECK(message["id"] == 1);
    }

    SECTION("deserialize multiple segments") {
        ByteSequence segmented{BufferPool::shared(), 8};
        formatter.serialize(segmented, kRequest);
        REQUIRE(segmented.segments().size() > 1);
        CHECK(formatter.deserialize(segmented) == kRequest);
    }

    SECTION("non-ASCII content is kept as UTF-8") {
        formatter.serialize(buffer, Message{{"text", "h\xC3\xA9llo"}});
        CHECK(buffer.to_string() == "{\"text\":\"h\xC3\xA9llo\"}");
    }

    SECTION("invalid UTF-8 in a string value throws") {
        const Message message{{"params", {std::string{"a\xff" "b"}}}};
        CHECK_THROWS_AS(formatter.serialize(buffer, message), nlohmann::json::type_error);
        CHECK(buffer.empty());
    }

    SECTION("malformed content throws") {
        buffer.write(string_view_to_byte_view(R"({"jsonrpc":)"));
        CHECK_THROWS_AS(formatter.deserialize(buffer), nlohmann::json::parse_error);
    }

    SECTION("declares textual output") {
        MessageFormatter& base = formatter;
        const auto* text = dynamic_cast<TextFormatter*>(&base);
        REQUIRE(text != nullptr);
        CHECK(text->encoding() == "utf-8");
        CHECK(dynamic_cast<FormatterTracingCallbacks*>(&base) == nullptr);
    }
}

TEST_CASE("MessagePackFormatter", "[framewire][formatter][msgpack]") {
    MessagePackFormatter formatter;
    ByteSequence buffer;

    SECTION("serialize produces MessagePack") {
        formatter.serialize(buffer, Message{{"id", 1}});
        // fixmap(1), fixstr(2) "id", positive fixint 1
        CHECK(buffer.to_bytes() == Bytes{0x81, 0xa2, 'i', 'd', 0x01});
    }

    SECTION("deserialize multiple segments") {
        ByteSequence segmented{BufferPool::shared(), 8};
        formatter.serialize(segmented, kRequest);
        REQUIRE(segmented.segments().size() > 1);
        CHECK(formatter.deserialize(segmented) == kRequest);
    }

    SECTION("malformed content throws") {
        buffer.write(Bytes{0x81, 0xa2, 'i'});
        CHECK_THROWS_AS(formatter.deserialize(buffer), nlohmann::json::parse_error);
    }

    SECTION("declares tracing capability only") {
        MessageFormatter& base = formatter;
        CHECK(dynamic_cast<TextFormatter*>(&base) == nullptr);
        CHECK(dynamic_cast<FormatterTracingCallbacks*>(&base) != nullptr);
    }

    SECTION("tracing callback logs the wire content at trace level") {
        test_util::LogCapture log_capture{log::Level::kTrace};

        formatter.serialize(buffer, kRequest);
        formatter.on_serialization_complete(kRequest, buffer);
        CHECK(log_capture.cerr().find("eth_getBalance") != std::string::npos);
    }

    SECTION("tracing callback is silent below trace level") {
        test_util::LogCapture log_capture{log::Level::kInfo};

        formatter.serialize(buffer, kRequest);
        formatter.on_serialization_complete(kRequest, buffer);
        CHECK(log_capture.cerr().empty());
    }
}

}  // namespace framewire
