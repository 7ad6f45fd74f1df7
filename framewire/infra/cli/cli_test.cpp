// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <framewire/formatter/json_formatter.hpp>
#include <framewire/formatter/msgpack_formatter.hpp>

#include "common.hpp"
#include "ip_endpoint_option.hpp"

namespace framewire::cmd::common {

TEST_CASE("IPEndpointValidator", "[framewire][infra][cli]") {
    IPEndpointValidator validator;

    SECTION("valid endpoints") {
        for (const std::string value : {"127.0.0.1:8080", "0.0.0.0:1", "::1:65535"}) {
            CHECK(validator(value).empty());
        }
    }

    SECTION("invalid endpoints") {
        for (const std::string value : {"", "localhost:8080", "127.0.0.1", "127.0.0.1:0", "127.0.0.1:65536", "1.2.3:80"}) {
            CHECK_FALSE(validator(value).empty());
        }
    }
}

TEST_CASE("make_endpoint", "[framewire][infra][cli]") {
    const auto endpoint = make_endpoint("127.0.0.1:51515");
    CHECK(endpoint.address().to_string() == "127.0.0.1");
    CHECK(endpoint.port() == 51515);

    CHECK_THROWS_AS(make_endpoint("nowhere"), std::invalid_argument);
}

TEST_CASE("add_handler_options", "[framewire][infra][cli]") {
    CLI::App cli;
    rpc::MessageHandlerSettings settings;
    add_handler_options(cli, settings);

    SECTION("defaults") {
        cli.parse(std::vector<std::string>{});
        CHECK_FALSE(settings.compress);
        CHECK(settings.segment_size_hint == 4096);
    }

    SECTION("explicit values") {
        // CLI11 parses the vector in reverse order
        cli.parse(std::vector<std::string>{"512", "--segment-size-hint", "--compress"});
        CHECK(settings.compress);
        CHECK(settings.segment_size_hint == 512);
    }

    SECTION("zero segment size hint is rejected") {
        CHECK_THROWS_AS(cli.parse(std::vector<std::string>{"0", "--segment-size-hint"}), CLI::ValidationError);
    }
}

TEST_CASE("add_logging_options", "[framewire][infra][cli]") {
    CLI::App cli;
    log::Settings settings;
    add_logging_options(cli, settings);

    cli.parse(std::vector<std::string>{"--log.nocolor", "debug", "--log.verbosity"});
    CHECK(settings.log_verbosity == log::Level::kDebug);
    CHECK(settings.log_nocolor);
}

TEST_CASE("make_formatter", "[framewire][infra][cli]") {
    CHECK(dynamic_cast<JsonFormatter*>(make_formatter("json").get()) != nullptr);
    CHECK(dynamic_cast<MessagePackFormatter*>(make_formatter("msgpack").get()) != nullptr);
    CHECK_THROWS_AS(make_formatter("xml"), std::invalid_argument);
}

}  // namespace framewire::cmd::common
