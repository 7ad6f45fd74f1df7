// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace framewire::cmd::common {

struct IPEndpointValidator : public CLI::Validator {
    explicit IPEndpointValidator(bool allow_empty = false);
};

//! \brief Set up parsing of the specified IP:port endpoint
void add_option_ip_endpoint(CLI::App& cli, const std::string& name, std::string& address, const std::string& description);

//! \brief Convert a validated IP:port string into a TCP endpoint
boost::asio::ip::tcp::endpoint make_endpoint(const std::string& address);

}  // namespace framewire::cmd::common
