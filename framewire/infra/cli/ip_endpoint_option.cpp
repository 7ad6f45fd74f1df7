// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "ip_endpoint_option.hpp"

#include <regex>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

namespace framewire::cmd::common {

static const std::regex kEndpointPattern{R"(([\da-fA-F\.\:]*)\:([\d]*))"};

IPEndpointValidator::IPEndpointValidator(bool allow_empty) {
    func_ = [allow_empty](const std::string& value) -> std::string {
        if (value.empty() && allow_empty) {
            return {};
        }

        std::smatch matches;
        if (!std::regex_match(value, matches, kEndpointPattern)) {
            return "Value " + value + " is not a valid endpoint";
        }

        boost::system::error_code err;
        boost::asio::ip::make_address(matches[1].str(), err);
        if (err) {
            return "Value " + std::string(matches[1]) + " is not a valid ip address";
        }

        const std::string port_str{matches[2]};
        if (port_str.empty() || port_str.size() > 5 || std::stoi(port_str) < 1 || std::stoi(port_str) > 65535) {
            return "Value " + port_str + " is not a valid port";
        }

        return {};
    };
}

void add_option_ip_endpoint(CLI::App& cli, const std::string& name, std::string& address, const std::string& description) {
    cli.add_option(name, address, description)
        ->capture_default_str()
        ->check(IPEndpointValidator(/*allow_empty=*/false));
}

boost::asio::ip::tcp::endpoint make_endpoint(const std::string& address) {
    std::smatch matches;
    if (!std::regex_match(address, matches, kEndpointPattern)) {
        throw std::invalid_argument{"invalid endpoint: " + address};
    }
    const auto ip_address = boost::asio::ip::make_address(matches[1].str());
    const auto port = static_cast<unsigned short>(std::stoi(matches[2].str()));
    return {ip_address, port};
}

}  // namespace framewire::cmd::common
