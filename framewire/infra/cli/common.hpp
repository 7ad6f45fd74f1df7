// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include <framewire/formatter/message_formatter.hpp>
#include <framewire/infra/common/log.hpp>
#include <framewire/rpc/socket_message_handler.hpp>

namespace framewire::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options to populate message handler settings after cli.parse()
void add_handler_options(CLI::App& cli, rpc::MessageHandlerSettings& handler_settings);

//! \brief Set up option for the message formatter name (json or msgpack)
void add_option_formatter(CLI::App& cli, std::string& formatter_name);

//! \brief Create the formatter having the specified name
std::unique_ptr<MessageFormatter> make_formatter(const std::string& formatter_name);

}  // namespace framewire::cmd::common
