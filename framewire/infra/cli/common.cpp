// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <stdexcept>

#include <framewire/formatter/json_formatter.hpp>
#include <framewire/formatter/msgpack_formatter.hpp>

namespace framewire::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_handler_options(CLI::App& cli, rpc::MessageHandlerSettings& handler_settings) {
    auto& handler_opts = *cli.add_option_group("Handler", "Message handler options");
    handler_opts.add_flag("--compress", handler_settings.compress, "Compress each message with gzip");
    handler_opts.add_option("--segment-size-hint", handler_settings.segment_size_hint,
                            "Size of each receive buffer and outgoing frame in bytes")
        ->check(CLI::Range(size_t{1}, size_t{1024 * 1024}))
        ->capture_default_str();
}

void add_option_formatter(CLI::App& cli, std::string& formatter_name) {
    cli.add_option("--formatter", formatter_name, "Message formatter")
        ->check(CLI::IsMember({"json", "msgpack"}, CLI::ignore_case))
        ->capture_default_str();
}

std::unique_ptr<MessageFormatter> make_formatter(const std::string& formatter_name) {
    if (formatter_name == "json") {
        return std::make_unique<JsonFormatter>();
    }
    if (formatter_name == "msgpack") {
        return std::make_unique<MessagePackFormatter>();
    }
    throw std::invalid_argument{"unknown formatter: " + formatter_name};
}

}  // namespace framewire::cmd::common
