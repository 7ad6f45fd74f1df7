// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <framewire/infra/cli/common.hpp>
#include <framewire/infra/cli/ip_endpoint_option.hpp>
#include <framewire/infra/cli/shutdown_signal.hpp>
#include <framewire/infra/common/log.hpp>
#include <framewire/infra/concurrency/task.hpp>
#include <framewire/rpc/socket_message_handler.hpp>
#include <framewire/transport/websocket_channel.hpp>

using namespace framewire;
using namespace framewire::cmd::common;
using boost::asio::ip::tcp;

struct EchoSettings {
    log::Settings log_settings;
    rpc::MessageHandlerSettings handler_settings;
    std::string address{"127.0.0.1:8080"};
    std::string formatter_name{"json"};
    std::string message;
};

static Task<void> serve_connection(tcp::socket socket, EchoSettings settings) {
    const auto remote_endpoint = socket.remote_endpoint();
    try {
        auto channel = std::make_unique<transport::WebSocketChannel>(transport::WebSocketStream{std::move(socket)});
        co_await channel->accept();
        FWIRE_INFO << "Echo connection opened from " << remote_endpoint;

        rpc::SocketMessageHandler handler{std::move(channel), make_formatter(settings.formatter_name), settings.handler_settings};
        size_t echoed{0};
        while (auto message = co_await handler.read()) {
            FWIRE_DEBUG << "Echo message from " << remote_endpoint << ": " << message->dump();
            co_await handler.write(*message);
            ++echoed;
        }
        FWIRE_INFO << "Echo connection closed from " << remote_endpoint << " messages: " << echoed;
    } catch (const boost::system::system_error& se) {
        FWIRE_WARN << "Echo connection from " << remote_endpoint << " failed: " << se.what();
    } catch (const std::exception& e) {
        FWIRE_ERROR << "Echo connection from " << remote_endpoint << " exception: " << e.what();
    }
}

static Task<void> accept_loop(tcp::acceptor& acceptor, const EchoSettings& settings) {
    while (acceptor.is_open()) {
        auto socket = co_await acceptor.async_accept(boost::asio::use_awaitable);
        boost::asio::co_spawn(acceptor.get_executor(), serve_connection(std::move(socket), settings), [](const std::exception_ptr& ex) {
            if (ex) std::rethrow_exception(ex);
        });
    }
}

static Task<void> run_server(const EchoSettings& settings) {
    using namespace boost::asio::experimental::awaitable_operators;

    auto executor = co_await boost::asio::this_coro::executor;
    tcp::acceptor acceptor{executor, make_endpoint(settings.address)};
    FWIRE_INFO << "Echo server listening on " << acceptor.local_endpoint()
               << " compress: " << settings.handler_settings.compress
               << " formatter: " << settings.formatter_name;

    co_await (accept_loop(acceptor, settings) || ShutdownSignal::wait());
    FWIRE_INFO << "Echo server stopped";
}

static Task<void> run_client(const EchoSettings& settings) {
    auto executor = co_await boost::asio::this_coro::executor;
    const auto endpoint = make_endpoint(settings.address);
    const auto message = Message::parse(settings.message);

    boost::beast::tcp_stream stream{executor};
    co_await stream.async_connect(endpoint, boost::asio::use_awaitable);

    auto channel = std::make_unique<transport::WebSocketChannel>(transport::WebSocketStream{std::move(stream)});
    co_await channel->handshake(settings.address, "/");

    rpc::SocketMessageHandler handler{std::move(channel), make_formatter(settings.formatter_name), settings.handler_settings};
    co_await handler.write(message);
    const auto reply = co_await handler.read();
    if (!reply) {
        FWIRE_WARN << "Connection closed by " << settings.address << " before any reply";
        co_return;
    }
    std::cout << reply->dump() << "\n";

    if (handler.channel().state() == transport::ChannelState::kOpen) {
        co_await handler.channel().close(transport::CloseStatus::kNormalClosure, "Client done.");
    }
}

static void parse_command_line(int argc, char* argv[], CLI::App& app, EchoSettings& settings) {
    add_logging_options(app, settings.log_settings);

    auto& server = *app.add_subcommand("server", "Echo back every message received on each WebSocket connection");
    auto& client = *app.add_subcommand("client", "Send one message and print the reply");
    app.require_subcommand(1);

    for (auto* command : {&server, &client}) {
        add_option_ip_endpoint(*command, "--address", settings.address, "WebSocket endpoint as IP:port");
        add_handler_options(*command, settings.handler_settings);
        add_option_formatter(*command, settings.formatter_name);
    }
    client.add_option("--message", settings.message, "Message to send as JSON text")->required();

    app.parse(argc, argv);
}

int main(int argc, char* argv[]) {
    CLI::App cli{"Framewire echo over WebSocket"};

    try {
        EchoSettings settings;
        parse_command_line(argc, argv, cli, settings);

        log::init(settings.log_settings);
        log::set_thread_name("echo");

        const bool is_server = cli.got_subcommand("server");
        boost::asio::io_context ioc;
        std::exception_ptr run_exception;
        boost::asio::co_spawn(ioc, is_server ? run_server(settings) : run_client(settings), [&](std::exception_ptr ex) {
            run_exception = std::move(ex);
            ioc.stop();
        });
        ioc.run();
        if (run_exception) {
            std::rethrow_exception(run_exception);
        }
        return 0;
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    } catch (const std::exception& e) {
        FWIRE_CRIT << "Echo exiting due to exception: " << e.what();
        return -2;
    }
}
