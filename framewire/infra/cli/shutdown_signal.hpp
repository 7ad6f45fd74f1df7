// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <csignal>

#include <framewire/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/signal_set.hpp>

namespace framewire::cmd::common {

//! Awaitable notification of SIGINT or SIGTERM
class ShutdownSignal {
  public:
    explicit ShutdownSignal(const boost::asio::any_io_executor& executor)
        : signals_(executor, SIGINT, SIGTERM) {}

    using SignalNumber = int;

    Task<SignalNumber> wait_me();
    static Task<SignalNumber> wait();

  private:
    boost::asio::signal_set signals_;
};

}  // namespace framewire::cmd::common
