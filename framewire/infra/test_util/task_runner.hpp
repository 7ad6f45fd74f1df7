// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <utility>

#include <framewire/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace framewire::test_util {

/**
 * A helper to run Task-s on io_context in tests
 */
class TaskRunner {
  public:
    TaskRunner() = default;
    virtual ~TaskRunner() = default;

    //! Run task to completion
    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future = spawn_future(std::move(task));
        poll_context_until_future_is_ready(future);
        return future.get();
    }

    //! Run task to completion, the task being cancellable by emitting the given signal
    template <typename TResult>
    TResult run(Task<TResult> task, boost::asio::cancellation_signal& signal) {
        auto future = boost::asio::co_spawn(
            ioc_,
            std::move(task),
            boost::asio::bind_cancellation_slot(signal.slot(), boost::asio::use_future));
        poll_context_until_future_is_ready(future);
        return future.get();
    }

    //! co_spawn with use_future
    template <typename TResult>
    std::future<TResult> spawn_future(Task<TResult> task) {
        return boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
    }

    //! Poll until the spawned future completes
    template <typename TResult>
    void poll_context_until_future_is_ready(std::future<TResult>& future) {
        using namespace std::chrono_literals;
        ioc_.restart();
        while (future.wait_for(0s) != std::future_status::ready) {
            ioc_.poll_one();
        }
    }

    boost::asio::io_context& ioc() { return ioc_; }
    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  private:
    boost::asio::io_context ioc_;
};

}  // namespace framewire::test_util
