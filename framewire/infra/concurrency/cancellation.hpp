// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <framewire/infra/concurrency/task.hpp>

#include <boost/asio/cancellation_type.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

namespace framewire::concurrency {

//! Throw operation_canceled if cancellation has been requested for the calling coroutine
//! \remarks This is an explicit cancellation point: no asynchronous operation is needed to observe the request
inline Task<void> throw_if_cancelled() {
    const auto state = co_await boost::asio::this_coro::cancellation_state;
    if (state.cancelled() != boost::asio::cancellation_type::none) {
        throw boost::system::system_error(make_error_code(boost::system::errc::operation_canceled));
    }
}

//! Check if the exception is the one raised on cancellation
inline bool is_cancellation(const boost::system::system_error& se) {
    return se.code() == boost::system::errc::operation_canceled;
}

}  // namespace framewire::concurrency
