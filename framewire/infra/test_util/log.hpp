// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <framewire/infra/common/log.hpp>

namespace framewire::test_util {

//! Set the log verbosity and capture everything printed to std::cout and std::cerr while in scope.
//! The previous verbosity and stream buffers are restored on destruction, so tests can run in any order.
class LogCapture {
  public:
    explicit LogCapture(log::Level level = log::get_verbosity())
        : previous_level_{log::get_verbosity()},
          previous_cout_{std::cout.rdbuf(cout_.rdbuf())},
          previous_cerr_{std::cerr.rdbuf(cerr_.rdbuf())} {
        log::set_verbosity(level);
    }
    ~LogCapture() {
        std::cout.rdbuf(previous_cout_);
        std::cerr.rdbuf(previous_cerr_);
        log::set_verbosity(previous_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string cout() const { return cout_.str(); }
    std::string cerr() const { return cerr_.str(); }

  private:
    log::Level previous_level_;
    std::ostringstream cout_;
    std::ostringstream cerr_;
    std::streambuf* previous_cout_;
    std::streambuf* previous_cerr_;
};

}  // namespace framewire::test_util
