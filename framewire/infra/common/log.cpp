// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

#include <unistd.h>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace framewire::log {

//! Width of the thread column, names are padded or truncated to it
static constexpr size_t kThreadNameWidth = 11;

//! Width of the message column when key-value pairs follow
static constexpr size_t kMessageWidth = 40;

namespace {

    constexpr std::string_view kColorReset{"\x1b[0m"};
    constexpr std::string_view kColorCoal{"\x1b[90m"};
    constexpr std::string_view kColorWhite{"\x1b[97m"};
    constexpr std::string_view kColorRed{"\x1b[91m"};
    constexpr std::string_view kColorGreen{"\x1b[32m"};
    constexpr std::string_view kColorYellow{"\x1b[1;33m"};
    constexpr std::string_view kBackgroundRed{"\x1b[101m"};
    constexpr std::string_view kBackgroundPurple{"\x1b[105m"};

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

    //! Indexed by Level
    constexpr std::array<LevelStyle, 7> kLevelStyles{{
        {"     ", kColorReset},
        {" CRIT", kBackgroundRed},
        {"ERROR", kColorRed},
        {" WARN", kColorYellow},
        {" INFO", kColorGreen},
        {"DEBUG", kBackgroundPurple},
        {"TRACE", kColorCoal},
    }};

    //! Process-wide logging state
    struct Sink {
        Settings settings;
        std::mutex mutex;
        std::optional<std::ofstream> file;
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

}  // namespace

thread_local std::string thread_name_{};

void init(const Settings& settings) {
    auto& s = sink();
    s.settings = settings;
    s.file.reset();
    if (!settings.log_file.empty()) {
        tee_file(settings.log_file);
    }
    // Escape sequences are kept out of files and out of anything that is not a terminal
    const bool on_terminal = isatty(settings.log_std_out ? STDOUT_FILENO : STDERR_FILENO) != 0;
    s.settings.log_nocolor = settings.log_nocolor || s.file.has_value() || !on_terminal;
}

void tee_file(const std::filesystem::path& path) {
    auto& s = sink();
    std::scoped_lock lock{s.mutex};
    s.file.emplace(path, std::ios::out | std::ios::app);
    if (!s.file->is_open()) {
        s.file.reset();
        throw std::runtime_error("Could not open log file " + path.string());
    }
    s.settings.log_nocolor = true;
}

Level get_verbosity() { return sink().settings.log_verbosity; }

void set_verbosity(Level level) { sink().settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= sink().settings.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = name;
    thread_name_.resize(kThreadNameWidth, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        thread_name_ = id.str();
    }
    return thread_name_;
}

BufferBase::BufferBase(Level level)
    : enabled_{test_verbosity(level)}, colorize_{!sink().settings.log_nocolor} {
    if (!enabled_) return;
    const auto& settings = sink().settings;
    const auto& style = kLevelStyles[static_cast<size_t>(level)];

    if (colorize_) {
        ss_ << kColorReset << " " << style.color << style.tag << kColorReset << " " << kColorWhite;
    } else {
        ss_ << " " << style.tag << " ";
    }

    static const absl::TimeZone kTimeZone{settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTimeZone);
    if (settings.log_timezone) {
        ss_ << " " << kTimeZone.name();
    }
    ss_ << "] ";
    if (colorize_) ss_ << kColorReset;

    if (settings.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    if (!enabled_) return;
    ss_ << msg;
    if (!args.empty()) {
        const auto padding = msg.size() < kMessageWidth ? kMessageWidth - msg.size() : 0;
        ss_ << std::string(padding + 1, ' ');
    }
    append_args(args);
}

void BufferBase::append_args(const Args& args) {
    if (!enabled_) return;
    for (size_t i{0}; i < args.size(); ++i) {
        const bool is_key = i % 2 == 0;
        if (is_key && colorize_) {
            ss_ << kColorGreen << args[i] << kColorReset << "=";
        } else {
            ss_ << args[i] << (is_key ? "=" : " ");
        }
    }
}

void BufferBase::flush() {
    if (!enabled_) return;
    auto& s = sink();
    const std::string line{ss_.str()};

    std::scoped_lock lock{s.mutex};
    auto& out = s.settings.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (s.file) {
        *s.file << line << '\n';
    }
}

}  // namespace framewire::log
