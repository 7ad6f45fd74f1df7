// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace framewire::log {

//! Severity of a log line, lines above the configured verbosity are dropped
enum class Level {
    kNone,      // Always printed, no severity tag
    kCritical,  // Unrecoverable failure
    kError,     // Failure of one operation
    kWarning,   // Unexpected condition the process can live with
    kInfo,      // Lifecycle of connections and services
    kDebug,     // Handshakes and failure details
    kTrace      // Per-frame and per-call detail
};

struct Settings {
    //! Print to std::cout instead of std::cerr
    bool log_std_out{false};
    //! Print timestamps in UTC instead of local time
    bool log_utc{true};
    //! Append the time zone name to timestamps
    bool log_timezone{true};
    //! Never emit color escape sequences
    bool log_nocolor{false};
    //! Print the thread name (or id) on each line
    bool log_threads{false};
    Level log_verbosity{Level::kNone};
    //! Also append each line to this file, if not empty
    std::string log_file;
};

//! \brief Apply \p settings to the process-wide logger
//! \note Not thread safe: call once at startup (tests may call it again)
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe
void set_verbosity(Level level);

//! \brief Name printed for the calling thread when Settings::log_threads is enabled
void set_thread_name(const char* name);

//! \brief The name set for the calling thread, or its id if none
std::string get_thread_name();

//! \brief Whether lines of the given \p level are currently printed
//! \remarks Use it to skip building expensive log content
bool test_verbosity(Level level);

//! \brief Append every line to the file at \p path too
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Key-value pairs printed after the message: {"key1", "value1", "key2", "value2", ...}
using Args = std::vector<std::string>;

//! Accumulates one log line, printed on destruction if the level is enabled
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    void append(const T& t) {
        if (enabled_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_args(const Args& args);
    void flush();

    const bool enabled_;
    const bool colorize_;
    std::ostringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace framewire::log

#define FWIRE_LOGBUFFER(level_, ...)               \
    if (!framewire::log::test_verbosity(level_)) { \
    } else                                         \
        framewire::log::LogBuffer<level_>(__VA_ARGS__)

#define FWIRE_TRACE_M(...) FWIRE_LOGBUFFER(framewire::log::Level::kTrace, __VA_ARGS__)
#define FWIRE_DEBUG_M(...) FWIRE_LOGBUFFER(framewire::log::Level::kDebug, __VA_ARGS__)
#define FWIRE_INFO_M(...) FWIRE_LOGBUFFER(framewire::log::Level::kInfo, __VA_ARGS__)
#define FWIRE_WARN_M(...) FWIRE_LOGBUFFER(framewire::log::Level::kWarning, __VA_ARGS__)
#define FWIRE_ERROR_M(...) FWIRE_LOGBUFFER(framewire::log::Level::kError, __VA_ARGS__)
#define FWIRE_CRIT_M(...) FWIRE_LOGBUFFER(framewire::log::Level::kCritical, __VA_ARGS__)
#define FWIRE_LOG_M(...) FWIRE_LOGBUFFER(framewire::log::Level::kNone, __VA_ARGS__)

#define FWIRE_TRACE FWIRE_TRACE_M()
#define FWIRE_DEBUG FWIRE_DEBUG_M()
#define FWIRE_INFO FWIRE_INFO_M()
#define FWIRE_WARN FWIRE_WARN_M()
#define FWIRE_ERROR FWIRE_ERROR_M()
#define FWIRE_CRIT FWIRE_CRIT_M()
#define FWIRE_LOG FWIRE_LOG_M()
