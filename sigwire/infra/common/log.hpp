// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <sigwire/infra/common/terminal.hpp>

namespace sigwire::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // A terminal failure of one request, the service keeps running
    kWarning,   // Something happened and an operator might have to amend the situation
    kInfo,      // Transaction lifecycle milestones
    kDebug,     // Every state transition and collaborator round-trip
    kTrace      // Raw payloads
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output, forced when not on a terminal or teeing to file
    bool log_nocolor{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and in tests
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Alternating keys and values
using Args = std::vector<std::string>;

//! \brief One log line: prefix written on construction, emitted on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    //! Colour escape code, empty when the line is not colored
    std::string_view paint(std::string_view color) const { return colored_ ? color : std::string_view{}; }

    void append_args(const Args& args);
    void flush();

    const bool should_print_;
    const bool colored_;
    std::ostringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace sigwire::log

#define SIGW_LOGBUFFER(level_, ...)              \
    if (!sigwire::log::test_verbosity(level_)) { \
    } else                                       \
        sigwire::log::LogBuffer<level_>(__VA_ARGS__)

#define SIGW_TRACE_M(...) SIGW_LOGBUFFER(sigwire::log::Level::kTrace, __VA_ARGS__)
#define SIGW_DEBUG_M(...) SIGW_LOGBUFFER(sigwire::log::Level::kDebug, __VA_ARGS__)
#define SIGW_INFO_M(...) SIGW_LOGBUFFER(sigwire::log::Level::kInfo, __VA_ARGS__)
#define SIGW_WARN_M(...) SIGW_LOGBUFFER(sigwire::log::Level::kWarning, __VA_ARGS__)
#define SIGW_ERROR_M(...) SIGW_LOGBUFFER(sigwire::log::Level::kError, __VA_ARGS__)
#define SIGW_CRIT_M(...) SIGW_LOGBUFFER(sigwire::log::Level::kCritical, __VA_ARGS__)
#define SIGW_LOG_M(...) SIGW_LOGBUFFER(sigwire::log::Level::kNone, __VA_ARGS__)

#define SIGW_TRACE SIGW_TRACE_M()
#define SIGW_DEBUG SIGW_DEBUG_M()
#define SIGW_INFO SIGW_INFO_M()
#define SIGW_WARN SIGW_WARN_M()
#define SIGW_ERROR SIGW_ERROR_M()
#define SIGW_CRIT SIGW_CRIT_M()
#define SIGW_LOG SIGW_LOG_M()
