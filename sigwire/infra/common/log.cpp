// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace sigwire::log {

static constexpr size_t kThreadNameWidth{11};
static constexpr size_t kMessageWidth{36};

static Settings settings_{};
static std::mutex out_mutex_;
static std::unique_ptr<std::ofstream> file_;
thread_local std::string thread_name_;

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.log_file.empty()) {
        tee_file(settings_.log_file);
    }
    const bool on_terminal{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    // Console and file receive the same line, escape codes only make sense on a terminal
    settings_.log_nocolor = settings_.log_nocolor || !on_terminal || file_ != nullptr;
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    file_ = std::move(file);
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

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

//! Fixed width tag and colour of a level
static std::pair<std::string_view, std::string_view> level_tag(Level level) {
    switch (level) {
        case Level::kCritical:
            return {"CRIT ", kBackgroundRed};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kWarning:
            return {"WARN ", kColorOrangeHigh};
        case Level::kInfo:
            return {"INFO ", kColorGreen};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kTrace:
            return {"TRACE", kColorCoal};
        case Level::kNone:
            break;
    }
    return {"     ", kColorReset};
}

BufferBase::BufferBase(Level level)
    : should_print_{level <= settings_.log_verbosity}, colored_{!settings_.log_nocolor} {
    if (!should_print_) return;

    const auto [tag, color] = level_tag(level);
    const absl::TimeZone time_zone{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << paint(color) << tag << paint(kColorReset) << " "
        << paint(kColorWhite) << absl::FormatTime("%Y-%m-%dT%H:%M:%E3S%Ez", absl::Now(), time_zone)
        << paint(kColorReset) << " ";
    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    if (!should_print_) return;
    ss_ << msg;
    if (!args.empty() && msg.size() < kMessageWidth) {
        ss_ << std::string(kMessageWidth - msg.size(), ' ');
    }
    append_args(args);
}

void BufferBase::append_args(const Args& args) {
    if (!should_print_) return;
    for (size_t i{0}; i < args.size(); i += 2) {
        ss_ << " " << paint(kColorGreen) << args[i] << paint(kColorReset) << "=";
        if (i + 1 < args.size()) {
            ss_ << paint(kColorWhite) << args[i + 1] << paint(kColorReset);
        }
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    std::scoped_lock lock{out_mutex_};
    (settings_.log_std_out ? std::cout : std::cerr) << line << '\n';
    if (file_) {
        *file_ << line << '\n';
        file_->flush();
    }
}

}  // namespace sigwire::log
