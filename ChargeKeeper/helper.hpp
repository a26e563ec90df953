// ChargeKeeper — battery charge threshold and force-discharge controller
//
// Copyright (c) 2025 Mikhailzrick
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License version 2
// as published by the Free Software Foundation.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License v2
// along with this program.  If not, see <https://www.gnu.org/licenses/>.
//
//
// Privileged helper invocation.
//
//   pkexec <helper> <COMMAND> <arg> [arg]
//
// Commands: <BAT>_END, <BAT>_START_END, <BAT>_END_START, FORCE_DISCHARGE_<BAT>
//
// One helper process runs at a time; later requests queue behind it up to
// max_queue_depth (running one included), beyond that they fail at once.

#pragma once

#include "event_loop.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace chargekeeper {

static constexpr const char* HELPER_BIN_NAME = "unified-power-ctl";
static constexpr const char* HELPER_FALLBACK_DIR = "/usr/local/bin";

// Exit codes shared with the helper script
static constexpr int EXIT_SUCCESS_CODE = 0;
static constexpr int EXIT_PRIVILEGE_REQUIRED = 126;
static constexpr int EXIT_COMMAND_NOT_FOUND = 127;

enum class HelperStatus { SUCCESS, PRIVILEGE_REQUIRED, COMMAND_NOT_FOUND, TIMEOUT, FAILURE };

struct HelperResult {
    HelperStatus status{HelperStatus::FAILURE};
    int exit_code{-1};
    std::string out;
    std::string err;
};

HelperStatus classify_exit_code(int code);
const char* to_string(HelperStatus s);

class HelperRunner {
public:
    using Callback = std::function<void(const HelperResult&)>;

    virtual ~HelperRunner() = default;

    virtual bool available() const = 0;

    // cb always runs from the event loop, never from inside run()
    virtual void run(const std::string& command, const std::vector<std::string>& args, Callback cb) = 0;
};

struct HelperOptions {
    std::string name = HELPER_BIN_NAME; // bare name searched in PATH, or a path
    bool use_pkexec = true;
    int timeout_s = 5;
    int max_queue_depth = 3;
};

// PATH first, then HELPER_FALLBACK_DIR. Empty when not found.
std::string find_program(const std::string& name);

class ProcessHelperRunner : public HelperRunner {
public:
    ProcessHelperRunner(EventLoop& loop, HelperOptions opts);
    ~ProcessHelperRunner() override;

    ProcessHelperRunner(const ProcessHelperRunner&) = delete;
    ProcessHelperRunner& operator=(const ProcessHelperRunner&) = delete;

    bool available() const override { return !path_.empty(); }
    const std::string& path() const { return path_; }

    void run(const std::string& command, const std::vector<std::string>& args, Callback cb) override;

    size_t depth() const { return queue_.size() + (running_ ? 1 : 0); }

private:
    struct Job {
        std::string command;
        std::vector<std::string> argv;
        Callback cb;
    };

    struct Running {
        pid_t pid{-1};
        int pidfd{-1};
        int out_fd{-1};
        int err_fd{-1};
        EventLoop::WatchId pid_watch{0};
        EventLoop::WatchId out_watch{0};
        EventLoop::WatchId err_watch{0};
        EventLoop::TimerId timeout{0};
        EventLoop::TimerId poll{0};
        bool timed_out{false};
        std::string out;
        std::string err;
        std::string command;
        Callback cb;
    };

    void start_next();
    bool spawn(Job& job);
    void drain(int& fd, EventLoop::WatchId& watch, std::string& sink);
    void poll_exit();
    void on_exit(int wstatus);
    void release_running();

    EventLoop& loop_;
    HelperOptions opts_;
    std::string path_;
    std::deque<Job> queue_;
    std::unique_ptr<Running> running_;
};

} // namespace chargekeeper
