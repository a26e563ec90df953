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

#include "helper.hpp"

#include "log.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace chargekeeper {

static constexpr int EXIT_POLL_MS = 50; // waitpid polling when pidfd is unavailable

HelperStatus classify_exit_code(int code) {
    switch (code) {
        case EXIT_SUCCESS_CODE: return HelperStatus::SUCCESS;
        case EXIT_PRIVILEGE_REQUIRED: return HelperStatus::PRIVILEGE_REQUIRED;
        case EXIT_COMMAND_NOT_FOUND: return HelperStatus::COMMAND_NOT_FOUND;
        default: return HelperStatus::FAILURE;
    }
}

const char* to_string(HelperStatus s) {
    switch (s) {
        case HelperStatus::SUCCESS: return "success";
        case HelperStatus::PRIVILEGE_REQUIRED: return "privilege required";
        case HelperStatus::COMMAND_NOT_FOUND: return "command not found";
        case HelperStatus::TIMEOUT: return "timeout";
        case HelperStatus::FAILURE: return "failure";
    }
    return "unknown";
}

static bool is_executable(const std::string& p) {
    return !p.empty() && ::access(p.c_str(), X_OK) == 0;
}

std::string find_program(const std::string& name) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos)
        return is_executable(name) ? name : std::string{};

    if (const char* path = std::getenv("PATH")) {
        std::string dirs = path;
        size_t pos = 0;
        while (pos <= dirs.size()) {
            size_t colon = dirs.find(':', pos);
            if (colon == std::string::npos) colon = dirs.size();
            std::string dir = dirs.substr(pos, colon - pos);
            if (!dir.empty()) {
                std::string candidate = dir + "/" + name;
                if (is_executable(candidate)) return candidate;
            }
            pos = colon + 1;
        }
    }

    std::string fallback = std::string(HELPER_FALLBACK_DIR) + "/" + name;
    return is_executable(fallback) ? fallback : std::string{};
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// ========================= ProcessHelperRunner =========================
ProcessHelperRunner::ProcessHelperRunner(EventLoop& loop, HelperOptions opts)
    : loop_(loop), opts_(std::move(opts)) {
    if (opts_.timeout_s < 1) opts_.timeout_s = 1;
    if (opts_.max_queue_depth < 1) opts_.max_queue_depth = 1;
    path_ = find_program(opts_.name);
}

ProcessHelperRunner::~ProcessHelperRunner() {
    if (running_) {
        ::kill(running_->pid, SIGKILL);
        int status = 0;
        (void)::waitpid(running_->pid, &status, 0);
        release_running();
    }
    queue_.clear();
}

void ProcessHelperRunner::run(const std::string& command, const std::vector<std::string>& args, Callback cb) {
    if (depth() >= (size_t)opts_.max_queue_depth) {
        log_warn("Command queue full (%zu pending), rejecting command: %s", depth(), command.c_str());
        loop_.post([cb = std::move(cb)]() {
            HelperResult r;
            r.err = "Command queue full - too many pending operations";
            cb(r);
        });
        return;
    }

    if (path_.empty()) {
        loop_.post([cb = std::move(cb)]() {
            HelperResult r;
            r.status = HelperStatus::COMMAND_NOT_FOUND;
            r.exit_code = EXIT_COMMAND_NOT_FOUND;
            r.err = "helper not found";
            cb(r);
        });
        return;
    }

    Job job;
    job.command = command;
    if (opts_.use_pkexec) job.argv.push_back("pkexec");
    job.argv.push_back(path_);
    job.argv.push_back(command);
    job.argv.insert(job.argv.end(), args.begin(), args.end());
    job.cb = std::move(cb);

    queue_.push_back(std::move(job));
    if (!running_) start_next();
}

void ProcessHelperRunner::start_next() {
    while (!running_ && !queue_.empty()) {
        Job job = std::move(queue_.front());
        queue_.pop_front();
        if (spawn(job)) return;

        HelperResult r;
        r.err = std::strerror(errno);
        log_error("Command execution failed: %s", r.err.c_str());
        loop_.post([cb = std::move(job.cb), r]() { cb(r); });
    }
}

bool ProcessHelperRunner::spawn(Job& job) {
    int out_pipe[2], err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) return false;
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        errno = err;
        return false;
    }

    // argv must be ready before fork
    std::vector<char*> argv;
    for (auto& a : job.argv) argv.push_back(a.data());
    argv.push_back(nullptr);
    const bool search_path = opts_.use_pkexec;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        errno = err;
        return false;
    }

    if (pid == 0) {
        // child
        int nullfd = ::open("/dev/null", O_RDONLY);
        if (nullfd >= 0) {
            ::dup2(nullfd, STDIN_FILENO);
            ::close(nullfd);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (search_path) ::execvp(argv[0], argv.data());
        else ::execv(argv[0], argv.data());
        _exit(EXIT_COMMAND_NOT_FOUND);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    running_ = std::make_unique<Running>();
    Running& r = *running_;
    r.pid = pid;
    r.out_fd = out_pipe[0];
    r.err_fd = err_pipe[0];
    r.command = job.command;
    r.cb = std::move(job.cb);

    r.out_watch = loop_.add_fd(r.out_fd, EPOLLIN, [this](uint32_t) {
        if (running_) drain(running_->out_fd, running_->out_watch, running_->out);
    });
    r.err_watch = loop_.add_fd(r.err_fd, EPOLLIN, [this](uint32_t) {
        if (running_) drain(running_->err_fd, running_->err_watch, running_->err);
    });

#ifdef SYS_pidfd_open
    r.pidfd = (int)::syscall(SYS_pidfd_open, pid, 0);
#endif
    if (r.pidfd >= 0) {
        r.pid_watch = loop_.add_fd(r.pidfd, EPOLLIN, [this](uint32_t) { poll_exit(); });
    } else {
        // kernels before 5.3: poll like a hook runner would
        r.poll = loop_.add_timer(EXIT_POLL_MS, [this]() {
            if (running_) running_->poll = 0;
            poll_exit();
        });
    }

    r.timeout = loop_.add_timer((int64_t)opts_.timeout_s * 1000, [this]() {
        if (!running_) return;
        running_->timeout = 0;
        running_->timed_out = true;
        ::kill(running_->pid, SIGKILL);
    });

    return true;
}

void ProcessHelperRunner::drain(int& fd, EventLoop::WatchId& watch, std::string& sink) {
    if (fd < 0) return;
    char buf[1024];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, (size_t)n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        if (n < 0 && errno == EINTR) continue;
        // EOF or a real error: stop watching so HUP does not spin
        loop_.remove_fd(watch);
        watch = 0;
        ::close(fd);
        fd = -1;
        return;
    }
}

void ProcessHelperRunner::poll_exit() {
    if (!running_) return;
    int status = 0;
    pid_t r = ::waitpid(running_->pid, &status, WNOHANG);
    if (r == 0) {
        if (running_->pidfd < 0) {
            running_->poll = loop_.add_timer(EXIT_POLL_MS, [this]() {
                if (running_) running_->poll = 0;
                poll_exit();
            });
        }
        return;
    }
    if (r < 0) status = -1;
    on_exit(status);
}

void ProcessHelperRunner::on_exit(int wstatus) {
    drain(running_->out_fd, running_->out_watch, running_->out);
    drain(running_->err_fd, running_->err_watch, running_->err);

    HelperResult result;
    result.out = running_->out;
    result.err = running_->err;

    if (running_->timed_out) {
        result.status = HelperStatus::TIMEOUT;
    } else if (wstatus >= 0 && WIFEXITED(wstatus)) {
        result.exit_code = WEXITSTATUS(wstatus);
        result.status = classify_exit_code(result.exit_code);
    } else {
        result.status = HelperStatus::FAILURE;
    }

    if (result.status != HelperStatus::SUCCESS) {
        std::string detail = trim(result.err);
        if (detail.empty()) {
            detail = result.status == HelperStatus::TIMEOUT
                ? std::string("timed out")
                : "exit code " + std::to_string(result.exit_code);
        }
        log_debug("Command '%s' failed: %s", running_->command.c_str(), detail.c_str());
    }

    Callback cb = std::move(running_->cb);
    release_running();
    start_next();
    cb(result);
}

void ProcessHelperRunner::release_running() {
    if (!running_) return;
    Running& r = *running_;
    if (r.out_fd >= 0) { loop_.remove_fd(r.out_watch); ::close(r.out_fd); }
    if (r.err_fd >= 0) { loop_.remove_fd(r.err_watch); ::close(r.err_fd); }
    if (r.pidfd >= 0) { loop_.remove_fd(r.pid_watch); ::close(r.pidfd); }
    if (r.timeout) loop_.cancel_timer(r.timeout);
    if (r.poll) loop_.cancel_timer(r.poll);
    running_.reset();
}

} // namespace chargekeeper
