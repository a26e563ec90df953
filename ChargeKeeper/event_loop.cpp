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

#include "event_loop.hpp"

#include "log.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sys/epoll.h>
#include <sys/inotify.h>
#include <sys/timerfd.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace chargekeeper {

// ========================= EventLoop =========================
EventLoop::EventLoop() {
    epfd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epfd_ < 0) throw std::system_error(errno, std::generic_category(), "epoll_create1");
}

EventLoop::~EventLoop() {
    for (auto& [id, t] : timers_) ::close(t.fd);
    timers_.clear();
    watches_.clear();
    if (epfd_ >= 0) ::close(epfd_);
}

EventLoop::WatchId EventLoop::add_fd(int fd, uint32_t events, FdHandler handler) {
    WatchId id = next_id_++;
    epoll_event ev{};
    ev.events = events;
    ev.data.u64 = id;
    if (::epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) < 0)
        throw std::system_error(errno, std::generic_category(), "epoll_ctl add");
    watches_[id] = Watch{fd, std::make_shared<FdHandler>(std::move(handler))};
    return id;
}

void EventLoop::remove_fd(WatchId id) {
    auto it = watches_.find(id);
    if (it == watches_.end()) return;
    ::epoll_ctl(epfd_, EPOLL_CTL_DEL, it->second.fd, nullptr);
    watches_.erase(it);
}

EventLoop::TimerId EventLoop::add_timer(int64_t ms, Task task) {
    int tfd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) throw std::system_error(errno, std::generic_category(), "timerfd_create");

    // zero it_value disarms, so clamp to 1ms
    if (ms < 1) ms = 1;
    itimerspec its{};
    its.it_value.tv_sec = ms / 1000;
    its.it_value.tv_nsec = (ms % 1000) * 1000000;
    if (::timerfd_settime(tfd, 0, &its, nullptr) < 0) {
        int err = errno;
        ::close(tfd);
        throw std::system_error(err, std::generic_category(), "timerfd_settime");
    }

    TimerId id = next_id_++;
    auto shared_task = std::make_shared<Task>(std::move(task));
    WatchId watch;
    try {
        watch = add_fd(tfd, EPOLLIN, [this, id, shared_task](uint32_t) {
            if (timers_.count(id) == 0) return;
            fire_timer(id);
            (*shared_task)();
        });
    } catch (...) {
        ::close(tfd);
        throw;
    }
    timers_[id] = Timer{tfd, watch};
    return id;
}

void EventLoop::fire_timer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    uint64_t exp;
    (void)::read(it->second.fd, &exp, sizeof(exp));
    remove_fd(it->second.watch);
    ::close(it->second.fd);
    timers_.erase(it);
}

void EventLoop::cancel_timer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    remove_fd(it->second.watch);
    ::close(it->second.fd);
    timers_.erase(it);
}

void EventLoop::post(Task task) {
    posted_.push_back(std::move(task));
}

void EventLoop::drain_posted() {
    // Tasks posted while draining wait for the next turn
    std::deque<Task> batch;
    batch.swap(posted_);
    for (auto& t : batch) t();
}

bool EventLoop::run_once(int timeout_ms) {
    if (!posted_.empty()) timeout_ms = 0;

    std::array<epoll_event, 32> events{};
    int n = ::epoll_wait(epfd_, events.data(), (int)events.size(), timeout_ms);
    if (n < 0) {
        if (errno == EINTR) return false;
        throw std::system_error(errno, std::generic_category(), "epoll_wait");
    }

    for (int i = 0; i < n; ++i) {
        auto it = watches_.find(events[i].data.u64);
        if (it == watches_.end()) continue; // removed earlier in this batch
        auto handler = it->second.handler;
        (*handler)(events[i].events);
    }

    drain_posted();
    return true;
}

bool EventLoop::run_until(const std::function<bool()>& done, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remain <= 0) return false;
        run_once((int)std::min<int64_t>(remain, 50));
    }
    return true;
}

// ========================= FileMonitor =========================
static constexpr uint32_t WATCH_MASK = IN_MODIFY | IN_CLOSE_WRITE;

FileMonitor::FileMonitor(EventLoop& loop, std::string path)
    : loop_(loop), path_(std::move(path)) {
    ifd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (ifd_ < 0) throw std::system_error(errno, std::generic_category(), "inotify_init1");

    if (!add_watch()) {
        int err = errno;
        ::close(ifd_);
        ifd_ = -1;
        throw std::system_error(err, std::generic_category(), "inotify_add_watch " + path_);
    }

    try {
        watch_ = loop_.add_fd(ifd_, EPOLLIN, [this](uint32_t) { on_readable(); });
    } catch (...) {
        ::close(ifd_);
        ifd_ = -1;
        throw;
    }
}

FileMonitor::~FileMonitor() {
    cancel();
}

bool FileMonitor::add_watch() {
    wd_ = ::inotify_add_watch(ifd_, path_.c_str(), WATCH_MASK);
    return wd_ >= 0;
}

void FileMonitor::suspend() {
    if (cancelled_) return;
    if (suspend_depth_++ > 0) return;
    if (wd_ >= 0) {
        ::inotify_rm_watch(ifd_, wd_);
        wd_ = -1;
    }
}

void FileMonitor::resume() {
    if (cancelled_ || suspend_depth_ == 0) return;
    if (--suspend_depth_ > 0) return;
    if (!add_watch())
        log_warn("Failed to re-watch %s: %s", path_.c_str(), std::strerror(errno));
}

void FileMonitor::cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    cb_ = nullptr;
    if (ifd_ >= 0) {
        loop_.remove_fd(watch_);
        ::close(ifd_);
        ifd_ = -1;
        wd_ = -1;
    }
}

void FileMonitor::on_readable() {
    alignas(inotify_event) char buf[4096];
    bool changed = false;

    ssize_t r;
    while ((r = ::read(ifd_, buf, sizeof(buf))) > 0) {
        for (char* p = buf; p < buf + r; ) {
            auto* e = reinterpret_cast<inotify_event*>(p);
            // events queued for a watch removed by suspend() carry a stale wd
            if (e->wd == wd_ && wd_ >= 0) {
                if (e->mask & IN_IGNORED) wd_ = -1;
                else if (e->mask & WATCH_MASK) changed = true;
            }
            p += sizeof(inotify_event) + e->len;
        }
    }

    // one callback per drained batch
    if (changed && !cancelled_ && cb_) {
        auto cb = cb_;
        cb();
    }
}

// ========================= MonitorSuspension =========================
MonitorSuspension::MonitorSuspension(std::weak_ptr<FileMonitor> monitor)
    : monitor_(std::move(monitor)) {
    if (auto m = monitor_.lock()) {
        m->suspend();
        held_ = true;
    }
}

void MonitorSuspension::release() {
    if (!held_) return;
    held_ = false;
    if (auto m = monitor_.lock()) m->resume();
}

// ========================= DelayGroup =========================
void DelayGroup::start(int ms, Callback cb) {
    uint64_t key = next_key_++;
    auto timer = loop_.add_timer(ms, [this, key]() {
        auto it = pending_.find(key);
        if (it == pending_.end()) return;
        auto cb = std::move(it->second.cb);
        pending_.erase(it);
        cb(false);
    });
    pending_[key] = Pending{timer, std::move(cb)};
}

void DelayGroup::cancel_all() {
    std::vector<Callback> waiters;
    for (auto& [key, p] : pending_) {
        loop_.cancel_timer(p.timer);
        waiters.push_back(std::move(p.cb));
    }
    pending_.clear();
    for (auto& cb : waiters)
        loop_.post([cb = std::move(cb)]() { cb(true); });
}

} // namespace chargekeeper
