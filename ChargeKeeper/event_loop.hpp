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
// Single-threaded epoll loop shared by every device:
//   • fd watches (helper pipes, pidfds, inotify)
//   • one-shot timers backed by timerfd
//   • posted tasks, run after the current batch of fd events
//
// Everything registered here must be torn down before the loop itself.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace chargekeeper {

class EventLoop {
public:
    using FdHandler = std::function<void(uint32_t events)>;
    using Task = std::function<void()>;
    using WatchId = uint64_t;
    using TimerId = uint64_t;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // The caller keeps ownership of fd and must remove the watch before closing it
    WatchId add_fd(int fd, uint32_t events, FdHandler handler);
    void remove_fd(WatchId id);

    TimerId add_timer(int64_t ms, Task task);
    void cancel_timer(TimerId id);

    void post(Task task);

    // One epoll round plus posted tasks. timeout_ms < 0 blocks.
    // Returns false when interrupted by a signal.
    bool run_once(int timeout_ms);

    // Turns the loop until done() holds or timeout_ms elapses
    bool run_until(const std::function<bool()>& done, int timeout_ms);

    size_t watch_count() const { return watches_.size(); }
    size_t timer_count() const { return timers_.size(); }

private:
    struct Watch {
        int fd;
        std::shared_ptr<FdHandler> handler;
    };

    struct Timer {
        int fd;
        WatchId watch;
    };

    void fire_timer(TimerId id);
    void drain_posted();

    int epfd_{-1};
    uint64_t next_id_{1};
    std::map<WatchId, Watch> watches_;
    std::map<TimerId, Timer> timers_;
    std::deque<Task> posted_;
};

// Watches one control file through inotify. Suspensions nest: the watch is
// dropped on the first suspend() and re-added when the last one resumes.
class FileMonitor {
public:
    using Callback = std::function<void()>;

    FileMonitor(EventLoop& loop, std::string path);
    ~FileMonitor();

    FileMonitor(const FileMonitor&) = delete;
    FileMonitor& operator=(const FileMonitor&) = delete;

    void set_callback(Callback cb) { cb_ = std::move(cb); }

    void suspend();
    void resume();
    void cancel();

    bool suspended() const { return suspend_depth_ > 0; }
    const std::string& path() const { return path_; }

private:
    bool add_watch();
    void on_readable();

    EventLoop& loop_;
    std::string path_;
    int ifd_{-1};
    int wd_{-1};
    EventLoop::WatchId watch_{0};
    int suspend_depth_{0};
    bool cancelled_{false};
    Callback cb_;
};

// Suspends a monitor for its own lifetime. Holds the monitor weakly so a
// guard that outlives its controller does nothing.
class MonitorSuspension {
public:
    explicit MonitorSuspension(std::weak_ptr<FileMonitor> monitor);
    ~MonitorSuspension() { release(); }

    MonitorSuspension(const MonitorSuspension&) = delete;
    MonitorSuspension& operator=(const MonitorSuspension&) = delete;

    void release();

private:
    std::weak_ptr<FileMonitor> monitor_;
    bool held_{false};
};

// Cancellable delays bound to an owner's lifetime. cancel_all() unblocks
// every waiter with cancelled == true on the next loop turn instead of
// letting the timer expire.
class DelayGroup {
public:
    using Callback = std::function<void(bool cancelled)>;

    explicit DelayGroup(EventLoop& loop) : loop_(loop) {}
    ~DelayGroup() { cancel_all(); }

    DelayGroup(const DelayGroup&) = delete;
    DelayGroup& operator=(const DelayGroup&) = delete;

    void start(int ms, Callback cb);
    void cancel_all();

    size_t pending() const { return pending_.size(); }

private:
    struct Pending {
        EventLoop::TimerId timer;
        Callback cb;
    };

    EventLoop& loop_;
    uint64_t next_key_{1};
    std::map<uint64_t, Pending> pending_;
};

} // namespace chargekeeper
