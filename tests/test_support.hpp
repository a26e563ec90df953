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
// Shared fixtures: a throwaway power_supply tree and a helper runner that
// performs writes in-process instead of through pkexec.

#pragma once

#include "event_loop.hpp"
#include "helper.hpp"
#include "sysfs.hpp"

#include <cstdlib>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace chargekeeper::test {

class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/chargekeeper-test-XXXXXX";
        if (!::mkdtemp(tmpl)) throw std::runtime_error("mkdtemp failed");
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::trunc);
    f << content << "\n";
}

struct BatteryLayout {
    int end = 80;
    int start = 75;         // < 0: no start threshold file
    bool behaviour = false;
    bool legacy_names = false; // stop_charge_thresh / start_charge_thresh
    int capacity = 70;
    std::string scope = "System";
};

inline fs::path make_battery(const fs::path& root, const std::string& name, const BatteryLayout& layout = {}) {
    fs::path dir = root / name;
    write_file(dir / "type", "Battery");
    write_file(dir / "present", "1");
    write_file(dir / "scope", layout.scope);
    write_file(dir / "capacity", std::to_string(layout.capacity));
    write_file(dir / (layout.legacy_names ? "stop_charge_thresh" : "charge_control_end_threshold"),
               std::to_string(layout.end));
    if (layout.start >= 0)
        write_file(dir / (layout.legacy_names ? "start_charge_thresh" : "charge_control_start_threshold"),
                   std::to_string(layout.start));
    if (layout.behaviour) write_file(dir / "charge_behaviour", "[auto] inhibit-charge force-discharge");
    write_file(dir / "energy_full", "45000000");
    write_file(dir / "energy_full_design", "50000000");
    return dir;
}

// Performs the helper's writes against a fake sysfs tree. Results are
// delivered from the loop, like the real runner.
class FakeHelperRunner : public HelperRunner {
public:
    FakeHelperRunner(EventLoop& loop, fs::path root) : loop_(loop), root_(std::move(root)) {}

    bool available() const override { return available_; }

    void run(const std::string& command, const std::vector<std::string>& args, Callback cb) override {
        std::string line = command;
        for (const auto& a : args) line += " " + a;
        commands.push_back(line);

        auto task = [this, command, args, cb]() {
            HelperResult r;
            r.status = next_status;
            r.exit_code = next_status == HelperStatus::SUCCESS ? 0 : 1;
            if (next_status == HelperStatus::SUCCESS) apply(command, args);
            cb(r);
        };
        if (hold) held.push_back(task);
        else loop_.post(task);
    }

    // Deliver everything held back by `hold`
    void release_all() {
        auto tasks = std::move(held);
        held.clear();
        for (auto& t : tasks) loop_.post(t);
    }

    bool available_ = true;
    bool hold = false;
    bool apply_force_discharge = true; // false: kernel silently keeps the old mode
    HelperStatus next_status = HelperStatus::SUCCESS;
    std::vector<std::string> commands;
    std::vector<std::string> writes; // "BAT0/end", "BAT0/start" in the order performed
    std::vector<std::function<void()>> held;

private:
    static bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    void write_end(const std::string& bat, const std::string& v) {
        fs::path p = root_ / bat / "charge_control_end_threshold";
        if (!file_exists(p)) p = root_ / bat / "stop_charge_thresh";
        write_file(p, v);
        writes.push_back(bat + "/end");
    }

    void write_start(const std::string& bat, const std::string& v) {
        fs::path p = root_ / bat / "charge_control_start_threshold";
        if (!file_exists(p)) p = root_ / bat / "start_charge_thresh";
        write_file(p, v);
        writes.push_back(bat + "/start");
    }

    void apply(const std::string& command, const std::vector<std::string>& args) {
        static const std::string FD_PREFIX = "FORCE_DISCHARGE_";
        if (command.compare(0, FD_PREFIX.size(), FD_PREFIX) == 0) {
            if (!apply_force_discharge) return;
            std::string bat = command.substr(FD_PREFIX.size());
            write_file(root_ / bat / "charge_behaviour", args.at(0) == "force-discharge"
                ? "auto inhibit-charge [force-discharge]"
                : "[auto] inhibit-charge force-discharge");
            return;
        }
        if (ends_with(command, "_END_START")) {
            std::string bat = command.substr(0, command.size() - 10);
            write_end(bat, args.at(0));
            write_start(bat, args.at(1));
        } else if (ends_with(command, "_START_END")) {
            std::string bat = command.substr(0, command.size() - 10);
            write_start(bat, args.at(1));
            write_end(bat, args.at(0));
        } else if (ends_with(command, "_END")) {
            write_end(command.substr(0, command.size() - 4), args.at(0));
        }
    }

    EventLoop& loop_;
    fs::path root_;
};

// Turns the loop for a while so pending monitor events get delivered
inline void settle(EventLoop& loop, int ms = 150) {
    loop.run_until([]() { return false; }, ms);
}

} // namespace chargekeeper::test
