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
// Purpose:
//   ChargeKeeper controls laptop battery charge thresholds and force
//   discharge through the kernel power_supply interface. Writes go through a
//   privileged helper (unified-power-ctl via pkexec); reads come straight
//   from sysfs.
//
// Core behaviors:
//
//   • Every system battery with threshold control is managed
//       - One battery: controlled directly
//       - Several: written together, BAT0 (natural order) is primary
//
//   • Safe threshold ordering
//       - End is written first whenever the new start would reach the
//         current end
//
//   • Verified force discharge
//       - Mode is re-read with backoff until the kernel reports it
//       - If it never does, the real on-disk mode is reported
//
//   • External changes are followed (inotify + periodic refresh)
//
// Commands:
//   status                                   - print current state
//   set START END                            - set thresholds
//   mode full-capacity|balanced|max-lifespan - preset thresholds
//   force-discharge on|off                   - toggle force discharge
//   watch                                    - print changes until stopped
//
// Files:
//   /etc/chargekeeper/chargekeeper.conf      - optional configuration
//   ~/.config/chargekeeper/use_mock          - use an in-memory device
//
// Signals:
//   SIGTERM / SIGINT — stop watching, abort a pending write

#include "config.hpp"
#include "device.hpp"
#include "discovery.hpp"
#include "event_loop.hpp"
#include "helper.hpp"
#include "log.hpp"

#include <array>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string>
#include <system_error>

using namespace chargekeeper;

// ========================= Config (constants) =========================
static constexpr int REFRESH_INTERVAL_S = 30; // kernel side changes do not raise inotify events
static constexpr int LOOP_TICK_MS = 200;

struct BatteryMode {
    const char* name;
    int start;
    int end;
};

static constexpr std::array<BatteryMode, 3> BATTERY_MODES = {{
    { "full-capacity", 95, 100 },
    { "balanced",      75, 80 },
    { "max-lifespan",  55, 60 },
}};

// ========================= Globals =========================
static std::atomic<bool> g_running { true };

static void handle_signal(int) { g_running = false; }

// ========================= Utilities =========================
static void usage(const char* argv0) {
    std::fprintf(stderr,
        "Usage: %s [-c CONFIG] [-v] COMMAND\n"
        "\n"
        "Commands:\n"
        "  status\n"
        "  set START END\n"
        "  mode full-capacity|balanced|max-lifespan\n"
        "  force-discharge on|off\n"
        "  watch\n",
        argv0);
}

static bool parse_percent(const char* s, int& out) {
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || v < 0 || v > 100) return false;
    out = (int)v;
    return true;
}

// Turns the loop until the write reports back or we get signalled
static bool run_write(EventLoop& loop, const std::function<void(Completion)>& start) {
    bool finished = false;
    bool result = false;
    start([&](bool ok) { finished = true; result = ok; });
    while (!finished && g_running) loop.run_once(LOOP_TICK_MS);
    return finished && result;
}

static void print_status(Device& dev, const Config& cfg) {
    ThresholdPair t = dev.get_thresholds();
    auto health = dev.get_health();
    auto ac = read_ac_online(cfg.sysfs_root);

    std::printf("device:          %s (%s)\n", to_string(dev.kind()), dev.name().c_str());
    if (dev.has_start_threshold())
        std::printf("thresholds:      start=%d end=%d\n", t.start, t.end);
    else
        std::printf("thresholds:      end=%d\n", t.end);
    std::printf("level:           %d%%\n", dev.get_battery_level());
    if (health) std::printf("health:          %d%%\n", *health);
    else std::printf("health:          unknown\n");
    if (dev.supports_force_discharge())
        std::printf("force discharge: %s\n", dev.get_force_discharge() ? "on" : "off");
    else
        std::printf("force discharge: unsupported\n");
    std::printf("helper:          %s\n", dev.needs_helper() ? "missing (read-only)" : "present");
    std::printf("ac:              %s\n", !ac ? "unknown" : (*ac ? "online" : "offline"));
}

static void arm_refresh(EventLoop& loop, Device& dev) {
    loop.add_timer((int64_t)REFRESH_INTERVAL_S * 1000, [&loop, &dev]() {
        dev.refresh_values();
        arm_refresh(loop, dev);
    });
}

// ========================= Main =========================
int main(int argc, char** argv) {
    std::string config_path = CONFIG_FILE;
    bool verbose = false;

    int i = 1;
    for (; i < argc && argv[i][0] == '-'; ++i) {
        if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else {
            usage(argv[0]);
            return 2;
        }
    }
    if (i >= argc) {
        usage(argv[0]);
        return 2;
    }

    const std::string cmd = argv[i++];
    const int nargs = argc - i;
    char** args = argv + i;

    // Validate before touching hardware
    int start = -1, end = -1;
    bool enable = false;
    if (cmd == "status" || cmd == "watch") {
        if (nargs != 0) { usage(argv[0]); return 2; }
    } else if (cmd == "set") {
        if (nargs != 2 || !parse_percent(args[0], start) || !parse_percent(args[1], end)) {
            usage(argv[0]);
            return 2;
        }
    } else if (cmd == "mode") {
        bool found = false;
        if (nargs == 1) {
            for (const auto& m : BATTERY_MODES) {
                if (std::strcmp(args[0], m.name) == 0) {
                    start = m.start;
                    end = m.end;
                    found = true;
                }
            }
        }
        if (!found) { usage(argv[0]); return 2; }
    } else if (cmd == "force-discharge") {
        if (nargs != 1 || (std::strcmp(args[0], "on") != 0 && std::strcmp(args[0], "off") != 0)) {
            usage(argv[0]);
            return 2;
        }
        enable = std::strcmp(args[0], "on") == 0;
    } else {
        usage(argv[0]);
        return 2;
    }

    Config cfg = read_config_or_defaults(config_path);
    set_log_level(verbose ? LogLevel::DEBUG : cfg.log_level);

    // Signals
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int rc = 0;
    try {
        EventLoop loop;

        HelperOptions hopts;
        hopts.name = cfg.helper;
        hopts.use_pkexec = cfg.use_pkexec;
        hopts.timeout_s = cfg.helper_timeout_s;
        hopts.max_queue_depth = cfg.helper_queue_depth;
        ProcessHelperRunner helper(loop, hopts);

        DiscoveryOptions dopts;
        dopts.sysfs_root = cfg.sysfs_root;
        dopts.mock_marker = default_mock_marker();
        dopts.controller.verify_backoff_ms = cfg.verify_backoff_ms;

        auto dev = discover_device(loop, helper, dopts);
        if (!dev) {
            std::fprintf(stderr, "chargekeeper: Error: No battery with charge threshold control detected!\n");
            return 1;
        }

        if (cmd != "watch") {
            dev->partial_failure().connect([](const std::string& primary, const std::string& failed) {
                std::fprintf(stderr, "chargekeeper: Warning: %s applied, failed on: %s\n", primary.c_str(), failed.c_str());
            });
        }

        if (cmd == "status") {
            print_status(*dev, cfg);
        } else if (cmd == "set" || cmd == "mode") {
            if (dev->needs_helper()) log_warn("%s helper missing, thresholds are read-only", cfg.helper.c_str());
            bool ok = run_write(loop, [&](Completion done) { dev->set_thresholds(start, end, std::move(done)); });
            ThresholdPair t = dev->get_thresholds();
            if (ok) std::printf("thresholds: start=%d end=%d\n", t.start, t.end);
            else {
                std::fprintf(stderr, "chargekeeper: Error: Failed to set thresholds %d-%d\n", start, end);
                rc = 1;
            }
        } else if (cmd == "force-discharge") {
            if (!dev->supports_force_discharge()) {
                std::fprintf(stderr, "chargekeeper: Error: Force discharge is not supported\n");
                rc = 1;
            } else {
                bool ok = run_write(loop, [&](Completion done) { dev->set_force_discharge(enable, std::move(done)); });
                std::printf("force discharge: %s\n", dev->get_force_discharge() ? "on" : "off");
                if (!ok) {
                    std::fprintf(stderr, "chargekeeper: Error: Failed to set force discharge\n");
                    rc = 1;
                }
            }
        } else {
            dev->threshold_changed().connect([](int s, int e) {
                std::printf("threshold-changed %d %d\n", s, e);
                std::fflush(stdout);
            });
            dev->force_discharge_changed().connect([](bool enabled) {
                std::printf("force-discharge-changed %s\n", enabled ? "on" : "off");
                std::fflush(stdout);
            });
            dev->partial_failure().connect([](const std::string& primary, const std::string& failed) {
                std::printf("partial-failure %s %s\n", primary.c_str(), failed.c_str());
                std::fflush(stdout);
            });

            print_status(*dev, cfg);
            std::fflush(stdout);
            arm_refresh(loop, *dev);
            while (g_running) loop.run_once(LOOP_TICK_MS);
        }

        // monitors and timers go before the helper and the loop
        dev->destroy();
        dev.reset();
    } catch (const std::system_error& e) {
        die("%s", e.what());
    }

    return rc;
}
