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

#include "discovery.hpp"

#include "composite_device.hpp"
#include "log.hpp"
#include "mock_device.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <exception>
#include <stdexcept>

namespace chargekeeper {

// Most common adapter names, tried before a full scan
static constexpr std::array<const char*, 4> AC_ADAPTER_NAMES = { "AC", "ACAD", "ADP0", "ADP1" };

fs::path default_mock_marker() {
    fs::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) base = xdg;
    else if (const char* home = std::getenv("HOME"); home && *home) base = fs::path(home) / ".config";
    else return {};
    return base / "chargekeeper" / "use_mock";
}

bool is_system_battery(const fs::path& dir) {
    auto type = slurp(dir / "type");
    if (!type || *type != "Battery") return false;

    // peripherals (mice, keyboards) report scope=Device
    auto scope = slurp(dir / "scope");
    if (scope && *scope == "Device") return false;

    auto present = slurp_int(dir / "present");
    if (present && *present == 0) return false;

    return true;
}

std::vector<fs::path> find_battery_candidates(const fs::path& root) {
    std::vector<fs::path> out;
    for (auto& de : fs::directory_iterator(root)) {
        const fs::path& p = de.path();
        if (!is_system_battery(p)) continue;
        if (!SysfsBattery::is_supported(p)) {
            log_debug("%s: no threshold control, skipping", p.filename().c_str());
            continue;
        }
        out.push_back(p);
    }

    // deterministic primary: BAT0, BAT1, ..., BAT10
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return natural_less(a.filename().string(), b.filename().string());
    });
    return out;
}

std::unique_ptr<Device> discover_device(EventLoop& loop, HelperRunner& helper, const DiscoveryOptions& opts) {
    if (!opts.mock_marker.empty() && file_exists(opts.mock_marker)) {
        log_info("Mock device requested via %s", opts.mock_marker.c_str());
        auto mock = std::make_unique<MockDevice>();
        if (mock->initialize()) return mock;
    }

    std::vector<std::unique_ptr<SysfsBattery>> ready;
    try {
        for (const auto& path : find_battery_candidates(opts.sysfs_root)) {
            std::unique_ptr<SysfsBattery> dev;
            try {
                dev = std::make_unique<SysfsBattery>(path, loop, helper, opts.controller);
            } catch (const std::invalid_argument& e) {
                log_warn("Skipping %s: %s", path.c_str(), e.what());
                continue;
            }

            if (!dev->initialize()) {
                log_warn("Failed to initialize battery %s, skipping", dev->name().c_str());
                dev->destroy();
                continue;
            }

            log_info("Found battery %s", dev->name().c_str());
            ready.push_back(std::move(dev));
        }
    } catch (const std::exception& e) {
        // nothing built in this pass may keep monitors or helper callbacks alive
        for (auto& d : ready) d->destroy();
        ready.clear();
        log_error("Battery discovery failed: %s", e.what());
        return nullptr;
    }

    if (ready.empty()) {
        log_info("No supported battery control device found");
        return nullptr;
    }
    if (ready.size() == 1) return std::move(ready.front());

    log_info("Managing %zu batteries as one device", ready.size());
    std::vector<std::unique_ptr<Device>> members;
    for (auto& d : ready) members.push_back(std::move(d));
    return std::make_unique<CompositeDevice>(std::move(members));
}

std::optional<bool> read_ac_online(const fs::path& root) {
    for (const char* name : AC_ADAPTER_NAMES) {
        if (auto online = slurp(root / name / "online")) return *online == "1";
    }

    // Fallback: any supply of type Mains
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        auto type = slurp(it->path() / "type");
        if (!type || *type != "Mains") continue;
        if (auto online = slurp(it->path() / "online")) return *online == "1";
    }
    return std::nullopt;
}

} // namespace chargekeeper
