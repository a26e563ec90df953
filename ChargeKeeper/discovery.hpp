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

#pragma once

#include "device.hpp"
#include "event_loop.hpp"
#include "helper.hpp"
#include "sysfs.hpp"
#include "sysfs_battery.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace chargekeeper {

struct DiscoveryOptions {
    fs::path sysfs_root = SYSFS_POWER_SUPPLY;
    fs::path mock_marker; // empty disables the mock device
    ControllerOptions controller;
};

// $XDG_CONFIG_HOME/chargekeeper/use_mock, ~/.config when unset
fs::path default_mock_marker();

// type == Battery, scope != Device, present != 0 (missing present file counts as present)
bool is_system_battery(const fs::path& dir);

// Supported system batteries under root in natural name order.
// Throws std::filesystem::filesystem_error when root cannot be listed.
std::vector<fs::path> find_battery_candidates(const fs::path& root);

// nullptr when nothing usable, a bare controller for one battery,
// a CompositeDevice for several
std::unique_ptr<Device> discover_device(EventLoop& loop, HelperRunner& helper, const DiscoveryOptions& opts);

// true on AC, false on battery, nullopt when no adapter is found
std::optional<bool> read_ac_online(const fs::path& root);

} // namespace chargekeeper
