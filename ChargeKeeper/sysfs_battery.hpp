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
// One physical battery under /sys/class/power_supply/<BAT>.
//
// Threshold write:
//   validate -> suspend monitor -> pick write order -> helper -> re-read
//   -> resume monitor -> reconcile (only if nothing was emitted)
//
// Force-discharge write:
//   single writer -> suspend monitor -> helper -> verify with backoff
//   -> on failure reconcile to what is actually on disk
//   -> clear guard, resume monitor, re-check

#pragma once

#include "device.hpp"
#include "event_loop.hpp"
#include "helper.hpp"
#include "sysfs.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chargekeeper {

struct ControllerOptions {
    // Immediate read, then one read after each delay; ~3.15s window
    std::vector<int> verify_backoff_ms{50, 100, 200, 400, 800, 1600};
};

class SysfsBattery : public Device {
public:
    // Throws std::invalid_argument if the directory name is not a valid battery name
    SysfsBattery(fs::path battery_path, EventLoop& loop, HelperRunner& helper, ControllerOptions opts = {});
    ~SysfsBattery() override;

    SysfsBattery(const SysfsBattery&) = delete;
    SysfsBattery& operator=(const SysfsBattery&) = delete;

    // At least one recognized end-threshold file exists
    static bool is_supported(const fs::path& battery_path);

    DeviceKind kind() const override { return DeviceKind::SYSFS_BATTERY; }
    std::string name() const override { return battery_name_; }
    const fs::path& path() const { return sysfs_path_; }

    bool initialize() override;

    ThresholdPair get_thresholds() const override { return cache_; }
    void set_thresholds(int start, int end, Completion done) override;

    bool get_force_discharge() const override { return force_discharge_enabled_; }
    void set_force_discharge(bool enabled, Completion done) override;

    int get_battery_level() const override { return battery_level_; }
    std::optional<int> get_health() const override { return health_; }

    void refresh_values() override;
    void destroy() override;
    bool destroyed() const override { return *destroyed_; }

    bool supports_force_discharge() const override { return supports_force_discharge_; }
    bool has_start_threshold() const override { return has_start_threshold_; }
    bool needs_helper() const override { return missing_helper_; }

    bool force_discharge_in_flight() const { return force_discharge_in_flight_; }
    bool monitoring() const { return threshold_monitor_ != nullptr; }

private:
    struct ThresholdWrite;
    struct ForceDischargeWrite;

    void init_monitoring();

    bool sync_thresholds(bool notify);
    bool sync_force_discharge(bool notify);
    std::optional<bool> read_force_discharge() const;
    void read_level_and_health();

    void on_threshold_write_done(const std::shared_ptr<ThresholdWrite>& op, const HelperResult& r);
    void verify_force_discharge(const std::shared_ptr<ForceDischargeWrite>& op, size_t attempt);
    void revert_force_discharge(const std::shared_ptr<ForceDischargeWrite>& op);
    void finish_force_discharge(const std::shared_ptr<ForceDischargeWrite>& op, bool ok);

    fs::path sysfs_path_;
    std::string battery_name_;
    EventLoop& loop_;
    HelperRunner& helper_;
    ControllerOptions opts_;

    fs::path end_path_;
    fs::path start_path_;
    fs::path capacity_path_;
    fs::path behaviour_path_;
    fs::path energy_full_path_;
    fs::path energy_full_design_path_;
    fs::path charge_full_path_;
    fs::path charge_full_design_path_;

    ThresholdPair cache_;
    int battery_level_{0};
    std::optional<int> health_;
    bool has_start_threshold_{false};
    bool supports_force_discharge_{false};
    bool force_discharge_enabled_{false};
    bool force_discharge_in_flight_{false};
    bool missing_helper_{false};

    std::shared_ptr<FileMonitor> threshold_monitor_;
    std::shared_ptr<FileMonitor> force_discharge_monitor_;
    DelayGroup delays_;

    // Captured weakly by continuations; true once destroyed
    std::shared_ptr<bool> destroyed_;
};

} // namespace chargekeeper
