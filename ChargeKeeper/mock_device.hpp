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
// In-memory device for development without battery control hardware.
// Selected by discovery when the use_mock marker file exists.

#pragma once

#include "device.hpp"

#include <functional>
#include <string>

namespace chargekeeper {

class MockDevice : public Device {
public:
    explicit MockDevice(std::string name = "MOCK0") : name_(std::move(name)) {}
    ~MockDevice() override { destroy(); }

    DeviceKind kind() const override { return DeviceKind::MOCK; }
    std::string name() const override { return name_; }

    bool initialize() override;

    ThresholdPair get_thresholds() const override { return thresholds_; }
    void set_thresholds(int start, int end, Completion done) override;

    bool get_force_discharge() const override { return force_discharge_; }
    void set_force_discharge(bool enabled, Completion done) override;

    int get_battery_level() const override { return battery_level_; }
    std::optional<int> get_health() const override { return health_; }

    void refresh_values() override {}
    void destroy() override;
    bool destroyed() const override { return destroyed_; }

    bool supports_force_discharge() const override { return supports_force_discharge_; }
    bool has_start_threshold() const override { return true; }
    bool needs_helper() const override { return false; }

    // Knobs for exercising callers
    void simulate_external_change(int start, int end);
    void set_supports_force_discharge(bool v) { supports_force_discharge_ = v; }
    void set_fail_writes(bool v) { fail_writes_ = v; }
    void set_battery_level(int v) { battery_level_ = v; }
    void set_health(std::optional<int> v) { health_ = v; }
    void set_on_destroy(std::function<void()> cb) { on_destroy_ = std::move(cb); }

private:
    std::string name_;
    ThresholdPair thresholds_{60, 80};
    bool force_discharge_{false};
    bool supports_force_discharge_{true};
    bool fail_writes_{false};
    int battery_level_{50};
    std::optional<int> health_;
    bool destroyed_{false};
    std::function<void()> on_destroy_;
};

} // namespace chargekeeper
