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
// Several batteries presented as one device.
//
//   • member 0 is primary for thresholds
//   • the first member supporting force discharge is primary for it
//   • writes fan out to every target and wait for all of them
//   • result is the primary's; other failures go to partial_failure

#pragma once

#include "device.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chargekeeper {

class CompositeDevice : public Device {
public:
    // members: initialized devices in primary-first order. Throws std::invalid_argument if empty.
    explicit CompositeDevice(std::vector<std::unique_ptr<Device>> members);
    ~CompositeDevice() override;

    CompositeDevice(const CompositeDevice&) = delete;
    CompositeDevice& operator=(const CompositeDevice&) = delete;

    DeviceKind kind() const override { return DeviceKind::COMPOSITE; }
    std::string name() const override;

    bool initialize() override;

    ThresholdPair get_thresholds() const override;
    void set_thresholds(int start, int end, Completion done) override;

    bool get_force_discharge() const override;
    void set_force_discharge(bool enabled, Completion done) override;

    int get_battery_level() const override;
    std::optional<int> get_health() const override;

    void refresh_values() override;
    void destroy() override;
    bool destroyed() const override { return *destroyed_; }

    bool supports_force_discharge() const override;
    bool has_start_threshold() const override;
    bool needs_helper() const override;

    size_t size() const { return members_.size(); }
    Device& member(size_t i) { return *members_.at(i); }

private:
    struct Subscription {
        Device* device;
        Signal<int, int>::Connection threshold;
        Signal<bool>::Connection force_discharge;
    };

    Device* force_discharge_primary() const;

    using Issue = std::function<void(Device&, Completion)>;
    void fan_out(const std::vector<Device*>& targets, const Issue& issue, Completion done);

    std::vector<std::unique_ptr<Device>> members_;
    std::vector<Subscription> subscriptions_;
    std::shared_ptr<bool> destroyed_;
};

} // namespace chargekeeper
