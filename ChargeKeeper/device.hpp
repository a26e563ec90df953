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
// Device capability contract.
//
//   • Thresholds: start/end charge percent, -1 = unknown
//   • Force discharge: optional, see supports_force_discharge()
//   • Health: optional percent of design capacity
//
// Writes are asynchronous and report through a Completion on the event loop
// (validation failures may complete before the call returns).
//
// Notifications:
//   threshold_changed(start, end)
//   force_discharge_changed(enabled)
//   partial_failure(primary, failed)   composites only, failed is ", " joined
//
// Nothing is emitted once destroy() has run.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chargekeeper {

struct ThresholdPair {
    int start{-1};
    int end{-1};

    bool operator==(const ThresholdPair&) const = default;
};

enum class DeviceKind { SYSFS_BATTERY, COMPOSITE, MOCK };

inline const char* to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::SYSFS_BATTERY: return "sysfs";
        case DeviceKind::COMPOSITE: return "composite";
        case DeviceKind::MOCK: return "mock";
    }
    return "unknown";
}

using Completion = std::function<void(bool ok)>;

// Observer list. Slots may connect or disconnect from inside emit().
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using Connection = uint64_t;

    Connection connect(Slot slot) {
        Connection id = next_++;
        slots_[id] = std::make_shared<Slot>(std::move(slot));
        return id;
    }

    void disconnect(Connection id) { slots_.erase(id); }
    void disconnect_all() { slots_.clear(); }
    size_t size() const { return slots_.size(); }

    void emit(Args... args) {
        std::vector<std::pair<Connection, std::shared_ptr<Slot>>> snapshot(slots_.begin(), slots_.end());
        for (auto& [id, slot] : snapshot) {
            if (slots_.count(id) == 0) continue;
            (*slot)(args...);
        }
    }

private:
    Connection next_{1};
    std::map<Connection, std::shared_ptr<Slot>> slots_;
};

class Device {
public:
    virtual ~Device() = default;

    virtual DeviceKind kind() const = 0;
    virtual std::string name() const = 0;

    // Probe control files, read initial values, start monitoring
    virtual bool initialize() = 0;

    virtual ThresholdPair get_thresholds() const = 0;
    virtual void set_thresholds(int start, int end, Completion done) = 0;

    virtual bool get_force_discharge() const = 0;
    virtual void set_force_discharge(bool enabled, Completion done) = 0;

    virtual int get_battery_level() const = 0;
    virtual std::optional<int> get_health() const = 0;

    // Re-read cached state, notifying only on differences
    virtual void refresh_values() = 0;

    // Idempotent. Releases monitors and timers, aborts in-flight writes.
    virtual void destroy() = 0;
    virtual bool destroyed() const = 0;

    virtual bool supports_force_discharge() const = 0;
    virtual bool has_start_threshold() const = 0;
    virtual bool needs_helper() const = 0;

    Signal<int, int>& threshold_changed() { return threshold_changed_; }
    Signal<bool>& force_discharge_changed() { return force_discharge_changed_; }
    Signal<const std::string&, const std::string&>& partial_failure() { return partial_failure_; }

protected:
    void emit_threshold_changed(int start, int end) {
        if (!destroyed()) threshold_changed_.emit(start, end);
    }

    void emit_force_discharge_changed(bool enabled) {
        if (!destroyed()) force_discharge_changed_.emit(enabled);
    }

    void emit_partial_failure(const std::string& primary, const std::string& failed) {
        if (!destroyed()) partial_failure_.emit(primary, failed);
    }

    void disconnect_all_signals() {
        threshold_changed_.disconnect_all();
        force_discharge_changed_.disconnect_all();
        partial_failure_.disconnect_all();
    }

private:
    Signal<int, int> threshold_changed_;
    Signal<bool> force_discharge_changed_;
    Signal<const std::string&, const std::string&> partial_failure_;
};

} // namespace chargekeeper
