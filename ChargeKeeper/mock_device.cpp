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

#include "mock_device.hpp"

#include "log.hpp"

namespace chargekeeper {

bool MockDevice::initialize() {
    log_info("Initializing mock device %s", name_.c_str());
    return !destroyed_;
}

void MockDevice::set_thresholds(int start, int end, Completion done) {
    log_debug("%s: setting thresholds to %d-%d", name_.c_str(), start, end);
    if (destroyed_ || fail_writes_ || start < 0 || end > 100 || start >= end) {
        done(false);
        return;
    }
    thresholds_ = ThresholdPair{start, end};
    emit_threshold_changed(start, end);
    done(true);
}

void MockDevice::set_force_discharge(bool enabled, Completion done) {
    log_debug("%s: setting force discharge to %s", name_.c_str(), enabled ? "on" : "off");
    if (destroyed_ || fail_writes_ || !supports_force_discharge_) {
        done(false);
        return;
    }
    force_discharge_ = enabled;
    emit_force_discharge_changed(enabled);
    done(true);
}

void MockDevice::simulate_external_change(int start, int end) {
    thresholds_ = ThresholdPair{start, end};
    emit_threshold_changed(start, end);
}

void MockDevice::destroy() {
    if (destroyed_) return;
    destroyed_ = true;
    disconnect_all_signals();
    if (on_destroy_) on_destroy_();
}

} // namespace chargekeeper
