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

#include "sysfs_battery.hpp"

#include "log.hpp"

#include <cmath>
#include <stdexcept>
#include <system_error>

namespace chargekeeper {

struct SysfsBattery::ThresholdWrite {
    explicit ThresholdWrite(std::weak_ptr<FileMonitor> monitor) : suspension(std::move(monitor)) {}

    int start{-1};
    int end{-1};
    bool emitted{false};
    Completion done;
    MonitorSuspension suspension;
};

struct SysfsBattery::ForceDischargeWrite {
    explicit ForceDischargeWrite(std::weak_ptr<FileMonitor> monitor) : suspension(std::move(monitor)) {}

    bool enabled{false};
    Completion done;
    MonitorSuspension suspension;
};

static std::string first_line(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_first_of("\r\n", b);
    return s.substr(b, e == std::string::npos ? std::string::npos : e - b);
}

// full / design as a percent, nullopt when either is unreadable or design <= 0
static std::optional<int> capacity_ratio(const fs::path& full_path, const fs::path& design_path) {
    auto full = slurp_int(full_path);
    auto design = slurp_int(design_path);
    if (!full || !design || *design <= 0) return std::nullopt;
    double pct = 100.0 * static_cast<double>(*full) / static_cast<double>(*design);
    return clampi(static_cast<int>(std::lround(pct)), 0, 100);
}

// ========================= Construction =========================
SysfsBattery::SysfsBattery(fs::path battery_path, EventLoop& loop, HelperRunner& helper, ControllerOptions opts)
    : sysfs_path_(std::move(battery_path)),
      loop_(loop),
      helper_(helper),
      opts_(std::move(opts)),
      delays_(loop),
      destroyed_(std::make_shared<bool>(false)) {
    if (sysfs_path_.empty() || !sysfs_path_.has_filename())
        throw std::invalid_argument("invalid battery path '" + sysfs_path_.string() + "'");

    battery_name_ = sysfs_path_.filename().string();
    if (!is_valid_battery_name(battery_name_))
        throw std::invalid_argument("invalid battery name '" + battery_name_ + "'");

    capacity_path_ = sysfs_path_ / CAPACITY_FILE;
    behaviour_path_ = sysfs_path_ / BEHAVIOUR_FILE;
    energy_full_path_ = sysfs_path_ / ENERGY_FULL_FILE;
    energy_full_design_path_ = sysfs_path_ / ENERGY_FULL_DESIGN_FILE;
    charge_full_path_ = sysfs_path_ / CHARGE_FULL_FILE;
    charge_full_design_path_ = sysfs_path_ / CHARGE_FULL_DESIGN_FILE;
}

SysfsBattery::~SysfsBattery() {
    destroy();
}

bool SysfsBattery::is_supported(const fs::path& battery_path) {
    for (const char* f : THRESHOLD_END_FILES) {
        if (file_exists(battery_path / f)) return true;
    }
    return false;
}

bool SysfsBattery::initialize() {
    if (*destroyed_) return false;

    for (const char* f : THRESHOLD_END_FILES) {
        if (file_exists(sysfs_path_ / f)) { end_path_ = sysfs_path_ / f; break; }
    }
    // end threshold is the minimum for support
    if (end_path_.empty()) {
        log_debug("%s: no end threshold control file", battery_name_.c_str());
        return false;
    }

    for (const char* f : THRESHOLD_START_FILES) {
        if (file_exists(sysfs_path_ / f)) { start_path_ = sysfs_path_ / f; break; }
    }
    has_start_threshold_ = !start_path_.empty();

    missing_helper_ = !helper_.available();
    if (missing_helper_)
        log_info("%s helper not found, battery control will be read-only", HELPER_BIN_NAME);

    supports_force_discharge_ = file_exists(behaviour_path_);

    // initial values, nobody to notify yet
    sync_thresholds(false);
    read_level_and_health();
    if (supports_force_discharge_) sync_force_discharge(false);

    init_monitoring();

    log_debug("%s: end=%d start=%d force_discharge=%s", battery_name_.c_str(), cache_.end, cache_.start,
              supports_force_discharge_ ? "yes" : "no");
    return true;
}

void SysfsBattery::init_monitoring() {
    if (!threshold_monitor_) {
        try {
            threshold_monitor_ = std::make_shared<FileMonitor>(loop_, end_path_.string());
            threshold_monitor_->set_callback([this]() {
                // may still be queued when destroy() runs
                if (*destroyed_) return;
                sync_thresholds(true);
            });
        } catch (const std::system_error& e) {
            log_error("Failed to initialize threshold monitor for %s: %s", battery_name_.c_str(), e.what());
        }
    }

    if (supports_force_discharge_ && !force_discharge_monitor_) {
        try {
            force_discharge_monitor_ = std::make_shared<FileMonitor>(loop_, behaviour_path_.string());
            force_discharge_monitor_->set_callback([this]() {
                if (*destroyed_) return;
                sync_force_discharge(true);
            });
        } catch (const std::system_error& e) {
            log_error("Failed to initialize force discharge monitor for %s: %s", battery_name_.c_str(), e.what());
        }
    }
}

// ========================= State sync =========================
bool SysfsBattery::sync_thresholds(bool notify) {
    auto end = slurp_int(end_path_);
    if (!end) return false;

    ThresholdPair next = cache_;
    next.end = *end;
    if (has_start_threshold_) {
        if (auto start = slurp_int(start_path_)) next.start = *start;
    }

    if (next == cache_) return false;
    cache_ = next;
    if (notify) emit_threshold_changed(cache_.start, cache_.end);
    return notify;
}

std::optional<bool> SysfsBattery::read_force_discharge() const {
    auto behaviour = slurp(behaviour_path_);
    if (!behaviour || behaviour->empty()) return std::nullopt;
    return is_force_discharge_active(*behaviour);
}

bool SysfsBattery::sync_force_discharge(bool notify) {
    auto state = read_force_discharge();
    if (!state || *state == force_discharge_enabled_) return false;
    force_discharge_enabled_ = *state;
    if (notify) emit_force_discharge_changed(force_discharge_enabled_);
    return notify;
}

void SysfsBattery::read_level_and_health() {
    if (auto level = slurp_int(capacity_path_)) battery_level_ = clampi(*level, 0, 100);

    // drivers expose either the energy or the charge family
    health_ = capacity_ratio(energy_full_path_, energy_full_design_path_);
    if (!health_) health_ = capacity_ratio(charge_full_path_, charge_full_design_path_);
}

void SysfsBattery::refresh_values() {
    if (*destroyed_) return;
    sync_thresholds(true);
    read_level_and_health();
    if (supports_force_discharge_) sync_force_discharge(true);
}

// ========================= Thresholds =========================
void SysfsBattery::set_thresholds(int start, int end, Completion done) {
    if (*destroyed_ || missing_helper_) {
        done(false);
        return;
    }
    if (start < 0 || start > 100 || end < 0 || end > 100) {
        log_debug("%s: thresholds %d-%d out of range", battery_name_.c_str(), start, end);
        done(false);
        return;
    }
    if (has_start_threshold_ && start >= end) {
        log_debug("%s: start threshold %d must be below end %d", battery_name_.c_str(), start, end);
        done(false);
        return;
    }

    auto op = std::make_shared<ThresholdWrite>(threshold_monitor_);
    op->start = start;
    op->end = end;
    op->done = std::move(done);

    std::string command;
    std::vector<std::string> args;
    if (has_start_threshold_) {
        // Order against what is on disk now: raising start past the current
        // end must move end first so start < end holds between the writes
        int current_end = slurp_int(end_path_).value_or(cache_.end);
        command = battery_name_ + (start >= current_end ? "_END_START" : "_START_END");
        args = {std::to_string(end), std::to_string(start)};
    } else {
        command = battery_name_ + "_END";
        args = {std::to_string(end)};
    }

    std::weak_ptr<bool> life = destroyed_;
    helper_.run(command, args, [this, life, op](const HelperResult& r) {
        auto dead = life.lock();
        if (!dead || *dead) {
            op->done(false);
            return;
        }
        on_threshold_write_done(op, r);
    });
}

void SysfsBattery::on_threshold_write_done(const std::shared_ptr<ThresholdWrite>& op, const HelperResult& r) {
    bool ok = false;

    switch (r.status) {
        case HelperStatus::SUCCESS:
            cache_.end = slurp_int(end_path_).value_or(op->end);
            if (has_start_threshold_) cache_.start = slurp_int(start_path_).value_or(op->start);
            emit_threshold_changed(cache_.start, cache_.end);
            op->emitted = true;
            ok = true;
            break;
        case HelperStatus::PRIVILEGE_REQUIRED:
            log_error("Privilege required - polkit rules may not be configured. Run install-helper.sh");
            break;
        case HelperStatus::COMMAND_NOT_FOUND:
            log_error("Failed to set thresholds for %s: %s could not be executed", battery_name_.c_str(), HELPER_BIN_NAME);
            break;
        default: {
            std::string detail = first_line(r.err);
            log_error("Failed to set thresholds for %s: %s", battery_name_.c_str(),
                      detail.empty() ? to_string(r.status) : detail.c_str());
            break;
        }
    }

    op->suspension.release();
    // catch an external write that raced with ours
    if (!op->emitted) sync_thresholds(true);

    op->done(ok);
}

// ========================= Force discharge =========================
void SysfsBattery::set_force_discharge(bool enabled, Completion done) {
    if (*destroyed_) {
        done(false);
        return;
    }
    if (!supports_force_discharge_ || missing_helper_) {
        log_debug("%s: force discharge unavailable", battery_name_.c_str());
        done(false);
        return;
    }
    if (force_discharge_in_flight_) {
        log_debug("%s: force discharge write already in flight", battery_name_.c_str());
        done(false);
        return;
    }

    force_discharge_in_flight_ = true;
    auto op = std::make_shared<ForceDischargeWrite>(force_discharge_monitor_);
    op->enabled = enabled;
    op->done = std::move(done);

    std::weak_ptr<bool> life = destroyed_;
    helper_.run("FORCE_DISCHARGE_" + battery_name_, {enabled ? "force-discharge" : "auto"},
                [this, life, op](const HelperResult& r) {
        auto dead = life.lock();
        if (!dead || *dead) {
            op->done(false);
            return;
        }
        if (r.status == HelperStatus::SUCCESS) {
            verify_force_discharge(op, 0);
            return;
        }

        if (r.status == HelperStatus::PRIVILEGE_REQUIRED) {
            log_error("Privilege required - polkit rules may not be configured. Run install-helper.sh");
        } else {
            std::string detail = first_line(r.err);
            log_error("Failed to set force discharge for %s: %s", battery_name_.c_str(),
                      detail.empty() ? to_string(r.status) : detail.c_str());
        }
        finish_force_discharge(op, false);
    });
}

void SysfsBattery::verify_force_discharge(const std::shared_ptr<ForceDischargeWrite>& op, size_t attempt) {
    auto state = read_force_discharge();
    if (state && *state == op->enabled) {
        force_discharge_enabled_ = op->enabled;
        emit_force_discharge_changed(op->enabled);
        finish_force_discharge(op, true);
        return;
    }

    const auto& delays = opts_.verify_backoff_ms;
    if (attempt >= delays.size()) {
        revert_force_discharge(op);
        return;
    }

    std::weak_ptr<bool> life = destroyed_;
    delays_.start(delays[attempt], [this, life, op, attempt](bool cancelled) {
        auto dead = life.lock();
        if (cancelled || !dead || *dead) {
            op->done(false);
            return;
        }
        // the read after the last delay still counts
        verify_force_discharge(op, attempt + 1);
    });
}

void SysfsBattery::revert_force_discharge(const std::shared_ptr<ForceDischargeWrite>& op) {
    log_warn("Force discharge write for %s succeeded but verification failed. Reverting state.", battery_name_.c_str());
    // report what the hardware actually reached, not what was asked for
    sync_force_discharge(false);
    emit_force_discharge_changed(force_discharge_enabled_);
    finish_force_discharge(op, false);
}

void SysfsBattery::finish_force_discharge(const std::shared_ptr<ForceDischargeWrite>& op, bool ok) {
    force_discharge_in_flight_ = false;
    op->suspension.release();
    sync_force_discharge(true);
    op->done(ok);
}

// ========================= Teardown =========================
void SysfsBattery::destroy() {
    if (*destroyed_) return;
    *destroyed_ = true;

    if (threshold_monitor_) {
        threshold_monitor_->cancel();
        threshold_monitor_.reset();
    }
    if (force_discharge_monitor_) {
        force_discharge_monitor_->cancel();
        force_discharge_monitor_.reset();
    }

    // backoff waiters wake with cancelled == true and bail out
    delays_.cancel_all();
    disconnect_all_signals();
}

} // namespace chargekeeper
