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

#include "composite_device.hpp"

#include "log.hpp"

#include <cmath>
#include <stdexcept>

namespace chargekeeper {

CompositeDevice::CompositeDevice(std::vector<std::unique_ptr<Device>> members)
    : members_(std::move(members)), destroyed_(std::make_shared<bool>(false)) {
    if (members_.empty()) throw std::invalid_argument("composite device needs at least one member");

    for (size_t i = 0; i < members_.size(); ++i) {
        Device* dev = members_[i].get();
        Subscription sub{dev, 0, 0};

        // Members are written together, so the primary speaks for all of them
        sub.threshold = dev->threshold_changed().connect([this, i](int start, int end) {
            if (i == 0) emit_threshold_changed(start, end);
        });

        // Support is not universal: resolve the primary when the event arrives
        sub.force_discharge = dev->force_discharge_changed().connect([this, dev](bool enabled) {
            if (dev == force_discharge_primary()) emit_force_discharge_changed(enabled);
        });

        subscriptions_.push_back(sub);
    }
}

CompositeDevice::~CompositeDevice() {
    destroy();
}

std::string CompositeDevice::name() const {
    return members_.empty() ? std::string{} : members_.front()->name();
}

bool CompositeDevice::initialize() {
    // members arrive initialized
    return !*destroyed_ && !members_.empty();
}

Device* CompositeDevice::force_discharge_primary() const {
    for (const auto& m : members_) {
        if (m->supports_force_discharge()) return m.get();
    }
    return nullptr;
}

ThresholdPair CompositeDevice::get_thresholds() const {
    if (members_.empty()) return ThresholdPair{};
    return members_.front()->get_thresholds();
}

void CompositeDevice::fan_out(const std::vector<Device*>& targets, const Issue& issue, Completion done) {
    struct Gather {
        std::vector<std::string> names;
        std::vector<bool> results;
        size_t remaining{0};
        Completion done;
    };

    auto g = std::make_shared<Gather>();
    for (Device* d : targets) g->names.push_back(d->name());
    g->results.assign(targets.size(), false);
    g->remaining = targets.size();
    g->done = std::move(done);

    std::weak_ptr<bool> life = destroyed_;
    for (size_t i = 0; i < targets.size(); ++i) {
        // one member failing never stops the others
        issue(*targets[i], [this, life, g, i](bool ok) {
            g->results[i] = ok;
            if (--g->remaining > 0) return;

            auto dead = life.lock();
            if (!dead || *dead) {
                g->done(false);
                return;
            }

            std::string failed;
            for (size_t j = 1; j < g->results.size(); ++j) {
                if (g->results[j]) continue;
                if (!failed.empty()) failed += ", ";
                failed += g->names[j];
            }
            if (!failed.empty()) {
                log_warn("Partial failure: %s %s, failed: %s", g->names[0].c_str(),
                         g->results[0] ? "succeeded" : "failed", failed.c_str());
                emit_partial_failure(g->names[0], failed);
            }

            g->done(g->results[0]);
        });
    }
}

void CompositeDevice::set_thresholds(int start, int end, Completion done) {
    if (*destroyed_ || members_.empty()) {
        done(false);
        return;
    }

    std::vector<Device*> targets;
    for (auto& m : members_) targets.push_back(m.get());

    fan_out(targets, [start, end](Device& d, Completion c) {
        d.set_thresholds(start, end, std::move(c));
    }, std::move(done));
}

bool CompositeDevice::get_force_discharge() const {
    Device* primary = force_discharge_primary();
    return primary ? primary->get_force_discharge() : false;
}

void CompositeDevice::set_force_discharge(bool enabled, Completion done) {
    if (*destroyed_) {
        done(false);
        return;
    }

    std::vector<Device*> targets;
    for (auto& m : members_) {
        if (m->supports_force_discharge()) targets.push_back(m.get());
    }
    if (targets.empty()) {
        log_debug("No member battery supports force discharge");
        done(false);
        return;
    }

    fan_out(targets, [enabled](Device& d, Completion c) {
        d.set_force_discharge(enabled, std::move(c));
    }, std::move(done));
}

int CompositeDevice::get_battery_level() const {
    if (members_.empty()) return 0;
    double sum = 0;
    for (const auto& m : members_) sum += m->get_battery_level();
    return static_cast<int>(std::lround(sum / members_.size()));
}

std::optional<int> CompositeDevice::get_health() const {
    double sum = 0;
    int known = 0;
    for (const auto& m : members_) {
        if (auto h = m->get_health()) {
            sum += *h;
            ++known;
        }
    }
    if (known == 0) return std::nullopt;
    return static_cast<int>(std::lround(sum / known));
}

void CompositeDevice::refresh_values() {
    if (*destroyed_) return;
    for (auto& m : members_) m->refresh_values();
}

bool CompositeDevice::supports_force_discharge() const {
    return force_discharge_primary() != nullptr;
}

bool CompositeDevice::has_start_threshold() const {
    return !members_.empty() && members_.front()->has_start_threshold();
}

bool CompositeDevice::needs_helper() const {
    // any read-only member degrades the whole set
    for (const auto& m : members_) {
        if (m->needs_helper()) return true;
    }
    return false;
}

void CompositeDevice::destroy() {
    if (*destroyed_) return;
    *destroyed_ = true;

    for (auto& sub : subscriptions_) {
        sub.device->threshold_changed().disconnect(sub.threshold);
        sub.device->force_discharge_changed().disconnect(sub.force_discharge);
    }
    subscriptions_.clear();

    for (auto& m : members_) m->destroy();
    members_.clear();
    disconnect_all_signals();
}

} // namespace chargekeeper
