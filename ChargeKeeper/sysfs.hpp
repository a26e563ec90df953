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

#include <array>
#include <filesystem>
#include <optional>
#include <string>

namespace chargekeeper {

namespace fs = std::filesystem;

// ========================= Paths and file names =========================
static constexpr const char* SYSFS_POWER_SUPPLY = "/sys/class/power_supply";

// Probed in order, first match wins
static constexpr std::array<const char*, 2> THRESHOLD_END_FILES = {
    "charge_control_end_threshold", "stop_charge_thresh"
};
static constexpr std::array<const char*, 2> THRESHOLD_START_FILES = {
    "charge_control_start_threshold", "start_charge_thresh"
};

static constexpr const char* CAPACITY_FILE = "capacity";
static constexpr const char* BEHAVIOUR_FILE = "charge_behaviour";
static constexpr const char* ENERGY_FULL_FILE = "energy_full";
static constexpr const char* ENERGY_FULL_DESIGN_FILE = "energy_full_design";
static constexpr const char* CHARGE_FULL_FILE = "charge_full";
static constexpr const char* CHARGE_FULL_DESIGN_FILE = "charge_full_design";

// ========================= Reads =========================
// First line with trailing whitespace stripped
std::optional<std::string> slurp(const fs::path& p);
std::optional<int> slurp_int(const fs::path& p);

bool file_exists(const fs::path& p);

// ========================= Parsing =========================
// [A-Za-z0-9_]+, the only names allowed into helper command tokens
bool is_valid_battery_name(const std::string& name);

// "auto [force-discharge]" or a lone "force-discharge"
bool is_force_discharge_active(const std::string& behaviour);

// BAT0 < BAT1 < BAT2 < BAT10
bool natural_less(const std::string& a, const std::string& b);

inline int clampi(int v, int lo, int hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

} // namespace chargekeeper
