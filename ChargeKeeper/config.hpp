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
// /etc/chargekeeper/chargekeeper.conf
//
//   [Config]
//   sysfs_root=/sys/class/power_supply
//   helper=unified-power-ctl
//   use_pkexec=1
//   helper_timeout=5
//   helper_queue_depth=3
//   verify_backoff_ms=50,100,200,400,800,1600
//   log_level=info
//
// Unknown keys and bad values are ignored, keeping the default.

#pragma once

#include "helper.hpp"
#include "log.hpp"
#include "sysfs.hpp"

#include <string>
#include <vector>

namespace chargekeeper {

static constexpr const char* CONFIG_FILE = "/etc/chargekeeper/chargekeeper.conf";

static constexpr int DEFAULT_HELPER_TIMEOUT_S = 5;
static constexpr int DEFAULT_HELPER_QUEUE_DEPTH = 3;

struct Config {
    std::string sysfs_root = SYSFS_POWER_SUPPLY;
    std::string helper = HELPER_BIN_NAME;
    bool use_pkexec = true;
    int helper_timeout_s = DEFAULT_HELPER_TIMEOUT_S;
    int helper_queue_depth = DEFAULT_HELPER_QUEUE_DEPTH;
    std::vector<int> verify_backoff_ms{50, 100, 200, 400, 800, 1600};
    LogLevel log_level = LogLevel::INFO;
};

// Defaults when the file is missing
Config read_config_or_defaults(const std::string& path);

// "50,100,200" -> {50,100,200}; each entry 1..60000 ms
bool parse_backoff_list(const std::string& s, std::vector<int>& out);

bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace chargekeeper
