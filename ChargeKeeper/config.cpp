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

#include "config.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace chargekeeper {

static bool parse_int_in(const char* s, int lo, int hi, int& out) {
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE) return false;
    if (v < lo || v > hi) return false;
    out = (int)v;
    return true;
}

bool parse_backoff_list(const std::string& s, std::vector<int>& out) {
    std::vector<int> vals;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t comma = s.find(',', pos);
        if (comma == std::string::npos) comma = s.size();
        std::string item = s.substr(pos, comma - pos);
        // trim
        while (!item.empty() && (item.front()==' ' || item.front()=='\t')) item.erase(item.begin());
        while (!item.empty() && (item.back()==' ' || item.back()=='\t')) item.pop_back();
        int v;
        if (!parse_int_in(item.c_str(), 1, 60000, v)) return false;
        vals.push_back(v);
        pos = comma + 1;
    }
    if (vals.empty()) return false;
    out = std::move(vals);
    return true;
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "error") out = LogLevel::ERROR;
    else if (s == "warn" || s == "warning") out = LogLevel::WARN;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "debug") out = LogLevel::DEBUG;
    else return false;
    return true;
}

Config read_config_or_defaults(const std::string& path) {
    Config cfg;

    FILE* f = std::fopen(path.c_str(), "r");
    if (!f) return cfg;

    char line[512];
    while (std::fgets(line, sizeof(line), f)) {
        // strip leading spaces
        char* p = line;
        while (*p==' '||*p=='\t') ++p;
        // skip blanks & comments and section headers
        if (*p=='\0' || *p=='\n' || *p=='#' || *p=='[') continue;

        // key=value
        char* eq = std::strchr(p, '=');
        if (!eq) continue;
        *eq = '\0';
        char* key = p;
        char* val = eq+1;

        // trim trailing key spaces
        for (char* t=key + std::strlen(key); t>key && (t[-1]==' '||t[-1]=='\t'||t[-1]=='\r'||t[-1]=='\n'); --t) t[-1]='\0';
        // trim leading val spaces
        while (*val==' '||*val=='\t') ++val;
        // trim trailing val spaces/newlines
        for (char* t=val + std::strlen(val); t>val && (t[-1]==' '||t[-1]=='\t'||t[-1]=='\r'||t[-1]=='\n'); --t) t[-1]='\0';

        bool ok = true;
        if (std::strcmp(key, "sysfs_root")==0) {
            if (*val) cfg.sysfs_root = val; else ok = false;
        } else if (std::strcmp(key, "helper")==0) {
            if (*val) cfg.helper = val; else ok = false;
        } else if (std::strcmp(key, "use_pkexec")==0) {
            int n;
            ok = parse_int_in(val, 0, 1, n);
            if (ok) cfg.use_pkexec = (n == 1);
        } else if (std::strcmp(key, "helper_timeout")==0) {
            ok = parse_int_in(val, 1, 60, cfg.helper_timeout_s);
        } else if (std::strcmp(key, "helper_queue_depth")==0) {
            ok = parse_int_in(val, 1, 16, cfg.helper_queue_depth);
        } else if (std::strcmp(key, "verify_backoff_ms")==0) {
            ok = parse_backoff_list(val, cfg.verify_backoff_ms);
        } else if (std::strcmp(key, "log_level")==0) {
            ok = parse_log_level(val, cfg.log_level);
        } else {
            log_warn("%s: unknown key '%s'", path.c_str(), key);
        }

        if (!ok) log_warn("%s: bad value for %s: '%s', keeping default", path.c_str(), key, val);
    }
    std::fclose(f);

    return cfg;
}

} // namespace chargekeeper
