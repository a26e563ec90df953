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
// Privileged helper runner, driven with a stand-in shell script

#undef NDEBUG
#include "helper.hpp"
#include "log.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace chargekeeper;
using namespace chargekeeper::test;

static fs::path make_script(const fs::path& dir) {
    fs::path p = dir / "fake-power-ctl";
    write_file(p,
        "#!/bin/sh\n"
        "case \"$1\" in\n"
        "  ok) echo \"applied $2 $3\"; exit 0 ;;\n"
        "  deny) exit 126 ;;\n"
        "  missing) exit 127 ;;\n"
        "  fail) echo \"write error\" >&2; exit 3 ;;\n"
        "  hang) exec sleep 30 ;;\n"
        "esac\n"
        "exit 1");
    fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return p;
}

static HelperOptions direct(const fs::path& script) {
    HelperOptions o;
    o.name = script.string();
    o.use_pkexec = false;
    o.timeout_s = 1;
    o.max_queue_depth = 3;
    return o;
}

bool test_exit_codes() {
    std::cout << "Testing exit code classification..." << std::flush;

    assert(classify_exit_code(0) == HelperStatus::SUCCESS);
    assert(classify_exit_code(126) == HelperStatus::PRIVILEGE_REQUIRED);
    assert(classify_exit_code(127) == HelperStatus::COMMAND_NOT_FOUND);
    assert(classify_exit_code(1) == HelperStatus::FAILURE);
    assert(classify_exit_code(255) == HelperStatus::FAILURE);
    assert(std::string(to_string(HelperStatus::TIMEOUT)) == "timeout");

    std::cout << " PASS\n";
    return true;
}

bool test_find_program() {
    std::cout << "Testing helper lookup..." << std::flush;

    TempDir tmp;
    fs::path script = make_script(tmp.path());
    assert(find_program(script.string()) == script.string());
    assert(find_program((tmp.path() / "nope").string()).empty());
    assert(find_program("").empty());
    assert(!find_program("sh").empty());

    EventLoop loop;
    HelperOptions o = direct(tmp.path() / "nope");
    ProcessHelperRunner runner(loop, o);
    assert(!runner.available());

    bool called = false;
    HelperResult got;
    runner.run("ok", {}, [&](const HelperResult& r) { called = true; got = r; });
    assert(!called); // never from inside run()
    assert(loop.run_until([&]() { return called; }, 1000));
    assert(got.status == HelperStatus::COMMAND_NOT_FOUND);

    std::cout << " PASS\n";
    return true;
}

bool test_run_results() {
    std::cout << "Testing helper results..." << std::flush;

    TempDir tmp;
    EventLoop loop;
    ProcessHelperRunner runner(loop, direct(make_script(tmp.path())));
    assert(runner.available());

    std::vector<HelperResult> results;
    auto collect = [&](const HelperResult& r) { results.push_back(r); };

    runner.run("ok", { "80", "75" }, collect);
    runner.run("deny", {}, collect);
    runner.run("fail", {}, collect);
    assert(runner.depth() == 3);
    assert(loop.run_until([&]() { return results.size() == 3; }, 5000));
    assert(runner.depth() == 0);

    // queued commands run one at a time, in order
    assert(results[0].status == HelperStatus::SUCCESS);
    assert(results[0].exit_code == 0);
    assert(results[0].out == "applied 80 75\n");
    assert(results[1].status == HelperStatus::PRIVILEGE_REQUIRED);
    assert(results[2].status == HelperStatus::FAILURE);
    assert(results[2].exit_code == 3);
    assert(results[2].err == "write error\n");

    std::cout << " PASS\n";
    return true;
}

bool test_queue_limit_and_timeout() {
    std::cout << "Testing queue limit and timeout..." << std::flush;

    TempDir tmp;
    EventLoop loop;
    HelperOptions o = direct(make_script(tmp.path()));
    o.max_queue_depth = 2;
    ProcessHelperRunner runner(loop, o);

    std::vector<std::string> order;
    std::vector<HelperResult> results;
    auto tagged = [&](const std::string& tag) {
        return [&, tag](const HelperResult& r) { order.push_back(tag); results.push_back(r); };
    };

    runner.run("hang", {}, tagged("hang"));
    runner.run("ok", {}, tagged("ok"));
    runner.run("ok", {}, tagged("rejected"));
    assert(runner.depth() == 2);

    assert(loop.run_until([&]() { return results.size() == 3; }, 5000));
    assert((order == std::vector<std::string>{ "rejected", "hang", "ok" }));
    assert(results[0].status == HelperStatus::FAILURE);
    assert(results[0].err.find("queue full") != std::string::npos);
    assert(results[1].status == HelperStatus::TIMEOUT);
    assert(results[2].status == HelperStatus::SUCCESS);
    assert(loop.timer_count() == 0);

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "CHARGEKEEPER HELPER TESTS\n";
    std::cout << "============================================================================\n\n";

    set_log_level(LogLevel::ERROR);

    try {
        bool all_passed = true;

        all_passed &= test_exit_codes();
        all_passed &= test_find_program();
        all_passed &= test_run_results();
        all_passed &= test_queue_limit_and_timeout();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "All helper tests PASSED\n";
        } else {
            std::cout << "Some tests FAILED\n";
            return 1;
        }
        std::cout << "============================================================================\n";

    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
