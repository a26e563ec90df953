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
// Multi-battery aggregation over mock members

#undef NDEBUG
#include "composite_device.hpp"
#include "log.hpp"
#include "mock_device.hpp"
#include "sysfs_battery.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace chargekeeper;
using namespace chargekeeper::test;

struct Trio {
    MockDevice* m0;
    MockDevice* m1;
    MockDevice* m2;
    std::unique_ptr<CompositeDevice> composite;
};

static Trio make_trio() {
    auto a = std::make_unique<MockDevice>("BAT0");
    auto b = std::make_unique<MockDevice>("BAT1");
    auto c = std::make_unique<MockDevice>("BAT2");
    Trio t{ a.get(), b.get(), c.get(), nullptr };

    std::vector<std::unique_ptr<Device>> members;
    members.push_back(std::move(a));
    members.push_back(std::move(b));
    members.push_back(std::move(c));
    t.composite = std::make_unique<CompositeDevice>(std::move(members));
    return t;
}

bool test_empty_composite() {
    std::cout << "Testing empty composite..." << std::flush;

    bool threw = false;
    try {
        CompositeDevice dev(std::vector<std::unique_ptr<Device>>{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASS\n";
    return true;
}

bool test_primary_view() {
    std::cout << "Testing primary member view..." << std::flush;

    Trio t = make_trio();
    CompositeDevice& dev = *t.composite;

    assert(dev.kind() == DeviceKind::COMPOSITE);
    assert(dev.name() == "BAT0");
    assert(dev.size() == 3);
    assert(dev.initialize());
    assert((dev.get_thresholds() == ThresholdPair{ 60, 80 }));

    std::vector<ThresholdPair> seen;
    dev.threshold_changed().connect([&](int s, int e) { seen.push_back({ s, e }); });

    // only the primary speaks for the set
    t.m1->simulate_external_change(10, 20);
    assert(seen.empty());
    t.m0->simulate_external_change(30, 40);
    assert(seen.size() == 1);
    assert((seen[0] == ThresholdPair{ 30, 40 }));
    assert((dev.get_thresholds() == ThresholdPair{ 30, 40 }));

    std::cout << " PASS\n";
    return true;
}

bool test_fan_out_success() {
    std::cout << "Testing fan-out write..." << std::flush;

    Trio t = make_trio();
    CompositeDevice& dev = *t.composite;

    int notified = 0;
    int partial = 0;
    dev.threshold_changed().connect([&](int, int) { ++notified; });
    dev.partial_failure().connect([&](const std::string&, const std::string&) { ++partial; });

    bool called = false, ok = false;
    dev.set_thresholds(40, 60, [&](bool r) { called = true; ok = r; });
    assert(called && ok);
    assert(notified == 1);
    assert(partial == 0);
    assert((t.m0->get_thresholds() == ThresholdPair{ 40, 60 }));
    assert((t.m1->get_thresholds() == ThresholdPair{ 40, 60 }));
    assert((t.m2->get_thresholds() == ThresholdPair{ 40, 60 }));

    std::cout << " PASS\n";
    return true;
}

bool test_partial_failure() {
    std::cout << "Testing partial failure..." << std::flush;

    Trio t = make_trio();
    CompositeDevice& dev = *t.composite;
    t.m1->set_fail_writes(true);
    t.m2->set_fail_writes(true);

    std::vector<std::pair<std::string, std::string>> reports;
    dev.partial_failure().connect([&](const std::string& p, const std::string& f) { reports.emplace_back(p, f); });

    bool called = false, ok = false;
    dev.set_thresholds(40, 60, [&](bool r) { called = true; ok = r; });
    assert(called);
    assert(ok); // primary decides
    assert(reports.size() == 1);
    assert(reports[0].first == "BAT0");
    assert(reports[0].second == "BAT1, BAT2");
    assert((t.m0->get_thresholds() == ThresholdPair{ 40, 60 }));
    assert((t.m1->get_thresholds() == ThresholdPair{ 60, 80 }));

    // primary failing fails the whole write, members still attempted
    t.m0->set_fail_writes(true);
    t.m1->set_fail_writes(false);
    reports.clear();
    called = false;
    dev.set_thresholds(20, 50, [&](bool r) { called = true; ok = r; });
    assert(called && !ok);
    assert((t.m1->get_thresholds() == ThresholdPair{ 20, 50 }));
    assert(reports.size() == 1 && reports[0].second == "BAT2");

    std::cout << " PASS\n";
    return true;
}

bool test_force_discharge_primary() {
    std::cout << "Testing force discharge primary..." << std::flush;

    Trio t = make_trio();
    CompositeDevice& dev = *t.composite;
    t.m0->set_supports_force_discharge(false);

    assert(dev.supports_force_discharge());

    std::vector<bool> seen;
    dev.force_discharge_changed().connect([&](bool on) { seen.push_back(on); });

    bool called = false, ok = false;
    dev.set_force_discharge(true, [&](bool r) { called = true; ok = r; });
    assert(called && ok);
    assert(!t.m0->get_force_discharge()); // never asked
    assert(t.m1->get_force_discharge());
    assert(t.m2->get_force_discharge());
    assert(dev.get_force_discharge());
    // BAT1 is the first supporting member; BAT2 stays quiet
    assert((seen == std::vector<bool>{ true }));

    t.m1->set_supports_force_discharge(false);
    t.m2->set_supports_force_discharge(false);
    assert(!dev.supports_force_discharge());
    assert(!dev.get_force_discharge());
    called = false;
    dev.set_force_discharge(false, [&](bool r) { called = true; ok = r; });
    assert(called && !ok);

    std::cout << " PASS\n";
    return true;
}

bool test_aggregates() {
    std::cout << "Testing level and health aggregation..." << std::flush;

    Trio t = make_trio();
    CompositeDevice& dev = *t.composite;

    t.m0->set_battery_level(50);
    t.m1->set_battery_level(61);
    t.m2->set_battery_level(70);
    assert(dev.get_battery_level() == 60); // 181 / 3 rounds to 60

    assert(!dev.get_health());
    t.m0->set_health(80);
    t.m2->set_health(91);
    assert(dev.get_health() == 86); // unknown members skipped, 85.5 rounds up

    assert(dev.has_start_threshold());
    assert(!dev.needs_helper());

    std::cout << " PASS\n";
    return true;
}

bool test_destroy_cascades_once() {
    std::cout << "Testing destroy cascade..." << std::flush;

    Trio t = make_trio();
    int destroyed = 0;
    t.m0->set_on_destroy([&]() { ++destroyed; });
    t.m1->set_on_destroy([&]() { ++destroyed; });
    t.m2->set_on_destroy([&]() { ++destroyed; });

    int notified = 0;
    t.composite->threshold_changed().connect([&](int, int) { ++notified; });

    t.composite->destroy();
    t.composite->destroy();
    assert(destroyed == 3);
    assert(t.composite->destroyed());
    assert(t.composite->size() == 0);

    bool called = false, ok = true;
    t.composite->set_thresholds(40, 60, [&](bool r) { called = true; ok = r; });
    assert(called && !ok);
    assert(notified == 0);

    t.composite.reset();
    assert(destroyed == 3);

    std::cout << " PASS\n";
    return true;
}

bool test_composite_over_sysfs() {
    std::cout << "Testing composite over sysfs batteries..." << std::flush;

    TempDir tmp;
    BatteryLayout layout;
    make_battery(tmp.path(), "BAT0", layout);
    layout.start = -1;
    layout.end = 90;
    make_battery(tmp.path(), "BAT1", layout);

    EventLoop loop;
    FakeHelperRunner helper(loop, tmp.path());
    auto b0 = std::make_unique<SysfsBattery>(tmp.path() / "BAT0", loop, helper);
    auto b1 = std::make_unique<SysfsBattery>(tmp.path() / "BAT1", loop, helper);
    assert(b0->initialize());
    assert(b1->initialize());

    std::vector<std::unique_ptr<Device>> members;
    members.push_back(std::move(b0));
    members.push_back(std::move(b1));
    CompositeDevice dev(std::move(members));
    assert(dev.has_start_threshold());

    int notified = 0;
    dev.threshold_changed().connect([&](int, int) { ++notified; });

    bool called = false, ok = false;
    dev.set_thresholds(85, 95, [&](bool r) { called = true; ok = r; });
    assert(!called); // members answer from the loop
    assert(loop.run_until([&]() { return called; }, 2000));
    assert(ok);
    assert(notified == 1);
    assert(helper.commands.size() == 2);
    assert(helper.commands[0] == "BAT0_END_START 95 85");
    assert(helper.commands[1] == "BAT1_END 95");
    assert((dev.get_thresholds() == ThresholdPair{ 85, 95 }));

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "CHARGEKEEPER COMPOSITE TESTS\n";
    std::cout << "============================================================================\n\n";

    set_log_level(LogLevel::ERROR);

    try {
        bool all_passed = true;

        all_passed &= test_empty_composite();
        all_passed &= test_primary_view();
        all_passed &= test_fan_out_success();
        all_passed &= test_partial_failure();
        all_passed &= test_force_discharge_primary();
        all_passed &= test_aggregates();
        all_passed &= test_destroy_cascades_once();
        all_passed &= test_composite_over_sysfs();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "All composite tests PASSED\n";
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
