#include <catch2/catch_test_macros.hpp>
#include "mem/memory_manager.hpp"
#include "test_support.hpp"
#include <thread>

using namespace vmm::mem;
using namespace std::chrono_literals;

TEST_CASE("Monitor reports process memory above the warning threshold", "[monitor]") {
    auto probe = std::make_shared<vmm::test::FakeMemoryProbe>(850, 1000);
    MemoryManager m(vmm::test::small_config(), probe);
    vmm::test::EventRecorder events(m.events());

    auto sample = m.usage_monitor().sample_once();
    REQUIRE(sample.process_warning);
    REQUIRE_FALSE(sample.process_critical);
    REQUIRE(sample.warning_bytes == 800);
    REQUIRE(events.saw("memory_warning", warnings::kProcessMemory));

    events.clear();
    probe->set_resident(990);
    sample = m.usage_monitor().sample_once();
    REQUIRE(sample.process_critical);
    REQUIRE(events.saw("memory_warning", warnings::kProcessMemoryCritical));
    REQUIRE_FALSE(events.saw("memory_warning", warnings::kProcessMemory));
}

TEST_CASE("Monitor stays quiet below thresholds", "[monitor]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    vmm::test::EventRecorder events(m.events());
    REQUIRE(m.allocate(pools::kPreviewCache, 500).has_value());

    auto sample = m.usage_monitor().sample_once();
    REQUIRE_FALSE(sample.process_warning);
    REQUIRE_FALSE(sample.global_warning);
    REQUIRE(sample.overflowing_pools.empty());
    REQUIRE(events.all().empty());
    REQUIRE(m.usage_monitor().last_sample().has_value());
}

TEST_CASE("Monitor flags pools above the overflow ratio without touching them", "[monitor]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    vmm::test::EventRecorder events(m.events());
    for (int i = 0; i < 19; ++i) {
        REQUIRE(m.allocate(pools::kPreviewCache, 50, nullptr, Priority::Low).has_value());
    }

    const auto before = m.counters();
    auto sample = m.usage_monitor().sample_once();
    REQUIRE(sample.overflowing_pools == std::vector<std::string>{pools::kPreviewCache});
    REQUIRE(events.saw("pool_overflow", pools::kPreviewCache));
    REQUIRE(m.pool_info(pools::kPreviewCache)->used == 950);
    REQUIRE(m.counters().evictions == before.evictions);
}

TEST_CASE("Monitor warns when managed usage nears the global limit", "[monitor]") {
    auto config = vmm::test::small_config();
    config.global_memory_limit = 1000;
    MemoryManager m(config, vmm::test::quiet_probe());
    vmm::test::EventRecorder events(m.events());
    REQUIRE(m.allocate(pools::kVideoFrames, 500).has_value());
    REQUIRE(m.allocate(pools::kAiModels, 400).has_value());

    auto sample = m.usage_monitor().sample_once();
    REQUIRE(sample.global_warning);
    REQUIRE(sample.managed_total == 900);
    REQUIRE(events.saw("memory_warning", warnings::kGlobalUsage));
}

TEST_CASE("Monitoring start and stop are idempotent", "[monitor]") {
    auto config = vmm::test::small_config();
    config.auto_cleanup_enabled = false;
    MemoryManager m(config, vmm::test::quiet_probe());

    m.start_monitoring();
    m.start_monitoring();
    REQUIRE(m.monitoring_active());
    REQUIRE(m.usage_monitor().running());
    REQUIRE_FALSE(m.cleanup_scheduler().running());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (m.usage_monitor().tick_count() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(m.usage_monitor().tick_count() > 0);

    m.stop_monitoring();
    m.stop_monitoring();
    REQUIRE_FALSE(m.monitoring_active());
}
