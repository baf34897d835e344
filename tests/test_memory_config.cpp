#include <catch2/catch_test_macros.hpp>
#include "mem/memory_config.hpp"
#include "mem/memory_manager.hpp"
#include "test_support.hpp"
#include <limits>
#include <stdexcept>

using namespace vmm::mem;

TEST_CASE("Default config describes the stock registry", "[config]") {
    auto config = default_memory_config();
    REQUIRE(config.pools.size() == 6);
    REQUIRE(validate_config(config).is_ok());

    REQUIRE(find_pool_config(config, pools::kVideoFrames)->capacity == 2 * units::GiB);
    REQUIRE(find_pool_config(config, pools::kPreviewCache)->capacity == 1 * units::GiB);
    REQUIRE(find_pool_config(config, pools::kEffectsProcessing)->capacity == 1 * units::GiB);
    REQUIRE(find_pool_config(config, pools::kAiModels)->capacity == 2 * units::GiB);
    REQUIRE(find_pool_config(config, pools::kTempData)->capacity == 512 * units::MiB);
    REQUIRE(find_pool_config(config, pools::kThumbnails)->capacity == 256 * units::MiB);
    REQUIRE(config.global_memory_limit == 8 * units::GiB);

    REQUIRE_FALSE(find_pool_config(config, pools::kVideoFrames)->globally_evictable);
    REQUIRE_FALSE(find_pool_config(config, pools::kAiModels)->globally_evictable);
    REQUIRE(find_pool_config(config, pools::kTempData)->globally_evictable);
    REQUIRE(find_pool_config(config, "missing") == nullptr);
}

TEST_CASE("Config validation rejects malformed settings", "[config]") {
    auto config = vmm::test::small_config();

    SECTION("duplicate pool names") {
        config.pools.push_back({pools::kTempData, 10, true, 5});
        auto r = validate_config(config);
        REQUIRE(r.is_error());
        REQUIRE(r.error().find("duplicate") != std::string::npos);
    }
    SECTION("zero capacity") {
        config.pools[0].capacity = 0;
        REQUIRE(validate_config(config).is_error());
    }
    SECTION("warning above critical") {
        config.warning_threshold = 0.9;
        config.critical_threshold = 0.5;
        REQUIRE(validate_config(config).is_error());
    }
    SECTION("threshold outside (0,1]") {
        config.critical_threshold = 1.5;
        REQUIRE(validate_config(config).is_error());
    }
    SECTION("zero interval") {
        config.monitor_interval = std::chrono::milliseconds(0);
        REQUIRE(validate_config(config).is_error());
    }
    SECTION("cleanup target above trigger") {
        config.cleanup_target_ratio = 0.8;
        REQUIRE(validate_config(config).is_error());
    }
}

TEST_CASE("Manager refuses an invalid config", "[config]") {
    auto config = vmm::test::small_config();
    config.pools.clear();
    REQUIRE_THROWS_AS(MemoryManager(config, vmm::test::quiet_probe()), std::invalid_argument);
}

TEST_CASE("Runtime threshold changes are validated", "[config]") {
    MemoryManager manager(vmm::test::small_config(), vmm::test::quiet_probe());
    REQUIRE(manager.set_thresholds(0.6, 0.9));
    REQUIRE(manager.warning_threshold() == 0.6);
    REQUIRE(manager.critical_threshold() == 0.9);

    REQUIRE_FALSE(manager.set_thresholds(0.95, 0.9));
    REQUIRE(manager.warning_threshold() == 0.6);

    manager.set_global_memory_limit(5000);
    REQUIRE(manager.global_memory_limit() == 5000);
}

TEST_CASE("Runtime thresholds reject NaN and out-of-range values", "[config]") {
    MemoryManager manager(vmm::test::small_config(), vmm::test::quiet_probe());
    const double warning = manager.warning_threshold();
    const double critical = manager.critical_threshold();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE_FALSE(manager.set_thresholds(nan, 0.9));
    REQUIRE_FALSE(manager.set_thresholds(0.5, nan));
    REQUIRE_FALSE(manager.set_thresholds(nan, nan));
    REQUIRE_FALSE(manager.set_thresholds(0.5, 1.5));
    REQUIRE_FALSE(manager.set_thresholds(0.0, 0.9));

    REQUIRE(manager.warning_threshold() == warning);
    REQUIRE(manager.critical_threshold() == critical);
}
