#include <catch2/catch_test_macros.hpp>
#include "mem/memory_manager.hpp"
#include "test_support.hpp"

using namespace vmm::mem;

TEST_CASE("Shrinking a pool evicts low-priority blocks to fit", "[resize]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    for (int i = 0; i < 4; ++i) {
        REQUIRE(m.allocate(pools::kThumbnails, 100, nullptr, Priority::Low).has_value());
    }

    auto r = m.resize_pool(pools::kThumbnails, 250);
    REQUIRE(r.has_value());
    REQUIRE(*r == 200);

    auto info = m.pool_info(pools::kThumbnails);
    REQUIRE(info->capacity == 250);
    REQUIRE(info->used == 200);
    REQUIRE(info->block_count == 2);
    REQUIRE(m.config().pools.back().capacity == 250);
    REQUIRE(m.verify_accounting());
}

TEST_CASE("Shrinking below a critical block is rejected", "[resize]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    BlockId critical = *m.allocate(pools::kThumbnails, 300, nullptr, Priority::Critical);
    BlockId low = *m.allocate(pools::kThumbnails, 100, nullptr, Priority::Low);

    auto r = m.resize_pool(pools::kThumbnails, 250);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error() == MemoryError::InvalidResize);

    auto info = m.pool_info(pools::kThumbnails);
    REQUIRE(info->capacity == 500);
    REQUIRE(m.contains(critical));
    REQUIRE(m.contains(low));
}

TEST_CASE("Shrinking around a critical block evicts only what is needed", "[resize]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    BlockId critical = *m.allocate(pools::kPreviewCache, 200, nullptr, Priority::Critical);
    REQUIRE(m.allocate(pools::kPreviewCache, 100, nullptr, Priority::Low).has_value());
    REQUIRE(m.allocate(pools::kPreviewCache, 100, nullptr, Priority::Medium).has_value());

    auto r = m.resize_pool(pools::kPreviewCache, 300);
    REQUIRE(r.has_value());
    REQUIRE(*r == 100);
    REQUIRE(m.contains(critical));
    REQUIRE(m.pool_info(pools::kPreviewCache)->count(Priority::Medium) == 1);
}

TEST_CASE("Growing a pool never evicts", "[resize]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    REQUIRE(m.allocate(pools::kTempData, 900).has_value());

    auto r = m.resize_pool(pools::kTempData, 4000);
    REQUIRE(r.has_value());
    REQUIRE(*r == 0);
    REQUIRE(m.pool_info(pools::kTempData)->capacity == 4000);
    REQUIRE(m.allocate(pools::kTempData, 3000).has_value());
}

TEST_CASE("Resize rejects unknown pools and zero capacity", "[resize]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());

    auto unknown = m.resize_pool("no_such_pool", 10);
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error() == MemoryError::PoolNotFound);

    auto zero = m.resize_pool(pools::kTempData, 0);
    REQUIRE_FALSE(zero.has_value());
    REQUIRE(zero.error() == MemoryError::InvalidResize);
    REQUIRE(m.pool_info(pools::kTempData)->capacity == 1000);
}
