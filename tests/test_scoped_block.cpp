#include <catch2/catch_test_macros.hpp>
#include "mem/memory_manager.hpp"
#include "mem/scoped_block.hpp"
#include "test_support.hpp"
#include <utility>

using namespace vmm::mem;

TEST_CASE("ScopedBlock holds budget for its scope", "[scoped]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    {
        auto scoped = ScopedBlock::acquire(m, pools::kEffectsProcessing, 400, Priority::High, "blur scratch");
        REQUIRE(scoped.has_value());
        REQUIRE(scoped->valid());
        REQUIRE(m.contains(scoped->id()));
        REQUIRE(m.pool_info(pools::kEffectsProcessing)->used == 400);
        REQUIRE(m.block_info(scoped->id())->description == "blur scratch");
    }
    REQUIRE(m.pool_info(pools::kEffectsProcessing)->used == 0);
}

TEST_CASE("ScopedBlock acquisition failure carries the reason", "[scoped]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    auto missing = ScopedBlock::acquire(m, "no_such_pool", 10);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error() == MemoryError::PoolNotFound);

    auto too_big = ScopedBlock::acquire(m, pools::kThumbnails, 10000);
    REQUIRE_FALSE(too_big.has_value());
    REQUIRE(too_big.error() == MemoryError::PoolExhausted);
}

TEST_CASE("ScopedBlock ownership moves", "[scoped]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    auto first = ScopedBlock::acquire(m, pools::kTempData, 100);
    auto second = ScopedBlock::acquire(m, pools::kTempData, 200);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    ScopedBlock a = std::move(*first);
    REQUIRE_FALSE(first->valid());
    REQUIRE(a.valid());

    const BlockId replaced = a.id();
    a = std::move(*second);
    REQUIRE_FALSE(m.contains(replaced));
    REQUIRE(m.pool_info(pools::kTempData)->used == 200);

    a.reset();
    REQUIRE_FALSE(a.valid());
    REQUIRE(m.total_used() == 0);
}

TEST_CASE("ScopedBlock tolerates eviction before scope exit", "[scoped]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    {
        auto scoped = ScopedBlock::acquire(m, pools::kTempData, 700, Priority::Low);
        REQUIRE(scoped.has_value());
        REQUIRE(m.allocate(pools::kTempData, 700, nullptr, Priority::High).has_value());
        REQUIRE_FALSE(m.contains(scoped->id()));
    }
    REQUIRE(m.pool_info(pools::kTempData)->used == 700);
    REQUIRE(m.verify_accounting());
}
