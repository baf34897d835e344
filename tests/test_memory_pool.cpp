#include <catch2/catch_test_macros.hpp>
#include "mem/memory_pool.hpp"

using namespace vmm::mem;

namespace {

Block make_block(BlockId id, uint64_t size, Priority p) {
    Block b;
    b.id = id;
    b.size = size;
    b.priority = p;
    b.created_at = b.last_access_at = Clock::now();
    return b;
}

} // namespace

TEST_CASE("MemoryPool charges and refunds block sizes", "[pool]") {
    MemoryPool pool("temp_data", 1000);
    REQUIRE(pool.insert(make_block(1, 300, Priority::Low)));
    REQUIRE(pool.insert(make_block(2, 200, Priority::Critical)));

    REQUIRE(pool.used() == 500);
    REQUIRE(pool.available() == 500);
    REQUIRE(pool.block_count() == 2);
    REQUIRE(pool.count(Priority::Low) == 1);
    REQUIRE(pool.count(Priority::Critical) == 1);
    REQUIRE(pool.evictable_bytes() == 300);
    REQUIRE(pool.occupancy() == 0.5);
    REQUIRE(pool.check_invariants());

    auto removed = pool.extract(1);
    REQUIRE(removed.has_value());
    REQUIRE(removed->size == 300);
    REQUIRE(pool.used() == 200);
    REQUIRE(pool.count(Priority::Low) == 0);
    REQUIRE(pool.check_invariants());
}

TEST_CASE("MemoryPool ignores duplicate inserts and unknown extracts", "[pool]") {
    MemoryPool pool("thumbnails", 100);
    REQUIRE(pool.insert(make_block(7, 40, Priority::Medium)));
    REQUIRE_FALSE(pool.insert(make_block(7, 40, Priority::Medium)));
    REQUIRE(pool.used() == 40);

    REQUIRE_FALSE(pool.extract(99).has_value());
    REQUIRE(pool.extract(7).has_value());
    REQUIRE_FALSE(pool.extract(7).has_value());
    REQUIRE(pool.used() == 0);
    REQUIRE(pool.check_invariants());
}

TEST_CASE("MemoryPool reports zero availability when over capacity", "[pool]") {
    MemoryPool pool("preview_cache", 100, true, 2);
    REQUIRE(pool.insert(make_block(1, 80, Priority::High)));
    pool.set_capacity(50);
    REQUIRE(pool.available() == 0);
    REQUIRE(pool.globally_evictable());
    REQUIRE(pool.eviction_rank() == 2);
}
