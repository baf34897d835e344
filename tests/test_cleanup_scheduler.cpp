#include <catch2/catch_test_macros.hpp>
#include "mem/memory_manager.hpp"
#include "test_support.hpp"
#include <thread>

using namespace vmm::mem;
using namespace std::chrono_literals;

namespace {

class CountedHandle : public Payload, public Releasable {
public:
    explicit CountedHandle(int& released) : released_(released) {}
    void release() override { ++released_; }

private:
    int& released_;
};

} // namespace

TEST_CASE("Cleanup brings over-occupied pools down to the target", "[cleanup]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    for (int i = 0; i < 8; ++i) {
        REQUIRE(m.allocate(pools::kPreviewCache, 100, nullptr, Priority::Low).has_value());
    }
    for (int i = 0; i < 6; ++i) {
        REQUIRE(m.allocate(pools::kTempData, 100, nullptr, Priority::Low).has_value());
    }

    auto report = m.perform_cleanup("before_export");
    REQUIRE(report.trigger == "before_export");
    REQUIRE(report.pools_cleaned.size() == 1);
    REQUIRE(report.pools_cleaned[0].pool == pools::kPreviewCache);
    REQUIRE(report.pools_cleaned[0].freed_bytes == 300);
    REQUIRE(report.blocks_freed == 3);
    REQUIRE(report.managed_before == 1400);
    REQUIRE(report.managed_after == 1100);
    REQUIRE(report.managed_freed() == 300);
    REQUIRE(m.pool_info(pools::kTempData)->used == 600);
}

TEST_CASE("Cleanup leaves critical blocks in place", "[cleanup]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    BlockId pinned = *m.allocate(pools::kAiModels, 900, nullptr, Priority::Critical);

    auto report = m.perform_cleanup();
    REQUIRE(report.pools_cleaned.empty());
    REQUIRE(m.contains(pinned));
}

TEST_CASE("Cleanup runs the deferred release pass", "[cleanup]") {
    int released = 0;
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    BlockId id = *m.allocate(pools::kTempData, 10, std::make_shared<CountedHandle>(released));

    auto held = m.touch(id);
    REQUIRE(m.deallocate(id));
    held.reset();

    auto report = m.perform_cleanup();
    REQUIRE(report.deferred_released == 1);
    REQUIRE(released == 1);
}

TEST_CASE("Cleanup history is bounded", "[cleanup]") {
    auto config = vmm::test::small_config();
    config.cleanup_history_capacity = 2;
    MemoryManager m(config, vmm::test::quiet_probe());

    m.perform_cleanup("first");
    m.perform_cleanup("second");
    m.perform_cleanup("third");

    auto history = m.cleanup_history();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].trigger == "second");
    REQUIRE(history[1].trigger == "third");
}

TEST_CASE("Automatic cleanup follows the enable flag", "[cleanup]") {
    MemoryManager m(vmm::test::small_config(), vmm::test::quiet_probe());
    for (int i = 0; i < 9; ++i) {
        REQUIRE(m.allocate(pools::kEffectsProcessing, 100, nullptr, Priority::Low).has_value());
    }

    m.start_monitoring();
    REQUIRE(m.cleanup_scheduler().running());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (m.cleanup_history().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(m.pool_info(pools::kEffectsProcessing)->used <= 500);
    REQUIRE_FALSE(m.cleanup_history().empty());
    REQUIRE(m.cleanup_history().front().trigger == "auto_cleanup");

    m.set_auto_cleanup_enabled(false);
    REQUIRE_FALSE(m.cleanup_scheduler().running());
    REQUIRE(m.usage_monitor().running());

    m.set_auto_cleanup_enabled(true);
    REQUIRE(m.cleanup_scheduler().running());
    m.stop_monitoring();
}
