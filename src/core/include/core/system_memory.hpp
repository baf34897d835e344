#pragma once
#include <cstdint>
#include <memory>

namespace vmm::core {

struct SystemMemoryInfo {
    uint64_t total_physical_memory = 0;
    uint64_t available_physical_memory = 0;
    uint64_t process_resident_memory = 0;
};

/**
 * @brief Source of process/system memory figures
 *
 * The memory monitor and cleanup passes only read through this interface so
 * tests can substitute fixed numbers.
 */
class SystemMemoryProbe {
public:
    virtual ~SystemMemoryProbe() = default;

    /**
     * @brief Resident set size of the current process in bytes (0 if unknown)
     */
    virtual uint64_t process_resident_bytes() const = 0;

    /**
     * @brief Installed physical memory in bytes (0 if unknown)
     */
    virtual uint64_t total_physical_bytes() const = 0;

    /**
     * @brief Physical memory currently available to new allocations
     */
    virtual uint64_t available_physical_bytes() const = 0;

    SystemMemoryInfo query() const {
        SystemMemoryInfo info;
        info.total_physical_memory = total_physical_bytes();
        info.available_physical_memory = available_physical_bytes();
        info.process_resident_memory = process_resident_bytes();
        return info;
    }
};

// Reads /proc + sysinfo on Linux, psapi/GlobalMemoryStatusEx on Windows.
class PlatformMemoryProbe final : public SystemMemoryProbe {
public:
    PlatformMemoryProbe();

    uint64_t process_resident_bytes() const override;
    uint64_t total_physical_bytes() const override;
    uint64_t available_physical_bytes() const override;

private:
    uint64_t total_physical_ = 0;
    uint64_t page_size_ = 4096;
};

std::shared_ptr<SystemMemoryProbe> make_platform_memory_probe();

} // namespace vmm::core
