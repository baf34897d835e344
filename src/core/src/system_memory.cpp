#include "core/system_memory.hpp"
#include "core/log.hpp"
#include <fstream>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#include <psapi.h>
#else
#include <unistd.h>
#include <sys/sysinfo.h>
#endif

namespace vmm::core {

#ifndef _WIN32
namespace {

// Format: "MemAvailable:  123456789 kB"
uint64_t read_mem_available_from_proc() {
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo.is_open()) return 0;

    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.rfind("MemAvailable:", 0) != 0) continue;
        std::istringstream iss(line.substr(13));
        uint64_t kb = 0;
        iss >> kb;
        return kb * 1024ull;
    }
    return 0;
}

// /proc/self/statm: size resident shared text lib data dt (in pages)
uint64_t read_resident_pages_from_proc() {
    std::ifstream statm("/proc/self/statm");
    if (!statm.is_open()) return 0;
    uint64_t size_pages = 0;
    uint64_t resident_pages = 0;
    statm >> size_pages >> resident_pages;
    return statm ? resident_pages : 0;
}

} // namespace
#endif

PlatformMemoryProbe::PlatformMemoryProbe() {
#ifdef _WIN32
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (GlobalMemoryStatusEx(&status)) {
        total_physical_ = static_cast<uint64_t>(status.ullTotalPhys);
    }
#else
    struct sysinfo si;
    if (sysinfo(&si) == 0) {
        total_physical_ = static_cast<uint64_t>(si.totalram) * si.mem_unit;
    }
    long page = sysconf(_SC_PAGESIZE);
    if (page > 0) page_size_ = static_cast<uint64_t>(page);
#endif
    if (total_physical_ == 0) {
        vmm::log::warn("Could not detect system RAM, process memory thresholds disabled");
    } else {
        vmm::log::debug("System RAM detected: " + std::to_string(total_physical_ / (1024 * 1024)) + " MB");
    }
}

uint64_t PlatformMemoryProbe::process_resident_bytes() const {
#ifdef _WIN32
    PROCESS_MEMORY_COUNTERS counters;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &counters, sizeof(counters))) {
        return static_cast<uint64_t>(counters.WorkingSetSize);
    }
    return 0;
#else
    return read_resident_pages_from_proc() * page_size_;
#endif
}

uint64_t PlatformMemoryProbe::total_physical_bytes() const {
    return total_physical_;
}

uint64_t PlatformMemoryProbe::available_physical_bytes() const {
#ifdef _WIN32
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (GlobalMemoryStatusEx(&status)) {
        return static_cast<uint64_t>(status.ullAvailPhys);
    }
    return 0;
#else
    if (uint64_t available = read_mem_available_from_proc(); available > 0) {
        return available;
    }
    struct sysinfo si;
    if (sysinfo(&si) == 0) {
        return (static_cast<uint64_t>(si.freeram) + si.bufferram) * si.mem_unit;
    }
    return 0;
#endif
}

std::shared_ptr<SystemMemoryProbe> make_platform_memory_probe() {
    return std::make_shared<PlatformMemoryProbe>();
}

} // namespace vmm::core
