#pragma once
#include <string>

// Central logging configuration / helper macros.
// Define VMM_MEM_DEBUG (e.g. via compiler flags) to log every eviction decision.
// Define VMM_ENABLE_VERBOSE_LOG for extra verbose categories globally.

namespace vmm { namespace log { void trace(const std::string&) noexcept; void debug(const std::string&) noexcept; } }

#if defined(VMM_ENABLE_VERBOSE_LOG)
  #define VMM_VERBOSE_LOG 1
#else
  #define VMM_VERBOSE_LOG 0
#endif

#if VMM_VERBOSE_LOG
  #define VMM_MEM_TRACE(msg) ::vmm::log::trace(msg)
#else
  #define VMM_MEM_TRACE(msg) do {} while(0)
#endif

#if defined(VMM_MEM_DEBUG)
  #define VMM_EVICT_DEBUG(msg) ::vmm::log::debug(msg)
#else
  #define VMM_EVICT_DEBUG(msg) do {} while(0)
#endif
