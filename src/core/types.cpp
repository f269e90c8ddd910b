/**
 * @file types.cpp
 * @brief Unit conversions and formatting for core types.
 */

#include "core/types.hpp"

#include <cmath>
#include <limits>

namespace tco_scheduler {

uint64_t gb_to_mb(double gb) noexcept {
    if (!std::isfinite(gb) || gb <= 0.0) return 0;
    double mb = std::ceil(gb * 1024.0);
    if (mb >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(mb);
}

std::string to_string(const Resources& r) {
    return "cpu=" + std::to_string(r.cpu_cores)
         + " mem_mb=" + std::to_string(r.memory_mb)
         + " gpu=" + std::to_string(r.gpu_count);
}

}  // namespace tco_scheduler
