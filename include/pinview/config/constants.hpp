#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for heap, views, and the job system.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          config Loader (key = value file) in deployments.
 */

#include <cstddef>
#include <cstdint>

#include "pinview/config/modes.hpp"

// Build-time default for safety-checks. The CMake option PINVIEW_SAFETY_CHECKS
// defines this to 0 or 1; a config file can still override it at run time.
#ifndef PINVIEW_SAFETY_CHECKS_DEFAULT
#define PINVIEW_SAFETY_CHECKS_DEFAULT 1
#endif

namespace pinview::config::constants {

// =====================
// Views
// =====================
/// Default safety mode, taken from the build option.
inline constexpr SafetyMode SAFETY_MODE_DEFAULT =
    PINVIEW_SAFETY_CHECKS_DEFAULT ? SafetyMode::Checked : SafetyMode::Unchecked;

/// Default extractor behaviour on an uninterpretable storage layout.
inline constexpr StorageFallback STORAGE_FALLBACK_DEFAULT = StorageFallback::Fail;

// =====================
// Managed heap
// =====================
/// Alignment of every managed payload (cache line; SIMD-friendly for workers).
inline constexpr std::size_t HEAP_PAYLOAD_ALIGNMENT = 64;

/// First capacity a ManagedList allocates when it grows from empty.
inline constexpr std::size_t LIST_INITIAL_CAPACITY = 4;

/// Growth factor applied to a ManagedList's capacity when full.
inline constexpr std::size_t LIST_GROWTH_FACTOR = 2;

// =====================
// Job system
// =====================
/// 0 = use std::thread::hardware_concurrency().
inline constexpr std::size_t WORKER_THREADS_DEFAULT = 0;

/// Lower bound on the pool size when hardware_concurrency() reports 0.
inline constexpr std::size_t WORKER_THREADS_MIN = 1;

// =====================
// Observability
// =====================
/// Print one line per view event on the simple observer.
inline constexpr bool LOG_EVENTS_DEFAULT = false;

} // namespace pinview::config::constants
