#pragma once
/**
 * @file modes.hpp
 * @brief Run-time selectable behaviours shared by config, safety and mem.
 */

#include <cstdint>

namespace pinview::config {

/** @enum SafetyMode
 *  @brief safety-checks = enabled | disabled.
 *
 *  Checked: every view carries a token that is validated on each checked
 *  access path, plus leak and use-after-release diagnostics.
 *  Unchecked: no token, no validation, minimum overhead.
 */
enum class SafetyMode : std::uint8_t { Checked, Unchecked };

/** @enum StorageFallback
 *  @brief What the backing-storage extractor does when it cannot interpret
 *         a sequence's storage.
 */
enum class StorageFallback : std::uint8_t {
    Fail,  ///< Report Error::BackingStorageUnavailable
    Empty  ///< Hand back a zero-element storage and record the event
};

} // namespace pinview::config
