#pragma once
/** @file  AccessoryInfo.hpp
 *  @brief Static identification of the accessory (no device round-trip).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/DeviceConfig.hpp"

namespace tvlink::adapters {

  struct AccessoryInfo {
    std::string name;
    std::string manufacturer;
    std::string model;
    std::string serial;

    /// Empty config values fall back to "Unknown".
    static AccessoryInfo fromConfig(const core::DeviceConfig& cfg);

    /// Multi-line `key: value` block for the `info` command.
    std::string describe() const;
  };

} // namespace tvlink::adapters
