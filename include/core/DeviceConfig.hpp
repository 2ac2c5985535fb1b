#pragma once
/** @file  DeviceConfig.hpp
 *  @brief Typed view of one television's JSON configuration block.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "core/Logger.hpp"

namespace tvlink::core {

  /// One selectable source; `id` is the protocol input number (1..8).
  struct InputDefinition {
    int id{ 1 };
    std::string name;
    int type{ 0 }; ///< host-side input-source type tag, opaque to the core
  };

  struct DeviceConfig {
    std::string name{ "Television" };
    std::string path{ "/dev/ttyUSB0" };
    int baudRate{ 9600 };
    std::string manufacturer{ "Unknown" };
    std::string model{ "Unknown" };
    std::string serial{ "Unknown" };
    std::chrono::milliseconds responseTimeout{ 5000 };
    std::size_t maxQueueDepth{ 0 };
    LogLevel logLevel{ LogLevel::Info };
    std::vector<InputDefinition> inputs;

    /// Missing keys take the defaults above; bad values throw `std::invalid_argument`.
    static DeviceConfig fromJson(const nlohmann::json& j);
  };

} // namespace tvlink::core
