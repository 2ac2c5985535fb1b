/* @file AccessoryInfo.cpp
 * @brief static accessory identity lines
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>

// tvlink headers
#include "adapters/AccessoryInfo.hpp"

using namespace tvlink::adapters;

namespace {
  std::string orUnknown(const std::string& s) { return s.empty() ? "Unknown" : s; }
} // namespace

AccessoryInfo AccessoryInfo::fromConfig(const core::DeviceConfig& cfg) {
  return AccessoryInfo{ orUnknown(cfg.name), orUnknown(cfg.manufacturer), orUnknown(cfg.model),
                        orUnknown(cfg.serial) };
}

std::string AccessoryInfo::describe() const {
  std::ostringstream os;
  os << "name: " << name << '\n'
     << "manufacturer: " << manufacturer << '\n'
     << "model: " << model << '\n'
     << "serial: " << serial << '\n';
  return os.str();
}
