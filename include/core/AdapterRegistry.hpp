#pragma once
/** @file  AdapterRegistry.hpp
 *  @brief Runtime registry that maps characteristic names to adapters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tvlink::adapters {
  class CharacteristicAdapter;
}

namespace tvlink::core {

  /**
 * @class AdapterRegistry
 * @brief Register & look up adapter objects by string key.
 *
 *  * Keeps the host front end decoupled from concrete adapters.
 */
  class AdapterRegistry {
  public:
    /// Register \p adapter under its name().  Returns false on duplicate.
    bool add(std::shared_ptr<adapters::CharacteristicAdapter> adapter);

    /// Look up an adapter or throw `std::out_of_range` if unknown.
    adapters::CharacteristicAdapter& at(const std::string& name) const;

    bool contains(const std::string& name) const;

    /// Registered names, sorted.
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, std::shared_ptr<adapters::CharacteristicAdapter>> adapters_;
  };

} // namespace tvlink::core
