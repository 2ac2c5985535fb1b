/* @file AdapterRegistry.cpp
 * @brief characteristic name → adapter lookup
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// tvlink headers
#include "adapters/CharacteristicAdapter.hpp"
#include "core/AdapterRegistry.hpp"

using namespace tvlink::core;

bool AdapterRegistry::add(std::shared_ptr<adapters::CharacteristicAdapter> adapter) {
  if (!adapter)
    throw std::invalid_argument("[AdapterRegistry] adapter is nullptr");
  std::string key = adapter->name();
  return adapters_.emplace(std::move(key), std::move(adapter)).second;
}

tvlink::adapters::CharacteristicAdapter& AdapterRegistry::at(const std::string& name) const {
  auto it = adapters_.find(name);
  if (it == adapters_.end())
    throw std::out_of_range("[AdapterRegistry] unknown characteristic: " + name);
  return *it->second;
}

bool AdapterRegistry::contains(const std::string& name) const {
  return adapters_.find(name) != adapters_.end();
}

std::vector<std::string> AdapterRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(adapters_.size());
  for (const auto& [name, adapter] : adapters_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}
