/* @file CharacteristicStore.cpp
 * @brief last known characteristic values, mutex guarded
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// tvlink headers
#include "core/CharacteristicStore.hpp"

using namespace tvlink::core;

const char* tvlink::core::toString(Characteristic c) {
  switch (c) {
  case Characteristic::Active:
    return "Active";
  case Characteristic::ActiveIdentifier:
    return "ActiveIdentifier";
  default:
    return "Unknown";
  }
}

void CharacteristicStore::set(Characteristic c, int value) {
  std::lock_guard<std::mutex> lock(mtx_);
  values_[c] = value;
}

std::optional<int> CharacteristicStore::get(Characteristic c) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = values_.find(c);
  if (it == values_.end())
    return std::nullopt;
  return it->second;
}
