#pragma once
/** @file  CharacteristicStore.hpp
 *  @brief Thread-safe last-known characteristic values shared by adapters & host.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <unordered_map>

namespace tvlink {
  namespace core {

    /**
 * @enum Characteristic
 * @brief Strong-typed keys for every value an adapter can report.
 */
    enum class Characteristic {
      Active,          ///< power, 0 / 1
      ActiveIdentifier ///< index into the configured input list
    };

    const char* toString(Characteristic c);

    /** @class CharacteristicStore
 *  @brief Lock-protected map of <Characteristic → int>.
 *
 *  * Written by adapters after a successful get/set.
 *  * Read by the host to show state without a device round-trip.
 */
    class CharacteristicStore {

    public:
      CharacteristicStore() = default;
      ~CharacteristicStore() = default;

      /// Atomically writes \p value under key \p c.
      void set(Characteristic c, int value);

      /// Thread-safe getter; nullopt until a value has been observed.
      std::optional<int> get(Characteristic c) const;

    private:
      mutable std::mutex mtx_;
      std::unordered_map<Characteristic, int> values_;
    };

  } // namespace core
} // namespace tvlink
