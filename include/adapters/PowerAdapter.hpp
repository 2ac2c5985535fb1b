#pragma once
/** @file  PowerAdapter.hpp
 *  @brief Active (on/off) characteristic ↔ POWR command family.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "adapters/CharacteristicAdapter.hpp"

namespace tvlink {
  namespace core {
    class CommandSink;
    class CharacteristicStore;
    class Logger;
  } // namespace core

  namespace adapters {

    class PowerAdapter : public CharacteristicAdapter {
    public:
      PowerAdapter(core::CommandSink& sink, std::shared_ptr<core::CharacteristicStore> store,
                   std::shared_ptr<core::Logger> logger);

      const char* name() const override { return "power"; }

      void get(Callback cb) override;            ///< POWR???? → 0 / 1
      void set(int value, Callback cb) override; ///< non-zero → POWR1, else POWR0; expects OK

    private:
      core::CommandSink& sink_;
      std::shared_ptr<core::CharacteristicStore> store_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace adapters
} // namespace tvlink
