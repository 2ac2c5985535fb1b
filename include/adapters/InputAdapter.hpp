#pragma once
/** @file  InputAdapter.hpp
 *  @brief ActiveIdentifier characteristic ↔ IAVD command family.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <optional>
#include <vector>

#include "adapters/CharacteristicAdapter.hpp"
#include "core/DeviceConfig.hpp"

namespace tvlink {
  namespace core {
    class CommandSink;
    class CharacteristicStore;
    class Logger;
  } // namespace core

  namespace adapters {

    /**
 * @class InputAdapter
 * @brief Values are 0-based indices into the configured input list; the
 *        protocol speaks input ids, so every call translates between the two.
 */
    class InputAdapter : public CharacteristicAdapter {
    public:
      InputAdapter(core::CommandSink& sink, std::vector<core::InputDefinition> inputs,
                   std::shared_ptr<core::CharacteristicStore> store,
                   std::shared_ptr<core::Logger> logger);

      const char* name() const override { return "input"; }

      void get(Callback cb) override;
      void set(int index, Callback cb) override;

      const std::vector<core::InputDefinition>& inputs() const { return inputs_; }

      /// Index of the input with protocol id \p id, if configured.
      std::optional<int> indexOf(int id) const;

    private:
      core::CommandSink& sink_;
      const std::vector<core::InputDefinition> inputs_;
      std::shared_ptr<core::CharacteristicStore> store_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace adapters
} // namespace tvlink
