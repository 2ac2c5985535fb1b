#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Wires config, logging, transport, dispatcher and adapters for one television.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <iostream>
#include <memory>
#include <string>

#include "adapters/AccessoryInfo.hpp"
#include "core/DeviceConfig.hpp"

namespace tvlink {
  namespace io {
    class SerialChannel;
    class SerialTransport;
  } // namespace io

  namespace adapters {
    class InputAdapter;
  }

  namespace core {

    class AdapterRegistry;
    class CharacteristicStore;
    class Dispatcher;
    class ErrorMonitor;
    class Logger;

    class SystemCoordinator {

    public:
      enum class State { BOOT, READY, DEGRADED, STOPPED };

      explicit SystemCoordinator(DeviceConfig cfg, std::ostream& logSink = std::clog);
      /// Same, but over a caller-supplied channel (tests substitute a fake).
      SystemCoordinator(DeviceConfig cfg, std::unique_ptr<io::SerialChannel> channel,
                        std::ostream& logSink = std::clog);
      ~SystemCoordinator(); ///< shutdown()

      // ---- Public API ----
      void initialize(); ///< open the link, build dispatcher + adapters; throws ConnectionError
      void shutdown();   ///< tear down in reverse order, pending commands resolve as Shutdown
      void handleError(const std::string& reason); ///< escalation target of the ErrorMonitor

      State state() const { return currentState_.load(); }

      const DeviceConfig& config() const { return cfg_; }
      const adapters::AccessoryInfo& info() const { return info_; }
      Logger& logger() { return *logger_; }
      ErrorMonitor& errorMonitor() { return *errorMonitor_; }
      CharacteristicStore& store() { return *store_; }

      /// Valid between initialize() and shutdown(); throw std::logic_error otherwise.
      Dispatcher& dispatcher();
      AdapterRegistry& registry();
      adapters::InputAdapter& inputs();

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      void transitionTo(State next);

      DeviceConfig cfg_;
      adapters::AccessoryInfo info_;

      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<CharacteristicStore> store_;

      // destroyed in reverse: dispatcher before the adapters it calls back, transport last
      std::unique_ptr<io::SerialTransport> transport_;
      std::unique_ptr<AdapterRegistry> registry_;
      std::shared_ptr<adapters::InputAdapter> inputs_;
      std::unique_ptr<Dispatcher> dispatcher_;

      std::atomic<State> currentState_{ State::BOOT };
    };

    const char* toString(SystemCoordinator::State state);

  } // namespace core
} // namespace tvlink
