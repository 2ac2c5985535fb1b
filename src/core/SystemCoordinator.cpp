/* @file SystemCoordinator.cpp
 * @brief bring-up / tear-down of one television's subsystems
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// tvlink headers
#include "adapters/InputAdapter.hpp"
#include "adapters/PowerAdapter.hpp"
#include "core/AdapterRegistry.hpp"
#include "core/CharacteristicStore.hpp"
#include "core/Dispatcher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/SerialTransport.hpp"

using namespace tvlink::core;

namespace {
  constexpr const char* kSource = "SystemCoordinator";
}

const char* tvlink::core::toString(SystemCoordinator::State state) {
  switch (state) {
  case SystemCoordinator::State::BOOT:
    return "BOOT";
  case SystemCoordinator::State::READY:
    return "READY";
  case SystemCoordinator::State::DEGRADED:
    return "DEGRADED";
  case SystemCoordinator::State::STOPPED:
    return "STOPPED";
  default:
    return "UNKNOWN";
  }
}

SystemCoordinator::SystemCoordinator(DeviceConfig cfg, std::ostream& logSink)
    : SystemCoordinator(std::move(cfg), std::make_unique<io::SerialChannel>(), logSink) {}

SystemCoordinator::SystemCoordinator(DeviceConfig cfg, std::unique_ptr<io::SerialChannel> channel,
                                     std::ostream& logSink)
    : cfg_(std::move(cfg)), info_(adapters::AccessoryInfo::fromConfig(cfg_)),
      logger_(std::make_shared<Logger>(logSink, cfg_.logLevel)),
      errorMonitor_(std::make_shared<ErrorMonitor>()),
      store_(std::make_shared<CharacteristicStore>()) {
  errorMonitor_->registerEscalation([this](const std::string& reason) { handleError(reason); });
  transport_ = std::make_unique<io::SerialTransport>(logger_, errorMonitor_, std::move(channel));
}

SystemCoordinator::~SystemCoordinator() { shutdown(); }

void SystemCoordinator::initialize() {
  if (dispatcher_)
    return;

  logger_->info(kSource, "initialising '" + info_.name + "' on " + cfg_.path);
  transport_->open(cfg_.path, cfg_.baudRate); // throws ConnectionError

  DispatcherOptions options;
  options.responseTimeout = cfg_.responseTimeout;
  options.maxQueueDepth = cfg_.maxQueueDepth;
  dispatcher_ = std::make_unique<Dispatcher>(*transport_, logger_, errorMonitor_, options);

  registry_ = std::make_unique<AdapterRegistry>();
  inputs_ = std::make_shared<adapters::InputAdapter>(*dispatcher_, cfg_.inputs, store_, logger_);
  registry_->add(std::make_shared<adapters::PowerAdapter>(*dispatcher_, store_, logger_));
  registry_->add(inputs_);

  transitionTo(State::READY);
}

void SystemCoordinator::shutdown() {
  if (currentState_ == State::STOPPED)
    return;

  // dispatcher first: its Shutdown replies still run adapter callbacks
  dispatcher_.reset();
  registry_.reset();
  inputs_.reset();
  transport_->close();
  transitionTo(State::STOPPED);
}

void SystemCoordinator::handleError(const std::string& reason) {
  logger_->error(kSource, reason);
  State expected = State::READY;
  if (currentState_.compare_exchange_strong(expected, State::DEGRADED))
    logger_->warn(kSource, "state READY -> DEGRADED");
}

Dispatcher& SystemCoordinator::dispatcher() {
  if (!dispatcher_)
    throw std::logic_error("[SystemCoordinator] not initialised");
  return *dispatcher_;
}

AdapterRegistry& SystemCoordinator::registry() {
  if (!registry_)
    throw std::logic_error("[SystemCoordinator] not initialised");
  return *registry_;
}

tvlink::adapters::InputAdapter& SystemCoordinator::inputs() {
  if (!inputs_)
    throw std::logic_error("[SystemCoordinator] not initialised");
  return *inputs_;
}

void SystemCoordinator::transitionTo(State next) {
  const State prev = currentState_.exchange(next);
  if (prev != next)
    logger_->info(kSource, std::string("state ") + toString(prev) + " -> " + toString(next));
}
