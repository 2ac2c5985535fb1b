/* @file main.cpp
 * @brief tvlinkctl - one-shot command line front end for a serial-controlled television
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// tvlink headers
#include "adapters/CharacteristicAdapter.hpp"
#include "adapters/InputAdapter.hpp"
#include "core/AdapterRegistry.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DeviceConfig.hpp"
#include "core/Dispatcher.hpp"
#include "core/Errors.hpp"
#include "core/SystemCoordinator.hpp"
#include "protocols/Command.hpp"

using namespace tvlink;

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitFailed = 1;
  constexpr int kExitUsage = 2;

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <config.json> <command>\n"
              << "  info              accessory information\n"
              << "  inputs            configured inputs\n"
              << "  power [on|off]    query or set power\n"
              << "  input [index]     query or select input\n"
              << "  raw <frame>       send a frame verbatim and print the reply\n";
  }

  adapters::Result await(const std::function<void(adapters::CharacteristicAdapter::Callback)>& op) {
    auto promise = std::make_shared<std::promise<adapters::Result>>();
    auto future = promise->get_future();
    op([promise](const adapters::Result& r) { promise->set_value(r); });
    return future.get();
  }

  int report(const adapters::Result& r, const std::string& what) {
    if (!r.ok()) {
      std::cerr << what << " failed (" << core::toString(r.kind) << "): " << r.detail << "\n";
      return kExitFailed;
    }
    return kExitOk;
  }

  int runPower(core::SystemCoordinator& sys, const std::vector<std::string>& args) {
    auto& power = sys.registry().at("power");
    if (args.empty()) {
      auto r = await([&](auto cb) { power.get(std::move(cb)); });
      if (r.ok())
        std::cout << (r.value ? "on" : "off") << "\n";
      return report(r, "power query");
    }

    if (args[0] != "on" && args[0] != "off")
      throw std::invalid_argument("power expects 'on' or 'off'");
    auto r = await([&](auto cb) { power.set(args[0] == "on" ? 1 : 0, std::move(cb)); });
    return report(r, "power " + args[0]);
  }

  int runInput(core::SystemCoordinator& sys, const std::vector<std::string>& args) {
    auto& input = sys.registry().at("input");
    if (args.empty()) {
      auto r = await([&](auto cb) { input.get(std::move(cb)); });
      if (r.ok())
        std::cout << r.value << " " << sys.inputs().inputs().at(r.value).name << "\n";
      return report(r, "input query");
    }

    const int index = std::stoi(args[0]);
    auto r = await([&](auto cb) { input.set(index, std::move(cb)); });
    return report(r, "input select");
  }

  int runRaw(core::SystemCoordinator& sys, const std::vector<std::string>& args) {
    if (args.empty())
      throw std::invalid_argument("raw expects a frame");
    auto reply = sys.dispatcher().request(protocols::Command::raw(args[0])).get();
    if (!reply.ok()) {
      std::cerr << "raw failed (" << core::toString(reply.kind) << "): " << reply.detail << "\n";
      return kExitFailed;
    }
    std::cout << reply.line << "\n";
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    usage(argv[0]);
    return kExitUsage;
  }

  const std::string command = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  core::DeviceConfig cfg;
  try {
    cfg = core::DeviceConfig::fromJson(core::ConfigLoader(argv[1]).load());
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  }

  core::SystemCoordinator sys(cfg);

  if (command == "info") {
    std::cout << sys.info().describe();
    return kExitOk;
  }
  if (command == "inputs") {
    for (std::size_t i = 0; i < cfg.inputs.size(); ++i)
      std::cout << i << ": " << cfg.inputs[i].name << " (id " << cfg.inputs[i].id << ", type "
                << cfg.inputs[i].type << ")\n";
    return kExitOk;
  }

  if (command != "power" && command != "input" && command != "raw") {
    usage(argv[0]);
    return kExitUsage;
  }

  try {
    sys.initialize();
  } catch (const core::ConnectionError& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  }

  try {
    if (command == "power")
      return runPower(sys, args);
    if (command == "input")
      return runInput(sys, args);
    if (command == "raw")
      return runRaw(sys, args);
  } catch (const std::logic_error& e) { // bad argument or index out of range
    std::cerr << e.what() << "\n";
    usage(argv[0]);
    return kExitUsage;
  }
  return kExitUsage;
}
