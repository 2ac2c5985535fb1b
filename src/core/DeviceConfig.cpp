/* @file DeviceConfig.cpp
 * @brief JSON → DeviceConfig with defaults and field validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// tvlink headers
#include "core/DeviceConfig.hpp"
#include "core/Dispatcher.hpp"
#include "io/SerialChannel.hpp"

using namespace tvlink::core;
using nlohmann::json;

namespace {

  constexpr int kMinInputId = 1;
  constexpr int kMaxInputId = 8;

  [[noreturn]] void bad(const std::string& field, const std::string& why) {
    throw std::invalid_argument("[DeviceConfig] '" + field + "' " + why);
  }

  std::string stringOr(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key))
      return fallback;
    if (!j.at(key).is_string())
      bad(key, "must be a string");
    return j.at(key).get<std::string>();
  }

  long long integerOr(const json& j, const char* key, long long fallback) {
    if (!j.contains(key))
      return fallback;
    if (!j.at(key).is_number_integer())
      bad(key, "must be an integer");
    return j.at(key).get<long long>();
  }

  /// accepts 3, "3" or "0003"
  int parseInputId(const json& v, const std::string& field) {
    long long id = 0;
    if (v.is_number_integer()) {
      id = v.get<long long>();
    } else if (v.is_string()) {
      const auto s = v.get<std::string>();
      if (s.empty() || s.size() > 4 ||
          !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
        bad(field, "must be a number or digit string");
      id = std::stoll(s);
    } else {
      bad(field, "must be a number or digit string");
    }

    if (id < kMinInputId || id > kMaxInputId)
      bad(field, "must be within 1..8");
    return static_cast<int>(id);
  }

} // namespace

DeviceConfig DeviceConfig::fromJson(const json& j) {
  if (!j.is_object())
    throw std::invalid_argument("[DeviceConfig] configuration must be a JSON object");

  DeviceConfig cfg;
  cfg.name = stringOr(j, "name", cfg.name);
  cfg.path = stringOr(j, "path", cfg.path);
  cfg.manufacturer = stringOr(j, "manufacturer", cfg.manufacturer);
  cfg.model = stringOr(j, "model", cfg.model);
  cfg.serial = stringOr(j, "serial", cfg.serial);

  if (cfg.path.empty())
    bad("path", "must not be empty");

  const auto baud = integerOr(j, "baudRate", cfg.baudRate);
  if (!tvlink::io::toSpeed(static_cast<int>(baud)))
    bad("baudRate", "is not a supported rate");
  cfg.baudRate = static_cast<int>(baud);

  const auto timeoutMs = integerOr(j, "responseTimeoutMs", cfg.responseTimeout.count());
  if (timeoutMs < 0)
    bad("responseTimeoutMs", "must not be negative");
  if (timeoutMs > DispatcherOptions::kMaxResponseTimeout.count())
    bad("responseTimeoutMs", "must not exceed " +
                                 std::to_string(DispatcherOptions::kMaxResponseTimeout.count()));
  cfg.responseTimeout = std::chrono::milliseconds(timeoutMs);

  const auto depth = integerOr(j, "maxQueueDepth", 0);
  if (depth < 0)
    bad("maxQueueDepth", "must not be negative");
  cfg.maxQueueDepth = static_cast<std::size_t>(depth);

  if (j.contains("logLevel")) {
    const auto text = stringOr(j, "logLevel", "info");
    const auto level = parseLogLevel(text);
    if (!level)
      bad("logLevel", "must be one of debug, info, warn, error, off");
    cfg.logLevel = *level;
  }

  if (j.contains("inputs")) {
    const auto& inputs = j.at("inputs");
    if (!inputs.is_array())
      bad("inputs", "must be an array");

    for (std::size_t i = 0; i < inputs.size(); ++i) {
      const auto& in = inputs.at(i);
      const std::string field = "inputs[" + std::to_string(i) + "]";
      if (!in.is_object() || !in.contains("id"))
        bad(field, "must be an object with an 'id'");

      InputDefinition def;
      def.id = parseInputId(in.at("id"), field + ".id");
      def.name = in.contains("name") ? stringOr(in, "name", {}) : "Input " + std::to_string(def.id);
      def.type = static_cast<int>(integerOr(in, "type", 0));
      cfg.inputs.push_back(std::move(def));
    }
  }

  return cfg;
}
