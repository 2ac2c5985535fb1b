/* @file PowerAdapter.cpp
 * @brief power query / set translated into POWR frames
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// tvlink headers
#include "adapters/PowerAdapter.hpp"
#include "core/CharacteristicStore.hpp"
#include "core/CommandSink.hpp"
#include "core/Logger.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

using namespace tvlink::adapters;
using tvlink::core::Characteristic;
using tvlink::core::ErrorKind;
using tvlink::core::Reply;
using tvlink::protocols::Command;
using tvlink::protocols::Response;

namespace {
  constexpr const char* kSource = "PowerAdapter";

  /// "1", " 0 " or "POWR1": the line's only digit, if that digit is 0 or 1.
  std::optional<int> powerState(const std::string& line) {
    if (auto r = Response::fromWire(line); r && r->kind == Response::Kind::Status)
      return r->value <= 1 ? std::optional<int>(r->value) : std::nullopt;

    std::optional<int> state;
    for (char c : line) {
      if (c < '0' || c > '9')
        continue;
      if (state || c > '1')
        return std::nullopt; // several digits, or not a power state
      state = c - '0';
    }
    return state;
  }
} // namespace

PowerAdapter::PowerAdapter(core::CommandSink& sink, std::shared_ptr<core::CharacteristicStore> store,
                           std::shared_ptr<core::Logger> logger)
    : sink_(sink), store_(std::move(store)), logger_(std::move(logger)) {}

void PowerAdapter::get(Callback cb) {
  sink_.send(Command::powerQuery().toWire(), [this, cb = std::move(cb)](const Reply& reply) {
    if (!reply.ok()) {
      logger_->warn(kSource, std::string("get Active failed: ") + reply.detail);
      cb(Result::failure(reply.kind, reply.detail));
      return;
    }

    const auto state = powerState(reply.line);
    if (!state) {
      std::string errMsg = "power query returned '" + reply.line + "'";
      logger_->error(kSource, errMsg);
      cb(Result::failure(ErrorKind::Protocol, errMsg));
      return;
    }

    logger_->debug(kSource, "get Active -> " + std::to_string(*state));
    store_->set(Characteristic::Active, *state);
    cb(Result::success(*state));
  });
}

void PowerAdapter::set(int value, Callback cb) {
  const bool on = value != 0;
  sink_.send(Command::power(on).toWire(), [this, on, cb = std::move(cb)](const Reply& reply) {
    if (!reply.ok()) {
      logger_->warn(kSource, std::string("set Active failed: ") + reply.detail);
      cb(Result::failure(reply.kind, reply.detail));
      return;
    }

    auto r = Response::fromWire(reply.line);
    if (!r || r->kind != Response::Kind::Ok) {
      std::string errMsg = "power set returned '" + reply.line + "'";
      logger_->error(kSource, errMsg);
      cb(Result::failure(ErrorKind::Protocol, errMsg));
      return;
    }

    logger_->debug(kSource, std::string("set Active -> ") + (on ? "1" : "0"));
    store_->set(Characteristic::Active, on ? 1 : 0);
    cb(Result::success(on ? 1 : 0));
  });
}
