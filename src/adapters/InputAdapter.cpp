/* @file InputAdapter.cpp
 * @brief input index ↔ IAVD id translation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// tvlink headers
#include "adapters/InputAdapter.hpp"
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
  constexpr const char* kSource = "InputAdapter";
}

InputAdapter::InputAdapter(core::CommandSink& sink, std::vector<core::InputDefinition> inputs,
                           std::shared_ptr<core::CharacteristicStore> store,
                           std::shared_ptr<core::Logger> logger)
    : sink_(sink), inputs_(std::move(inputs)), store_(std::move(store)),
      logger_(std::move(logger)) {}

std::optional<int> InputAdapter::indexOf(int id) const {
  for (std::size_t i = 0; i < inputs_.size(); ++i) {
    if (inputs_[i].id == id)
      return static_cast<int>(i);
  }
  return std::nullopt;
}

void InputAdapter::get(Callback cb) {
  sink_.send(Command::inputQuery().toWire(), [this, cb = std::move(cb)](const Reply& reply) {
    if (!reply.ok()) {
      logger_->warn(kSource, std::string("get ActiveIdentifier failed: ") + reply.detail);
      cb(Result::failure(reply.kind, reply.detail));
      return;
    }

    auto r = Response::fromWire(reply.line);
    if (!r || r->kind != Response::Kind::InputId) {
      std::string errMsg = "input query returned '" + reply.line + "'";
      logger_->error(kSource, errMsg);
      cb(Result::failure(ErrorKind::Protocol, errMsg));
      return;
    }

    auto index = indexOf(r->value);
    if (!index) {
      std::string errMsg = "device reports input " + r->text + " which is not configured";
      logger_->error(kSource, errMsg);
      cb(Result::failure(ErrorKind::Protocol, errMsg));
      return;
    }

    logger_->debug(kSource, "get ActiveIdentifier -> " + std::to_string(*index));
    store_->set(Characteristic::ActiveIdentifier, *index);
    cb(Result::success(*index));
  });
}

void InputAdapter::set(int index, Callback cb) {
  if (index < 0 || static_cast<std::size_t>(index) >= inputs_.size()) {
    std::string errMsg = "input index " + std::to_string(index) + " is not configured";
    logger_->error(kSource, errMsg);
    cb(Result::failure(ErrorKind::Protocol, errMsg));
    return;
  }

  const auto frame = Command::selectInput(inputs_[index].id).toWire();
  sink_.send(frame, [this, index, cb = std::move(cb)](const Reply& reply) {
    if (!reply.ok()) {
      logger_->warn(kSource, std::string("set ActiveIdentifier failed: ") + reply.detail);
      cb(Result::failure(reply.kind, reply.detail));
      return;
    }

    auto r = Response::fromWire(reply.line);
    if (!r || r->kind != Response::Kind::Ok) {
      std::string errMsg = "input select returned '" + reply.line + "'";
      logger_->error(kSource, errMsg);
      cb(Result::failure(ErrorKind::Protocol, errMsg));
      return;
    }

    logger_->debug(kSource, "set ActiveIdentifier -> " + std::to_string(index) + " (" +
                                inputs_[index].name + ")");
    store_->set(Characteristic::ActiveIdentifier, index);
    cb(Result::success(index));
  });
}
