#pragma once
/** @file  CharacteristicAdapter.hpp
 *  @brief Abstract base class for every characteristic get/set translator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>
#include <utility>

#include "core/Errors.hpp"

namespace tvlink::adapters {

  /// Value (or failure) reported back to the host for one get/set.
  struct Result {
    core::ErrorKind kind{ core::ErrorKind::None };
    int value{ 0 };
    std::string detail;

    bool ok() const { return kind == core::ErrorKind::None; }

    static Result success(int value = 0) { return Result{ core::ErrorKind::None, value, {} }; }
    static Result failure(core::ErrorKind kind, std::string detail) {
      return Result{ kind, 0, std::move(detail) };
    }
  };

  /**
 * @class CharacteristicAdapter
 * @brief Common polymorphic interface that every concrete characteristic
 *        (power, input, ...) must implement.
 *
 *  * Builds a command, hands it to a core::CommandSink, interprets the reply.
 *  * Owns no hardware and never blocks; results arrive through the callback.
 *  * Deciding whether a reply is "unexpected" is the adapter's job, never the core's.
 */
  class CharacteristicAdapter {
  public:
    using Callback = std::function<void(const Result&)>;

    virtual ~CharacteristicAdapter() = default;

    /// Key used by the registry and the command line ("power", "input").
    virtual const char* name() const = 0;

    virtual void get(Callback cb) = 0;
    virtual void set(int value, Callback cb) = 0;
  };

} // namespace tvlink::adapters
