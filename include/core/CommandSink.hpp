#pragma once
/** @file  CommandSink.hpp
 *  @brief "Send a frame, get exactly one Reply" capability handed to adapters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>

// tvlink headers
#include "core/Errors.hpp"

namespace tvlink::core {

  /// Result of one command: the correlated line, or why there is none.
  struct Reply {
    ErrorKind kind{ ErrorKind::None };
    std::string line;   ///< response text (delimiter excluded) when ok()
    std::string detail; ///< human-readable failure reason otherwise

    bool ok() const { return kind == ErrorKind::None; }

    static Reply success(std::string line) { return Reply{ ErrorKind::None, std::move(line), {} }; }
    static Reply failure(ErrorKind kind, std::string detail) {
      return Reply{ kind, {}, std::move(detail) };
    }
  };

  /**
 * @class CommandSink
 * @brief Narrow interface adapters talk to; keeps them ignorant of queueing and I/O.
 */
  class CommandSink {
  public:
    using ResponseHandler = std::function<void(const Reply&)>;

    virtual ~CommandSink() = default;

    /**
     * @brief Queue \p payload; \p onResponse is called exactly once, later.
     *
     * Never throws and never calls \p onResponse before returning. Waits at
     * most for one bounded transport write.
     */
    virtual void send(std::string payload, ResponseHandler onResponse) = 0;

    /// Future-returning form of send().
    std::future<Reply> request(std::string payload) {
      auto promise = std::make_shared<std::promise<Reply>>();
      auto future = promise->get_future();
      send(std::move(payload), [promise](const Reply& reply) { promise->set_value(reply); });
      return future;
    }
  };

} // namespace tvlink::core
