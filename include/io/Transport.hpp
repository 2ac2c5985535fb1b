#pragma once
/** @file  Transport.hpp
 *  @brief Abstract line-oriented link to one device.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <string>

namespace tvlink::io {

  /**
 * @class Transport
 * @brief Writes raw frames and publishes every decoded inbound line.
 *
 *  * No retries and no framing beyond line splitting.
 *  * Unsolicited lines are published like any other; filtering is the
 *    subscriber's job.
 */
  class Transport {
  public:
    using LineHandler = std::function<void(const std::string&)>;
    using SubscriptionId = std::size_t;

    virtual ~Transport() = default;

    /// Send one frame verbatim. Throws `core::IOError` on a broken link.
    virtual void write(const std::string& bytes) = 0;

    /**
     * @brief Register \p onLine for every line received from now on.
     *
     * Handlers run on the transport's receive context, one line at a time,
     * and must not subscribe or unsubscribe from inside the handler.
     */
    virtual SubscriptionId subscribe(LineHandler onLine) = 0;

    /// Remove a handler; once this returns the handler is never called again.
    virtual void unsubscribe(SubscriptionId id) = 0;
  };

} // namespace tvlink::io
