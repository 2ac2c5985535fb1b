#pragma once
/** @file  SerialTransport.hpp
 *  @brief Transport over a SerialChannel with a background line reader.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// tvlink headers
#include "io/SerialChannel.hpp"
#include "io/Transport.hpp"

namespace tvlink {
  namespace core {
    class ErrorMonitor;
    class Logger;
  } // namespace core

  namespace io {

    /**
 * @class SerialTransport
 * @brief Owns one SerialChannel; a worker thread turns inbound bytes into
 *        line events for every subscriber.
 *
 *  * `write()` is serialised with a mutex, so concurrent writers never interleave frames.
 *  * A hang-up stops the reader and is reported once to the ErrorMonitor.
 */
    class SerialTransport : public Transport {
    public:
      SerialTransport(std::shared_ptr<core::Logger> logger,
                      std::shared_ptr<core::ErrorMonitor> errMonitor,
                      std::unique_ptr<SerialChannel> channel = std::make_unique<SerialChannel>());
      ~SerialTransport() override; ///< stops the reader and closes the channel

      /// Opens the device and starts reading. Throws `core::ConnectionError`.
      void open(const std::string& path, int baud, const FrameConfig& frame = {});
      void close();
      bool isOpen() const;

      //---Transport--------------------------------------------
      void write(const std::string& bytes) override;
      SubscriptionId subscribe(LineHandler onLine) override;
      void unsubscribe(SubscriptionId id) override;

      //---non-copyable-----------------------------------------
      SerialTransport(const SerialTransport&) = delete;
      SerialTransport& operator=(const SerialTransport&) = delete;

    private:
      static constexpr std::chrono::milliseconds kReadSlice{ 100 }; ///< reader wake-up period

      void readLoop();
      void publish(const std::string& line);

      std::shared_ptr<core::Logger> logger_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      std::unique_ptr<SerialChannel> channel_;
      std::string path_;

      std::mutex writeMtx_;
      std::mutex handlersMtx_;
      std::vector<std::pair<SubscriptionId, LineHandler>> handlers_;
      SubscriptionId nextId_{ 1 };

      std::thread reader_;
      std::atomic<bool> running_{ false };
    };

  } // namespace io
} // namespace tvlink
