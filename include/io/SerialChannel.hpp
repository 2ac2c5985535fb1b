#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B9600

namespace tvlink {
  namespace io {

    enum class Parity : std::uint8_t { None, Even, Odd };

    /** Character framing of the link, defaults to 8N1 without RTS/CTS. */
    struct FrameConfig {
      int dataBits{ 8 }; ///< 5..8
      Parity parity{ Parity::None };
      int stopBits{ 1 }; ///< 1 or 2
      bool hardwareFlowControl{ false };
      char delimiter{ '\r' }; ///< line terminator on the receive side
      /// write() gives up once the tx queue accepts no byte for this long
      std::chrono::milliseconds writeStallTimeout{ 1000 };
    };

    /// Maps a numeric baud rate onto the termios constant, nullopt if unsupported.
    std::optional<speed_t> toSpeed(int baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames inbound bytes as lines split on `FrameConfig::delimiter`.
 *  * Outbound bytes are written verbatim, the caller supplies the terminator.
 *  * Held by pointer; neither copyable nor movable.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, int baud, const FrameConfig& frame = {});
      virtual bool write(const std::string& bytes); // false on EIO, hang-up or a stalled tx queue
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0 && !hungUp_; }
      virtual void close();

      /// errno text of the last failed operation (empty if none).
      std::string lastError() const;

      //---non-copyable, non-movable (fd shared with the reader thread)---
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;
      SerialChannel(SerialChannel&&) = delete;
      SerialChannel& operator=(SerialChannel&&) = delete;

    private:
      std::optional<std::string> takeLine();
      void fail(const char* what);
      void setError(std::string text);

      int fd_{ -1 };                     ///< POSIX fd (-1==closed)
      std::atomic<bool> hungUp_{ false }; ///< peer gone, fd kept until close()
      char delimiter_{ '\r' };           ///< set from FrameConfig at open
      std::chrono::milliseconds writeStall_{ 1000 }; ///< set from FrameConfig at open
      std::string rx_buffer_{};          ///< bytes received but not yet returned as a line
      mutable std::mutex errMtx_;        ///< reader and writer threads both record errors
      std::string lastError_{};
    };
  } // namespace io
} // namespace tvlink
