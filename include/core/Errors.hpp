#pragma once
/** @file  Errors.hpp
 *  @brief Error kinds and exception types shared by transport, dispatcher and adapters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tvlink {
  namespace core {

    /**
 * @enum ErrorKind
 * @brief Outcome classification carried by every Reply / adapter Result.
 */
    enum class ErrorKind : std::uint8_t {
      None,       ///< success
      Connection, ///< transport could not be opened
      IO,         ///< write to the link failed
      Stall,      ///< no response before the deadline
      Protocol,   ///< response did not match the expected token set
      Rejected,   ///< queue bound reached, command never enqueued
      Shutdown    ///< dispatcher torn down before the command resolved
    };

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::None:
        return "None";
      case ErrorKind::Connection:
        return "Connection";
      case ErrorKind::IO:
        return "IO";
      case ErrorKind::Stall:
        return "Stall";
      case ErrorKind::Protocol:
        return "Protocol";
      case ErrorKind::Rejected:
        return "Rejected";
      case ErrorKind::Shutdown:
        return "Shutdown";
      default:
        return "Unknown";
      }
    }

    /// Transport could not be opened (bad path, busy device, unsupported baud).
    class ConnectionError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// A write on an open link failed.
    class IOError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// A dispatched command was never answered.
    class StallError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// A response line is not one the issuing adapter can interpret.
    class ProtocolError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

  } // namespace core
} // namespace tvlink
