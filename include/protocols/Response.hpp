#pragma once
/** @file  Response.hpp
 *  @brief Classification of the single line the television sends per command.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

namespace tvlink {
  namespace protocols {

    struct Response {
      enum class Kind : std::uint8_t {
        Ok,     ///< "OK"
        Err,    ///< "ERR"
        Status, ///< single digit, e.g. power state
        InputId ///< four digits, e.g. "0003"
      };

      Kind kind{ Kind::Ok };
      std::string text; ///< trimmed line
      int value{ 0 };   ///< numeric value for Status / InputId

      /// nullopt if the line is none of the known shapes.
      static std::optional<Response> fromWire(const std::string& line);
    };

    const char* toString(Response::Kind kind);

  } // namespace protocols
} // namespace tvlink
