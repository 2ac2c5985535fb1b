#pragma once
/** @file  Command.hpp
 *  @brief Fixed-width ASCII command frames understood by the television.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>

namespace tvlink {
  namespace protocols {

    /**
 * @struct Command
 * @brief A 4-character code followed by a space-padded parameter field and `\r`.
 *
 *  `POWR` + `1` with width 4 → `"POWR1   \r"`.
 */
    struct Command {
      static constexpr char kTerminator = '\r';
      static constexpr std::size_t kCodeWidth = 4;
      static constexpr std::size_t kParameterWidth = 4;

      std::string code;      ///< e.g. "POWR", "IAVD"
      std::string parameter; ///< e.g. "????", "1", "0003"
      std::size_t width{ kParameterWidth };

      std::string toWire() const;

      //---factories---------------------------------------------
      static Command powerQuery();
      static Command power(bool on);
      static Command inputQuery();
      /// Select input \p n (1..8); throws `std::out_of_range` otherwise.
      static Command selectInput(int n);

      /// Frame typed by an operator; `\r` appended when missing.
      static std::string raw(const std::string& text);
    };

  } // namespace protocols
} // namespace tvlink
