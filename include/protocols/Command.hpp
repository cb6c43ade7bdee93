#pragma once
/** @file  Command.hpp
 *  @brief One rendered instrument command, ready for the transport.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <utility>

namespace flowcal {
  namespace protocols {

    /**
 * @struct Command
 * @brief Exact wire text without the line terminator (framing belongs to the
 *        SerialChannel, which knows the link's terminator).
 */
    struct Command {
      std::string payload;
      bool expectsReply{ false };

      static Command write(std::string text) { return Command{ std::move(text), false }; }
      static Command query(std::string text) { return Command{ std::move(text), true }; }

      const std::string& toWire() const { return payload; }
    };

  } // namespace protocols
} // namespace flowcal
