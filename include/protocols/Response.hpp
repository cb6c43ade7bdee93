#pragma once
/** @file  Response.hpp
 *  @brief Tokenised instrument reply with typed accessors.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowcal {
  namespace protocols {

    /**
 * @struct Response
 * @brief Whitespace-delimited tokens of one reply line.
 *
 *  * `\r`, `\n` and `\t` are stripped before splitting.
 *  * Accessors throw core::UnexpectedResponseError rather than returning junk.
 */
    struct Response {
      std::string raw;
      std::vector<std::string> tokens;

      /// nullopt when the line holds no tokens at all.
      static std::optional<Response> fromWire(const std::string& line);

      std::size_t size() const { return tokens.size(); }
      const std::string& token(std::size_t i) const;
      double number(std::size_t i) const;
      const std::string& last() const;
    };

    //---number formatting (never locale dependent)-----------------------
    std::string formatFixed(double value, int decimals);
    std::optional<double> parseNumber(std::string_view text);

  } // namespace protocols
} // namespace flowcal
