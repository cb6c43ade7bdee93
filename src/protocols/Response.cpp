/* @file Response.cpp
 * @brief Reply tokenisation and locale-independent number conversion.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <charconv>
#include <cmath>
#include <system_error>

// FlowCal headers
#include "core/Errors.hpp"
#include "protocols/Response.hpp"

using namespace flowcal::protocols;
using flowcal::core::UnexpectedResponseError;

std::optional<Response> Response::fromWire(const std::string& line) {
  Response response;
  response.raw.reserve(line.size());
  for (char c : line) {
    if (c != '\r' && c != '\n' && c != '\t')
      response.raw.push_back(c);
  }

  std::size_t pos = 0;
  while (pos < response.raw.size()) {
    auto start = response.raw.find_first_not_of(' ', pos);
    if (start == std::string::npos)
      break;
    auto end = response.raw.find(' ', start);
    if (end == std::string::npos)
      end = response.raw.size();
    response.tokens.emplace_back(response.raw.substr(start, end - start));
    pos = end;
  }

  if (response.tokens.empty())
    return std::nullopt;
  return response;
}

const std::string& Response::token(std::size_t i) const {
  if (i >= tokens.size()) {
    throw UnexpectedResponseError("expected at least " + std::to_string(i + 1) +
                                  " tokens in reply \"" + raw + "\"");
  }
  return tokens[i];
}

double Response::number(std::size_t i) const {
  const auto& text = token(i);
  auto value = parseNumber(text);
  if (!value)
    throw UnexpectedResponseError("token \"" + text + "\" in reply \"" + raw + "\" is not a number");
  return *value;
}

const std::string& Response::last() const {
  if (tokens.empty())
    throw UnexpectedResponseError("empty reply");
  return tokens.back();
}

std::string flowcal::protocols::formatFixed(double value, int decimals) {
  if (!std::isfinite(value))
    throw std::invalid_argument("cannot format a non-finite value for an instrument");
  if (value == 0.0)
    value = 0.0; // fold -0.0 so it never reaches the wire with a sign

  std::array<char, 64> buf{};
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                 std::chars_format::fixed, decimals);
  if (ec != std::errc())
    throw std::invalid_argument("value too large to format for an instrument");
  return std::string(buf.data(), ptr);
}

std::optional<double> flowcal::protocols::parseNumber(std::string_view text) {
  if (!text.empty() && text.front() == '+')
    text.remove_prefix(1); // from_chars rejects an explicit plus sign
  if (text.empty())
    return std::nullopt;

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size())
    return std::nullopt;
  return value;
}
