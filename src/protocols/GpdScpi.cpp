/* @file GpdScpi.cpp
 * @brief GPD-X303S command rendering and reply parsing.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// FlowCal headers
#include "protocols/GpdScpi.hpp"
#include "core/Errors.hpp"
#include "protocols/Response.hpp"

namespace flowcal::protocols::gpd {

  namespace {
    std::string withChannel(const char* mnemonic, unsigned channel) {
      return std::string(mnemonic) + std::to_string(channel);
    }
  } // namespace

  Command setVoltage(unsigned channel, double volts) {
    return Command::write(withChannel("VSET", channel) + ":" + formatFixed(volts, 3));
  }

  Command setCurrent(unsigned channel, double amps) {
    return Command::write(withChannel("ISET", channel) + ":" + formatFixed(amps, 3));
  }

  Command queryVoltageSetpoint(unsigned channel) {
    return Command::query(withChannel("VSET", channel) + "?");
  }

  Command queryCurrentSetpoint(unsigned channel) {
    return Command::query(withChannel("ISET", channel) + "?");
  }

  Command queryVoltage(unsigned channel) { return Command::query(withChannel("VOUT", channel) + "?"); }

  Command queryCurrent(unsigned channel) { return Command::query(withChannel("IOUT", channel) + "?"); }

  Command output(bool on) { return Command::write(on ? "OUT1" : "OUT0"); }

  double parseValue(const std::string& line) {
    auto response = Response::fromWire(line);
    if (!response)
      throw core::UnexpectedResponseError("empty reply from power supply");

    std::string value = response->last();
    while (!value.empty() && (value.back() == 'V' || value.back() == 'A'))
      value.pop_back();

    auto parsed = parseNumber(value);
    if (!parsed)
      throw core::UnexpectedResponseError("power supply reply \"" + response->raw + "\" is not a value");
    return *parsed;
  }

} // namespace flowcal::protocols::gpd
