/* @file ColeParmerProtocol.cpp
 * @brief Cole-Parmer MFC command rendering and data-frame parsing.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// FlowCal headers
#include "protocols/ColeParmerProtocol.hpp"
#include "core/Errors.hpp"
#include "protocols/Response.hpp"

namespace flowcal::protocols::coleparmer {

  Command assignAddress() { return Command::query(std::string("*@=") + kAddress); }

  Command poll() { return Command::query(std::string(1, kAddress)); }

  Command setSetpoint(double value) {
    return Command::query(std::string(1, kAddress) + "S" + formatFixed(value, 3));
  }

  Command selectGas(Gas gas) {
    return Command::query(std::string(1, kAddress) + "$$" + std::to_string(gasCode(gas).index));
  }

  DataFrame parseFrame(const std::string& line) {
    auto response = Response::fromWire(line);
    if (!response)
      throw core::UnexpectedResponseError("empty frame from mass flow controller");

    if (response->size() < kFrameTokens) {
      throw core::UnexpectedResponseError("mass flow controller frame has " +
                                          std::to_string(response->size()) + " tokens, expected " +
                                          std::to_string(kFrameTokens) + ": \"" + response->raw +
                                          "\"");
    }

    const auto& id = response->token(0);
    if (id.size() != 1 || id[0] != kAddress) {
      throw core::UnexpectedResponseError("mass flow controller frame from device \"" + id +
                                          "\", expected \"" + std::string(1, kAddress) + "\"");
    }

    DataFrame frame;
    frame.address = id[0];
    frame.pressure = response->number(1);
    frame.temperature = response->number(2);
    frame.volumeFlow = response->number(3);
    frame.massFlow = response->number(4);
    frame.setpoint = response->number(5);
    frame.gas = response->token(6);
    frame.status.assign(response->tokens.begin() + kFrameTokens, response->tokens.end());
    return frame;
  }

} // namespace flowcal::protocols::coleparmer
