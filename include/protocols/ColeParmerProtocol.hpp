#pragma once
/** @file  ColeParmerProtocol.hpp
 *  @brief Wire codec for the Cole-Parmer mass-flow controller polling protocol.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>
#include <vector>

// FlowCal headers
#include "protocols/Command.hpp"
#include "protocols/Gas.hpp"

namespace flowcal::protocols::coleparmer {

  /// Single device per link, so the unit always answers to this id.
  inline constexpr char kAddress = 'A';

  /// Minimum tokens in a data frame: address, P, T, volume flow, mass flow, setpoint, gas.
  inline constexpr std::size_t kFrameTokens = 7;

  /**
 * @struct DataFrame
 * @brief One polled frame, e.g. `A +014.70 +025.00 +002.00 +002.01 002.00 Air`.
 *
 *  Any tokens past the gas are status flags (MOV, VOV, OPL…) and are kept as-is.
 */
  struct DataFrame {
    char address{ kAddress };
    double pressure{ 0.0 };
    double temperature{ 0.0 };
    double volumeFlow{ 0.0 };
    double massFlow{ 0.0 };
    double setpoint{ 0.0 };
    std::string gas;
    std::vector<std::string> status;
  };

  //---commands-----------------------------------------------------------
  Command assignAddress();         ///< "*@=A": sets the id and puts the unit in polling mode
  Command poll();                  ///< "A"
  Command setSetpoint(double value); ///< "AS4.540"
  Command selectGas(Gas gas);      ///< "A$$12"

  //---replies------------------------------------------------------------
  /// Throws core::UnexpectedResponseError on a short frame, bad number or foreign address.
  DataFrame parseFrame(const std::string& line);

} // namespace flowcal::protocols::coleparmer
