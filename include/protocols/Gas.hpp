#pragma once
/** @file  Gas.hpp
 *  @brief Gas selection table for mass-flow instruments (enum → device index + echo).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace flowcal {
  namespace protocols {

    enum class Gas : std::uint8_t {
      Air,
      Argon,
      Methane,
      CarbonMonoxide,
      CarbonDioxide,
      Ethane,
      Hydrogen,
      Helium,
      Nitrogen,
      NitrousOxide,
      Neon,
      Oxygen,
      Propane,
      NormalButane,
      Acetylene,
      Ethylene,
      IsoButane,
      Krypton,
      Xenon,
      SulfurHexafluoride,
      C25,
      C10,
      C8,
      C2,
      C75,
      He25,
      He75,
      A1025,
      Star29,
      P5,
      Count
    };

    /**
 * @struct GasCode
 * @brief `index` is what we send to select the gas, `echo` is what the
 *        instrument reports back in its data frame once it is active.
 */
    struct GasCode {
      Gas gas;
      int index;
      std::string_view echo;
      std::string_view name;
    };

    inline constexpr std::array<GasCode, static_cast<std::size_t>(Gas::Count)> kGasTable{ {
        { Gas::Air, 0, "Air", "Air" },
        { Gas::Argon, 1, "Ar", "Argon" },
        { Gas::Methane, 2, "CH4", "Methane" },
        { Gas::CarbonMonoxide, 3, "CO", "CarbonMonoxide" },
        { Gas::CarbonDioxide, 4, "CO2", "CarbonDioxide" },
        { Gas::Ethane, 5, "C2H6", "Ethane" },
        { Gas::Hydrogen, 6, "H2", "Hydrogen" },
        { Gas::Helium, 7, "He", "Helium" },
        { Gas::Nitrogen, 8, "N2", "Nitrogen" },
        { Gas::NitrousOxide, 9, "N2O", "NitrousOxide" },
        { Gas::Neon, 10, "Ne", "Neon" },
        { Gas::Oxygen, 11, "O2", "Oxygen" },
        { Gas::Propane, 12, "C3H8", "Propane" },
        { Gas::NormalButane, 13, "nC4H10", "NormalButane" },
        { Gas::Acetylene, 14, "C2H2", "Acetylene" },
        { Gas::Ethylene, 15, "C2H4", "Ethylene" },
        { Gas::IsoButane, 16, "iC4H10", "IsoButane" }, // manual misprints this code
        { Gas::Krypton, 17, "Kr", "Krypton" },
        { Gas::Xenon, 18, "Xe", "Xenon" },
        { Gas::SulfurHexafluoride, 19, "SF6", "SulfurHexafluoride" },
        { Gas::C25, 20, "C-25", "C25" },
        { Gas::C10, 21, "C-10", "C10" },
        { Gas::C8, 22, "C-8", "C8" },
        { Gas::C2, 23, "C-2", "C2" },
        { Gas::C75, 24, "C-75", "C75" },
        { Gas::He25, 25, "He-25", "He25" }, // manual misprints this code
        { Gas::He75, 26, "He-75", "He75" }, // manual misprints this code
        { Gas::A1025, 27, "A1025", "A1025" },
        { Gas::Star29, 28, "Star29", "Star29" },
        { Gas::P5, 29, "P-5", "P5" },
    } };

    /// Table rows are in enum order; checked by the unit tests.
    inline const GasCode& gasCode(Gas g) { return kGasTable.at(static_cast<std::size_t>(g)); }

    inline std::string_view toString(Gas g) { return gasCode(g).name; }

    /// Accepts either the enum name ("Propane") or the device echo ("C3H8").
    inline std::optional<Gas> gasFromString(std::string_view text) {
      for (const auto& row : kGasTable) {
        if (row.name == text || row.echo == text)
          return row.gas;
      }
      return std::nullopt;
    }

  } // namespace protocols
} // namespace flowcal
