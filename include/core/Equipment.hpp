#pragma once
/** @file  Equipment.hpp
 *  @brief The instruments selected for one run, exposed by capability only.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// FlowCal headers
#include "devices/Capabilities.hpp"
#include "devices/Types.hpp"
#include "protocols/Gas.hpp"

namespace flowcal::core {

  /**
 * @struct Snapshot
 * @brief One consistent poll cycle: for every reference kind, the full
 *        Reading of the instrument that serves it.
 */
  struct Snapshot {
    std::unordered_map<devices::VariableType, devices::Reading> byReference;

    /// Value of \p kind as reported by its reference; ConfigurationError if nothing serves it.
    double value(devices::VariableType kind) const;
  };

  /**
 * @class Equipment
 * @brief Exclusive owner of the run's drivers.
 *
 *  * Capabilities are bound by cross-casting each instrument; the first one
 *    providing a capability serves it.
 *  * open() fails fast; close() always visits every instrument.
 *  * read() is all-or-nothing per cycle.
 *  * Closes everything on destruction.
 */
  class Equipment {
  public:
    explicit Equipment(std::vector<std::unique_ptr<devices::Instrument>> instruments);
    ~Equipment();

    //---public API-------------------------------------------------------
    void open();
    std::vector<std::string> close(); ///< collected close failures (empty == clean)
    Snapshot read();
    void selectGas(protocols::Gas gas);

    //---capability views (ConfigurationError when missing)----------------
    devices::MassFlowController& massFlowController() const;
    devices::MassFlowReference& massFlowReference() const;
    devices::DutInterfaceDevice& dutInterface() const;
    devices::VoltageController* supplyController() const { return supply_; }

    std::vector<devices::ControlDevice*> controllers() const;
    bool provides(devices::VariableType reference) const;
    std::size_t size() const { return instruments_.size(); }

    //---non-copyable-----------------------------------------------------
    Equipment(const Equipment&) = delete;
    Equipment& operator=(const Equipment&) = delete;

  private:
    std::vector<std::unique_ptr<devices::Instrument>> instruments_;
    std::vector<std::pair<devices::VariableType, devices::ReferenceDevice*>> references_;
    std::vector<devices::ControlDevice*> controllers_;
    std::vector<devices::GasSelectable*> gasSelectable_;
    devices::MassFlowController* massFlowController_{ nullptr };
    devices::MassFlowReference* massFlowReference_{ nullptr };
    devices::DutInterfaceDevice* dutInterface_{ nullptr };
    devices::VoltageController* supply_{ nullptr };
  };

} // namespace flowcal::core
