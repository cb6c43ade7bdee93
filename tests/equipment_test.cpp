// FlowCal-Prod headers
#include "core/Equipment.hpp"
#include "core/Errors.hpp"

// FlowCal-Fake headers
#include "FakeInstruments.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace flowcal::test {

  using core::Equipment;
  using devices::VariableType;

  class EquipmentTest : public ::testing::Test {
  protected:
    std::vector<std::unique_ptr<devices::Instrument>> bench() {
      std::vector<std::unique_ptr<devices::Instrument>> list;
      list.push_back(std::make_unique<FakeDatalogger>(daq));
      list.push_back(std::make_unique<FakeMfc>(mfc));
      list.push_back(std::make_unique<FakeSupply>(supply));
      return list;
    }

    std::shared_ptr<FakeMfcState> mfc = std::make_shared<FakeMfcState>();
    std::shared_ptr<FakeDataloggerState> daq = std::make_shared<FakeDataloggerState>();
    std::shared_ptr<FakeSupplyState> supply = std::make_shared<FakeSupplyState>();
  };

  TEST_F(EquipmentTest, binds_capabilities_by_cross_cast) {
    Equipment equipment(bench());

    EXPECT_EQ(equipment.size(), 3u);
    EXPECT_TRUE(equipment.provides(VariableType::MassFlow));
    EXPECT_TRUE(equipment.provides(VariableType::Voltage));
    EXPECT_FALSE(equipment.provides(VariableType::Pressure));
    EXPECT_NE(equipment.supplyController(), nullptr);
    EXPECT_EQ(equipment.controllers().size(), 2u);

    daq->volts[101] = 2.5;
    EXPECT_DOUBLE_EQ(equipment.dutInterface().readChannel(101), 2.5);

    equipment.massFlowController().writeValue(4.0);
    EXPECT_EQ(mfc->setpoints, (std::vector<double>{ 4.0 }));
  }

  TEST_F(EquipmentTest, missing_roles_are_configuration_errors) {
    std::vector<std::unique_ptr<devices::Instrument>> list;
    list.push_back(std::make_unique<FakeDatalogger>(daq));
    Equipment equipment(std::move(list));

    EXPECT_THROW(equipment.massFlowController(), core::ConfigurationError);
    EXPECT_THROW(equipment.massFlowReference(), core::ConfigurationError);
    EXPECT_EQ(equipment.supplyController(), nullptr);
    EXPECT_THROW(equipment.read().value(VariableType::MassFlow), core::ConfigurationError);
  }

  TEST_F(EquipmentTest, rejects_null_instruments) {
    std::vector<std::unique_ptr<devices::Instrument>> list;
    list.push_back(nullptr);
    EXPECT_THROW(Equipment{ std::move(list) }, std::invalid_argument);
  }

  TEST_F(EquipmentTest, read_polls_each_reference_once) {
    mfc->massFlow = 10.05;
    Equipment equipment(bench());

    auto snapshot = equipment.read();
    EXPECT_DOUBLE_EQ(snapshot.value(VariableType::MassFlow), 10.05);
    EXPECT_EQ(mfc->reads, 1);
  }

  TEST_F(EquipmentTest, first_instrument_serves_a_shared_capability) {
    auto second = std::make_shared<FakeMfcState>();
    mfc->massFlow = 1.0;
    second->massFlow = 2.0;

    std::vector<std::unique_ptr<devices::Instrument>> list;
    list.push_back(std::make_unique<FakeMfc>(mfc));
    list.push_back(std::make_unique<FakeMfc>(second));
    Equipment equipment(std::move(list));

    EXPECT_DOUBLE_EQ(equipment.read().value(VariableType::MassFlow), 1.0);
    EXPECT_EQ(second->reads, 0);
    EXPECT_EQ(equipment.controllers().size(), 2u);
  }

  TEST_F(EquipmentTest, read_is_all_or_nothing) {
    mfc->failRead = true;
    Equipment equipment(bench());
    EXPECT_THROW(equipment.read(), core::TimeoutError);
  }

  TEST_F(EquipmentTest, open_fails_fast_in_configuration_order) {
    daq->failOpen = true;
    Equipment equipment(bench());

    EXPECT_THROW(equipment.open(), core::PortUnavailableError);
    EXPECT_EQ(mfc->opens.load(), 0);
  }

  TEST_F(EquipmentTest, close_visits_every_instrument_and_collects_errors) {
    mfc->failClose = true;
    Equipment equipment(bench());
    equipment.open();

    auto errors = equipment.close();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("FakeMfc"), std::string::npos);
    EXPECT_FALSE(daq->open);
    EXPECT_FALSE(supply->open);
    mfc->failClose = false; // let the destructor close cleanly
  }

  TEST_F(EquipmentTest, destruction_closes_everything) {
    {
      Equipment equipment(bench());
      equipment.open();
      EXPECT_TRUE(daq->open);
    }
    EXPECT_FALSE(daq->open);
    EXPECT_FALSE(mfc->open);
  }

  TEST_F(EquipmentTest, gas_goes_to_every_gas_selectable_instrument) {
    Equipment equipment(bench());
    equipment.selectGas(protocols::Gas::Nitrogen);
    EXPECT_EQ(mfc->gases, (std::vector<protocols::Gas>{ protocols::Gas::Nitrogen }));
  }

} // namespace flowcal::test
