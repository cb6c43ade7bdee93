// FlowCal-Prod headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceFactory.hpp"
#include "core/Dut.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/EventChannel.hpp"
#include "core/ProtocolFactory.hpp"
#include "core/RingBuffer.hpp"
#include "core/Settings.hpp"
#include "devices/ColeParmerMFC.hpp"
#include "devices/Keysight34972A.hpp"
#include "protocols/CalibrationProtocol.hpp"

// 3rd-party
#include <nlohmann/json.hpp>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace flowcal::core;
using nlohmann::json;

namespace {

  json benchDocument() {
    return json::parse(R"({
      "equipment": {
        "gas": "N2",
        "dutSupplyVoltage": 12.0,
        "instruments": [
          { "model": "ColeParmerMFC", "port": "/dev/ttyUSB0", "echoTolerance": 0.5 },
          { "model": "Keysight34972A", "port": "/dev/ttyUSB1", "baudRate": 19200,
            "dataBits": 7, "parity": "even", "readTimeoutMs": 3000 }
        ]
      },
      "models": [ { "label": "FS-5V", "outputMin": 0.5, "outputMax": 4.5, "presenceThreshold": 0.2 } ],
      "ranges": [ { "label": "0-10 SLPM", "min": 0, "max": 10 } ],
      "tests": [ { "label": "Standard", "setpoints": [ 2.5, 5, 10 ], "dwellMs": 2000,
                   "samples": 5, "sampleIntervalMs": 200, "tolerancePercent": 2.0 } ],
      "range": "0-10 SLPM",
      "test": "Standard",
      "duts": [ { "serialNumber": "A100", "model": "FS-5V" }, { "selected": false } ],
      "logDirectory": "/tmp/flowcal"
    })");
  }

} // namespace

//---ErrorMonitor------------------------------------------------------------
TEST(error_monitor, escalates_each_unique_failure_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("port lost");
  monitor.notifyFailure("port lost");
  monitor.notifyFailure("gas mismatch");

  EXPECT_EQ(escalated, (std::vector<std::string>{ "port lost", "gas mismatch" }));
  EXPECT_EQ(monitor.failures().size(), 2u);

  monitor.reset();
  EXPECT_TRUE(monitor.failures().empty());
  monitor.notifyFailure("port lost");
  EXPECT_EQ(escalated.size(), 3u);
}

TEST(error_monitor, works_without_an_escalation_callback) {
  ErrorMonitor monitor;
  EXPECT_NO_THROW(monitor.notifyFailure("nobody listening"));
  EXPECT_EQ(monitor.failures(), (std::vector<std::string>{ "nobody listening" }));
}

//---RingBuffer---------------------------------------------------------------
TEST(ring_buffer, is_a_bounded_fifo) {
  RingBuffer<int> buffer(2);
  EXPECT_TRUE(buffer.push(1));
  EXPECT_TRUE(buffer.push(2));
  EXPECT_FALSE(buffer.push(3));
  EXPECT_EQ(buffer.size(), 2u);

  EXPECT_EQ(buffer.pop(std::chrono::milliseconds{ 0 }), 1);
  EXPECT_TRUE(buffer.push(3));
  EXPECT_EQ(buffer.pop(std::chrono::milliseconds{ 0 }), 2);
  EXPECT_EQ(buffer.pop(std::chrono::milliseconds{ 0 }), 3);
  EXPECT_FALSE(buffer.pop(std::chrono::milliseconds{ 10 }));
  EXPECT_EQ(buffer.capacity(), 2u);
}

//---EventChannel-------------------------------------------------------------
TEST(event_channel, queues_observer_calls_in_order) {
  EventChannel channel;
  channel.onDutSerialNumberChanged(1, "DUT1");
  channel.onDutStatusChanged(1, DutStatus::Found);
  channel.onProgress(40, "Searching for DUT 1...");
  channel.onFinished();

  auto first = channel.next(std::chrono::milliseconds{ 0 });
  ASSERT_TRUE(first);
  EXPECT_EQ(first->type, RunEvent::Type::DutSerialNumber);
  EXPECT_EQ(first->text, "DUT1");

  auto rest = channel.drain();
  ASSERT_EQ(rest.size(), 3u);
  EXPECT_EQ(rest[0].status, DutStatus::Found);
  EXPECT_EQ(rest[1].percent, 40);
  EXPECT_EQ(rest[2].type, RunEvent::Type::Finished);

  EXPECT_FALSE(channel.next(std::chrono::milliseconds{ 10 }));
}

//---DUT model conversion-----------------------------------------------------
TEST(dut, converts_output_voltage_to_flow) {
  Dut dut;
  dut.model = { "FS-5V", 0.5, 4.5, 0.2 };
  RangeSetting range{ "0-10 SLPM", 0.0, 10.0 };

  EXPECT_DOUBLE_EQ(dut.toFlow(0.5, range), 0.0);
  EXPECT_DOUBLE_EQ(dut.toFlow(2.5, range), 5.0);
  EXPECT_DOUBLE_EQ(dut.toFlow(4.5, range), 10.0);
  EXPECT_TRUE(dut.isPresent(0.2));
  EXPECT_FALSE(dut.isPresent(0.1));
  EXPECT_STREQ(toString(DutStatus::PortError), "Port Error");
}

//---configuration-------------------------------------------------------------
TEST(config, maps_document_onto_run_config) {
  auto config = toRunConfig(benchDocument());

  ASSERT_EQ(config.equipment.instruments.size(), 2u);
  EXPECT_EQ(config.equipment.gas, flowcal::protocols::Gas::Nitrogen);
  EXPECT_EQ(config.equipment.dutSupplyVoltage, 12.0);
  EXPECT_EQ(config.equipment.dutChannelBase, 100u);

  const auto& mfc = config.equipment.instruments[0];
  EXPECT_EQ(mfc.model, "ColeParmerMFC");
  EXPECT_EQ(mfc.echoTolerance, 0.5);
  EXPECT_FALSE(mfc.serial.baudRate);

  const auto& daq = config.equipment.instruments[1];
  EXPECT_EQ(daq.serial.baudRate, 19200);
  EXPECT_EQ(daq.serial.parity, flowcal::io::Parity::Even);

  const auto& test = findTest(config, "Standard");
  EXPECT_EQ(test.protocol, "FlowSweep");
  EXPECT_EQ(test.setpoints, (std::vector<double>{ 2.5, 5.0, 10.0 }));
  EXPECT_EQ(test.dwell, std::chrono::milliseconds{ 2000 });
  EXPECT_EQ(test.samples, 5u);

  ASSERT_EQ(config.duts.size(), 2u);
  EXPECT_TRUE(config.duts[0].selected);
  EXPECT_FALSE(config.duts[1].selected);
  EXPECT_EQ(config.logDirectory, "/tmp/flowcal");
}

TEST(config, unset_serial_fields_keep_model_defaults) {
  auto config = toRunConfig(benchDocument());

  auto mfc = config.equipment.instruments[0].serial.applyTo(
      flowcal::devices::ColeParmerMFC::defaultSettings(""));
  EXPECT_EQ(mfc.port, "/dev/ttyUSB0");
  EXPECT_EQ(mfc.baudRate, 19200);
  EXPECT_EQ(mfc.lineTerminator, "\r");

  auto daq = config.equipment.instruments[1].serial.applyTo(
      flowcal::devices::Keysight34972A::defaultSettings(""));
  EXPECT_EQ(daq.dataBits, 7);
  EXPECT_EQ(daq.readTimeout, std::chrono::milliseconds{ 3000 });
  EXPECT_EQ(daq.writeTimeout, std::chrono::milliseconds{ 500 });
}

TEST(config, errors_name_the_offending_key) {
  auto doc = benchDocument();
  doc["tests"][0].erase("setpoints");
  try {
    toRunConfig(doc);
    FAIL() << "missing setpoints should throw";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("tests[0].setpoints"));
  }

  doc = benchDocument();
  doc["equipment"]["gas"] = "Unobtainium";
  EXPECT_THROW(toRunConfig(doc), std::runtime_error);

  doc = benchDocument();
  doc["equipment"]["instruments"][1]["parity"] = "mark";
  EXPECT_THROW(toRunConfig(doc), std::runtime_error);

  doc = benchDocument();
  doc["ranges"][0]["min"] = "zero";
  EXPECT_THROW(toRunConfig(doc), std::runtime_error);
}

TEST(config, negative_counts_are_rejected_not_wrapped) {
  auto doc = benchDocument();
  doc["tests"][0]["samples"] = -1;
  try {
    toRunConfig(doc);
    FAIL() << "negative samples should throw";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("tests[0].samples"));
  }

  doc = benchDocument();
  doc["equipment"]["dutChannelBase"] = -100;
  EXPECT_THROW(toRunConfig(doc), std::runtime_error);

  doc = benchDocument();
  doc["equipment"]["instruments"][0]["channel"] = -2;
  EXPECT_THROW(toRunConfig(doc), std::runtime_error);

  doc = benchDocument();
  doc["tests"][0]["dwellMs"] = -5;
  EXPECT_THROW(toRunConfig(doc), std::runtime_error);

  doc = benchDocument();
  doc["equipment"]["dutChannelBase"] = 200;
  EXPECT_EQ(toRunConfig(doc).equipment.dutChannelBase, 200u);
}

TEST(config, loader_reads_a_file) {
  const std::string path = ::testing::TempDir() + "flowcal_config.json";
  {
    std::ofstream out(path);
    out << benchDocument().dump(2);
  }
  auto config = ConfigLoader(path).loadRunConfig();
  EXPECT_EQ(config.testLabel, "Standard");
  std::remove(path.c_str());

  EXPECT_THROW(ConfigLoader("/nonexistent/flowcal.json").load(), std::runtime_error);
}

TEST(config, label_lookups_throw_configuration_errors) {
  auto config = toRunConfig(benchDocument());
  EXPECT_EQ(findRange(config, "0-10 SLPM").max, 10.0);
  EXPECT_THROW(findModel(config, "FS-10V"), ConfigurationError);
  EXPECT_THROW(findRange(config, "0-1 SLPM"), ConfigurationError);
}

//---factories------------------------------------------------------------------
TEST(device_factory, builds_registered_models_only) {
  auto factory = DeviceFactory::withBuiltins();
  EXPECT_TRUE(factory->knows("ColeParmerMFC"));
  EXPECT_TRUE(factory->knows("GPDX303S"));
  EXPECT_TRUE(factory->knows("Keysight34972A"));
  EXPECT_FALSE(factory->registerModel("GPDX303S", nullptr));

  auto config = toRunConfig(benchDocument());
  auto instruments = factory->createAll(config.equipment.instruments);
  ASSERT_EQ(instruments.size(), 2u);
  EXPECT_EQ(instruments[0]->model(), "Cole-Parmer MFC");
  EXPECT_FALSE(instruments[0]->isOpen());

  InstrumentSetting unknown;
  unknown.model = "Fluke 8846A";
  EXPECT_THROW(factory->create(unknown), ConfigurationError);
}

TEST(protocol_factory, knows_the_flow_sweep) {
  auto factory = ProtocolFactory::withBuiltins();
  EXPECT_TRUE(factory->knows("FlowSweep"));
  EXPECT_NE(factory->create("FlowSweep"), nullptr);
  EXPECT_THROW(factory->create("PressureSweep"), ConfigurationError);
}
