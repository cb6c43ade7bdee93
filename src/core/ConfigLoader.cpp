/* @file ConfigLoader.cpp
 * @brief JSON configuration → RunConfig.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>

// 3rd-party
#include <nlohmann/json.hpp>

// FlowCal headers
#include "core/ConfigLoader.hpp"

using namespace flowcal::core;
using nlohmann::json;

namespace {

  [[noreturn]] void badKey(const std::string& where, const std::string& key,
                           const std::string& why) {
    throw std::runtime_error("[ConfigLoader] " + where + "." + key + ": " + why);
  }

  template <typename T>
  T requiredField(const json& obj, const std::string& where, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end())
      badKey(where, key, "missing");
    try {
      return it->get<T>();
    } catch (const json::exception& e) {
      badKey(where, key, e.what());
    }
  }

  template <typename T>
  std::optional<T> optionalField(const json& obj, const std::string& where, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return std::nullopt;
    try {
      return it->get<T>();
    } catch (const json::exception& e) {
      badKey(where, key, e.what());
    }
  }

  // Counts, channels and durations: integers that may not be negative.
  std::optional<unsigned> optionalCount(const json& obj, const std::string& where,
                                        const std::string& key) {
    auto value = optionalField<long long>(obj, where, key);
    if (!value)
      return std::nullopt;
    if (*value < 0)
      badKey(where, key, "must not be negative");
    if (*value > static_cast<long long>(std::numeric_limits<unsigned>::max()))
      badKey(where, key, "out of range");
    return static_cast<unsigned>(*value);
  }

  const json& array(const json& obj, const std::string& where, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end())
      badKey(where, key, "missing");
    if (!it->is_array())
      badKey(where, key, "expected an array");
    return *it;
  }

  std::string indexed(const std::string& where, std::size_t i) {
    return where + "[" + std::to_string(i) + "]";
  }

  flowcal::io::Parity parityFrom(const std::string& where, const std::string& text) {
    if (text == "none" || text == "N")
      return flowcal::io::Parity::None;
    if (text == "even" || text == "E")
      return flowcal::io::Parity::Even;
    if (text == "odd" || text == "O")
      return flowcal::io::Parity::Odd;
    badKey(where, "parity", "unknown parity \"" + text + "\"");
  }

  flowcal::io::StopBits stopBitsFrom(const std::string& where, int bits) {
    if (bits == 1)
      return flowcal::io::StopBits::One;
    if (bits == 2)
      return flowcal::io::StopBits::Two;
    badKey(where, "stopBits", "must be 1 or 2");
  }

  InstrumentSetting instrumentFrom(const json& j, const std::string& where) {
    InstrumentSetting s;
    s.model = requiredField<std::string>(j, where, "model");
    s.serial.port = requiredField<std::string>(j, where, "port");
    s.serial.baudRate = optionalField<int>(j, where, "baudRate");
    s.serial.dataBits = optionalField<int>(j, where, "dataBits");
    if (auto parity = optionalField<std::string>(j, where, "parity"))
      s.serial.parity = parityFrom(where, *parity);
    if (auto stop = optionalField<int>(j, where, "stopBits"))
      s.serial.stopBits = stopBitsFrom(where, *stop);
    if (auto ms = optionalCount(j, where, "readTimeoutMs"))
      s.serial.readTimeout = std::chrono::milliseconds(*ms);
    if (auto ms = optionalCount(j, where, "writeTimeoutMs"))
      s.serial.writeTimeout = std::chrono::milliseconds(*ms);
    s.echoTolerance = optionalField<double>(j, where, "echoTolerance");
    s.allowOpenValveMeasure = optionalField<bool>(j, where, "allowOpenValveMeasure").value_or(false);
    s.openValveSetpoint = optionalField<double>(j, where, "openValveSetpoint").value_or(0.0);
    s.channel = optionalCount(j, where, "channel").value_or(1u);
    return s;
  }

  EquipmentSettings equipmentFrom(const json& j) {
    const std::string where = "equipment";
    EquipmentSettings e;
    const auto& list = array(j, where, "instruments");
    for (std::size_t i = 0; i < list.size(); ++i)
      e.instruments.push_back(instrumentFrom(list[i], indexed(where + ".instruments", i)));

    if (auto gas = optionalField<std::string>(j, where, "gas")) {
      auto parsed = flowcal::protocols::gasFromString(*gas);
      if (!parsed)
        badKey(where, "gas", "unknown gas \"" + *gas + "\"");
      e.gas = *parsed;
    }
    e.dutSupplyVoltage = optionalField<double>(j, where, "dutSupplyVoltage");
    e.dutChannelBase = optionalCount(j, where, "dutChannelBase").value_or(100u);
    return e;
  }

  ModelSetting modelFrom(const json& j, const std::string& where) {
    ModelSetting m;
    m.label = requiredField<std::string>(j, where, "label");
    m.outputMin = optionalField<double>(j, where, "outputMin").value_or(m.outputMin);
    m.outputMax = optionalField<double>(j, where, "outputMax").value_or(m.outputMax);
    m.presenceThreshold = optionalField<double>(j, where, "presenceThreshold").value_or(0.0);
    return m;
  }

  RangeSetting rangeFrom(const json& j, const std::string& where) {
    RangeSetting r;
    r.label = requiredField<std::string>(j, where, "label");
    r.min = requiredField<double>(j, where, "min");
    r.max = requiredField<double>(j, where, "max");
    return r;
  }

  TestSetting testFrom(const json& j, const std::string& where) {
    TestSetting t;
    t.label = requiredField<std::string>(j, where, "label");
    t.protocol = optionalField<std::string>(j, where, "protocol").value_or(t.protocol);
    t.setpoints = requiredField<std::vector<double>>(j, where, "setpoints");
    t.dwell = std::chrono::milliseconds(optionalCount(j, where, "dwellMs").value_or(0u));
    t.samples = optionalCount(j, where, "samples").value_or(1u);
    t.sampleInterval =
        std::chrono::milliseconds(optionalCount(j, where, "sampleIntervalMs").value_or(0u));
    t.tolerancePercent = optionalField<double>(j, where, "tolerancePercent").value_or(t.tolerancePercent);
    t.toleranceFloor = optionalField<double>(j, where, "toleranceFloor").value_or(0.0);
    return t;
  }

  DutSelection dutFrom(const json& j, const std::string& where) {
    DutSelection d;
    d.serialNumber = optionalField<std::string>(j, where, "serialNumber").value_or("");
    d.selected = optionalField<bool>(j, where, "selected").value_or(true);
    d.modelLabel = optionalField<std::string>(j, where, "model").value_or("");
    if (d.selected && d.modelLabel.empty())
      badKey(where, "model", "missing for a selected DUT");
    return d;
  }

  template <typename T, typename Fn>
  std::vector<T> listFrom(const json& doc, const std::string& key, Fn parse) {
    std::vector<T> out;
    const auto& list = array(doc, "config", key);
    for (std::size_t i = 0; i < list.size(); ++i)
      out.push_back(parse(list[i], indexed(key, i)));
    return out;
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_{ std::move(configPath) } {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

RunConfig ConfigLoader::loadRunConfig() const { return toRunConfig(load()); }

RunConfig flowcal::core::toRunConfig(const json& doc) {
  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] top level must be an object");

  auto it = doc.find("equipment");
  if (it == doc.end() || !it->is_object())
    badKey("config", "equipment", "missing or not an object");

  RunConfig config;
  config.equipment = equipmentFrom(*it);
  config.models = listFrom<ModelSetting>(doc, "models", modelFrom);
  config.ranges = listFrom<RangeSetting>(doc, "ranges", rangeFrom);
  config.tests = listFrom<TestSetting>(doc, "tests", testFrom);
  config.duts = listFrom<DutSelection>(doc, "duts", dutFrom);
  config.rangeLabel = requiredField<std::string>(doc, "config", "range");
  config.testLabel = requiredField<std::string>(doc, "config", "test");
  config.logDirectory = optionalField<std::string>(doc, "config", "logDirectory").value_or("");
  return config;
}
