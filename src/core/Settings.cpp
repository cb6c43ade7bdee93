/* @file Settings.cpp
 * @brief Label lookups over a RunConfig snapshot.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// FlowCal headers
#include "core/Errors.hpp"
#include "core/Settings.hpp"

namespace flowcal::core {

  namespace {
    template <typename T>
    const T& findByLabel(const std::vector<T>& items, const std::string& label, const char* what) {
      auto it = std::find_if(items.begin(), items.end(),
                             [&](const T& item) { return item.label == label; });
      if (it == items.end()) {
        throw ConfigurationError(std::string(what) + " settings \"" + label +
                                 "\" not found. Please contact Engineering.");
      }
      return *it;
    }
  } // namespace

  const ModelSetting& findModel(const RunConfig& config, const std::string& label) {
    return findByLabel(config.models, label, "Model");
  }

  const RangeSetting& findRange(const RunConfig& config, const std::string& label) {
    return findByLabel(config.ranges, label, "Range");
  }

  const TestSetting& findTest(const RunConfig& config, const std::string& label) {
    return findByLabel(config.tests, label, "Test");
  }

} // namespace flowcal::core
