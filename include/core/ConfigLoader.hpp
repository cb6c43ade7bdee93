#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads the bench/run configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Settings.hpp"

namespace flowcal::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object,
 *        or the RunConfig built from it, to the caller.
 *
 *  * No caching: every call re-reads the file.
 *  * Label resolution (model/range/test) is left to TestCoordinator::start().
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// load() + toRunConfig().
    RunConfig loadRunConfig() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

  /// Map a parsed document onto RunConfig; throws `std::runtime_error` naming the bad key.
  RunConfig toRunConfig(const nlohmann::json& doc);

} // namespace flowcal::core
