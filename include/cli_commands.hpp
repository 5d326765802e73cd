#pragma once

#include <iosfwd>
#include <nlohmann/json.hpp>

#include "config_store.hpp"
#include "options.hpp"
#include "repo_manager.hpp"

namespace cli {

/**
 * @brief Build the configuration for a run.
 *
 * Loads `--config` when given, otherwise `multideploy.yaml` from the current
 * directory if present, then applies the command line overrides.
 *
 * @throws std::runtime_error if the configuration file cannot be loaded.
 */
ConfigStore load_config(const Options& opts);

/**
 * @brief Start the file logger from the `log.*` keys.
 *
 * Does nothing when `log.file` is unset.
 */
void setup_logging(const ConfigStore& cfg);

nlohmann::json to_json(const multideploy::RepositorySnapshot& snap);
nlohmann::json to_json(const multideploy::StatusReport& report);
nlohmann::json to_json(const multideploy::DeploymentResult& result);
nlohmann::json to_json(const multideploy::CleanupResult& result);

/**
 * @brief Execute @a opts.command against @a manager and print JSON to @a out.
 *
 * Errors are printed as `{"error": ..., "type": ...}`.
 *
 * @return `0` on success, `1` when the operation failed, `2` when a
 *         deployment succeeded only partially.
 */
int run_command(const Options& opts, multideploy::RepoManager& manager, std::ostream& out);

} // namespace cli
