#ifndef APPDECK_CONFIG_H_
#define APPDECK_CONFIG_H_

#include <string>

#include "osa.h"
#include "selection.h"
#include "util.h"

#define APPDECK_CONFIG_FILE "config.json"
#define APPDECK_CONFIG_DIR_ENV "APPDECK_CONFIG_DIR"
#define APPDECK_POLL_TIMEOUT_MS 100

struct AppdeckConfig {
  // Levels are ordered WARN < ERROR < INFO < TRACE; ERROR shows warnings and
  // errors.
  LogLevel log_level = LOG_LEVEL_ERROR;
  // Empty means stderr outside the terminal UI and no logging inside it.
  std::string log_file;
  std::string applications_dir = APPDECK_APPLICATIONS_DIR;
  int scan_depth = APPDECK_SCAN_DEPTH;
  int status_ticks = APPDECK_STATUS_TICKS;
  int poll_timeout_ms = APPDECK_POLL_TIMEOUT_MS;
};

// Picks the configuration directory: `override_dir` if set, then
// $APPDECK_CONFIG_DIR, then $HOME/.config/appdeck.
// @returns 0 on success and -1 if no directory can be determined.
int config_resolve_dir(const char* override_dir, std::string* out_dir);

// Loads <config_dir>/config.json into `out_config`. A missing file yields the
// defaults; the directory and a file holding them are created when possible.
// @returns 0 on success and -1 if an existing file cannot be read or parsed,
// or holds an invalid value.
int config_load(const std::string& config_dir, AppdeckConfig* out_config);

// Parses a JSON document over the defaults in `out_config`. Unknown keys are
// ignored.
// @returns 0 on success and -1 on a syntax error, a wrong type or an
// out-of-range value.
int config_parse(const char* json, AppdeckConfig* out_config);

// Serializes `config` as the JSON written for new configuration files.
std::string config_to_json(const AppdeckConfig& config);

#endif  // APPDECK_CONFIG_H_
