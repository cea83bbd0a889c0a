#ifndef APPDECK_OSA_H_
#define APPDECK_OSA_H_

#include <string>
#include <vector>

#include "provider.h"

#define APPDECK_APPLICATIONS_DIR "/Applications"
#define APPDECK_SCAN_DEPTH 2

// Options for the macOS provider. Passed as AppProvider::user_data and must
// outlive the provider.
struct OsaOptions {
  std::string applications_dir = APPDECK_APPLICATIONS_DIR;
  int scan_depth = APPDECK_SCAN_DEPTH;
};

// Builds a provider backed by osascript, open(1) and a filesystem scan.
AppProvider osa_provider(OsaOptions* options);

// Provider callbacks. `user_data` is an OsaOptions*.
int osa_list_running(void* user_data, std::vector<std::string>* out_names);
int osa_scan_installed(void* user_data, std::vector<std::string>* out_names);
int osa_launch(void* user_data, const std::string& name);
int osa_quit(void* user_data, const std::string& name);

// Parses the AppleScript list printed by osascript, e.g.
//   Finder, Safari, "Google Chrome"
// or the braced form {"Finder", "Safari"}. Empty items are dropped.
void osa_parse_name_list(const std::string& output, std::vector<std::string>* out_names);

// Escapes `"` and `\` for embedding in an AppleScript string literal.
std::string osa_escape_string(const std::string& s);

// "/Applications/Utilities/Terminal.app" -> "Utilities/Terminal"
std::string osa_bundle_display_name(const std::string& path, const std::string& apps_dir);

// Collects *.app entries under `dir`, at most `max_depth` levels deep, in
// traversal order.
// @returns PROVIDER_OK, or PROVIDER_ERR_ISSUE if `dir` cannot be read.
int osa_scan_dir(const std::string& dir, int max_depth, std::vector<std::string>* out_names);

// Runs `argv` and waits for it. Stdout is captured into `out_stdout` when
// non-null; stderr is discarded.
// @returns 0 once the child was reaped (its status is in `out_exit_code`) and
// -1 if it could not be started.
int process_run_capture(const std::vector<std::string>& argv, std::string* out_stdout, int* out_exit_code);

// Starts `argv` detached from the terminal with stdio on /dev/null and does
// not wait for it.
// @returns 0 once exec succeeded and -1 if the process could not be started.
int process_spawn_detached(const std::vector<std::string>& argv);

#endif  // APPDECK_OSA_H_
