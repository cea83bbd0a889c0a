#ifndef APPDECK_CLI_H_
#define APPDECK_CLI_H_

#include <stdio.h>

#include <string>

#include "provider.h"

#ifndef APPDECK_VERSION
#define APPDECK_VERSION "0.1.0"
#endif

typedef enum CliCommand {
  CLI_COMMAND_LIST,
  CLI_COMMAND_OPEN,
  CLI_COMMAND_KILL,
  CLI_COMMAND_HELP,
  CLI_COMMAND_VERSION,
} CliCommand;

struct CliOptions {
  CliCommand command = CLI_COMMAND_LIST;
  // Application name given to open/kill. Empty selects the interactive flow.
  std::string name;
  std::string config_dir;
  bool verbose = false;
};

// Parses argv. Usage errors are written to `err`.
// @returns 0 on success and -1 on a usage error.
int cli_parse(int argc, char** argv, CliOptions* out_options, FILE* err);

void cli_print_usage(FILE* out);

// `appdeck open NAME`
// @returns a process exit code.
int cli_open_by_name(const AppProvider* provider, const std::string& name, FILE* out);

// `appdeck kill NAME`. A name that is not running is reported on `out`. A
// quit the application rejects is logged as a warning. Neither is an error.
// @returns a process exit code.
int cli_kill_by_name(const AppProvider* provider, const std::string& name, FILE* out);

// Entry point: parses arguments, loads the configuration and runs the command.
// @returns a process exit code.
int cli_main(int argc, char** argv);

#endif  // APPDECK_CLI_H_
