#include "cli.h"

#include <errno.h>
#include <locale.h>
#include <string.h>

#include <algorithm>
#include <vector>

#include "config.h"
#include "osa.h"
#include "session.h"
#include "util.h"

void cli_print_usage(FILE* out) {
  fprintf(out,
          "appdeck %s\n"
          "List, open and quit macOS applications from the terminal.\n"
          "\n"
          "Usage: appdeck [OPTIONS] [COMMAND]\n"
          "\n"
          "Commands:\n"
          "  list         List all open applications (default)\n"
          "  open [NAME]  Open an application, or search installed ones\n"
          "  kill [NAME]  Kill (terminate) an application\n"
          "\n"
          "Options:\n"
          "  -c, --config <DIR>  Configuration directory\n"
          "  -v, --verbose       Trace logging\n"
          "  -h, --help          Print help\n"
          "  -V, --version       Print version\n",
          APPDECK_VERSION);
}

int cli_parse(int argc, char** argv, CliOptions* out_options, FILE* err) {
  CliOptions options;
  std::vector<std::string> positional;
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
      positional.push_back(arg);
      continue;
    }
    if (arg == "--") {
      options_done = true;
    } else if (arg == "-h" || arg == "--help") {
      options.command = CLI_COMMAND_HELP;
      *out_options = options;
      return 0;
    } else if (arg == "-V" || arg == "--version") {
      options.command = CLI_COMMAND_VERSION;
      *out_options = options;
      return 0;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        fprintf(err, "error: %s requires a directory\n", arg.c_str());
        return -1;
      }
      options.config_dir = argv[++i];
    } else if (arg.rfind("--config=", 0) == 0) {
      options.config_dir = arg.substr(strlen("--config="));
    } else {
      fprintf(err, "error: unexpected argument '%s'\n", arg.c_str());
      return -1;
    }
  }

  if (!positional.empty()) {
    const std::string& command = positional[0];
    size_t max_args = 2;
    if (command == "list") {
      options.command = CLI_COMMAND_LIST;
      max_args = 1;
    } else if (command == "open") {
      options.command = CLI_COMMAND_OPEN;
    } else if (command == "kill") {
      options.command = CLI_COMMAND_KILL;
    } else {
      fprintf(err, "error: unrecognized subcommand '%s'\n", command.c_str());
      return -1;
    }
    if (positional.size() > max_args) {
      fprintf(err, "error: unexpected argument '%s'\n", positional[max_args].c_str());
      return -1;
    }
    if (positional.size() == 2) {
      if (positional[1].empty()) {
        fprintf(err, "error: application name must not be empty\n");
        return -1;
      }
      options.name = positional[1];
    }
  }

  *out_options = options;
  return 0;
}

int cli_open_by_name(const AppProvider* provider, const std::string& name, FILE* out) {
  fprintf(out, "%s %s\n", ansi_paint(out, ANSI_GREEN, "Opening:").c_str(), ansi_paint(out, ANSI_CYAN, name).c_str());
  if (provider->launch(provider->user_data, name) != PROVIDER_OK) {
    fprintf(stderr, "Error: failed to open application: %s\n", name.c_str());
    return 1;
  }
  return 0;
}

int cli_kill_by_name(const AppProvider* provider, const std::string& name, FILE* out) {
  std::vector<std::string> apps;
  if (provider->list_running(provider->user_data, &apps) != PROVIDER_OK) {
    fprintf(stderr, "Error: failed to list running applications\n");
    return 1;
  }

  if (apps.empty()) {
    fprintf(out, "%s\n", ansi_paint(out, ANSI_YELLOW, "No running applications found.").c_str());
    return 0;
  }
  if (std::find(apps.begin(), apps.end(), name) == apps.end()) {
    fprintf(out, "%s %s\n", ansi_paint(out, ANSI_RED, "Application not running:").c_str(),
            ansi_paint(out, ANSI_CYAN, name).c_str());
    return 0;
  }

  fprintf(out, "%s %s\n", ansi_paint(out, ANSI_RED, "Killing:").c_str(), ansi_paint(out, ANSI_CYAN, name).c_str());
  int ret = provider->quit(provider->user_data, name);
  if (ret == PROVIDER_ERR_REQUEST) {
    vlog(LOG_LEVEL_WARN, "%s did not accept the quit request", name.c_str());
    return 0;
  }
  if (ret != PROVIDER_OK) {
    fprintf(stderr, "Error: failed to kill application: %s\n", name.c_str());
    return 1;
  }
  return 0;
}

static int run_command(const CliOptions& options, const AppdeckConfig& config, FILE* log_file) {
  OsaOptions osa;
  osa.applications_dir = config.applications_dir;
  osa.scan_depth = config.scan_depth;
  AppProvider provider = osa_provider(&osa);

  SessionOptions session;
  session.poll_timeout_ms = config.poll_timeout_ms;
  session.status_ticks = config.status_ticks;
  session.log_sink = log_file;

  switch (options.command) {
    case CLI_COMMAND_LIST:
      return session_run_browse(&provider, session, stdout);
    case CLI_COMMAND_OPEN:
      if (options.name.empty())
        return session_run_pick(&provider, session, stdout);
      return cli_open_by_name(&provider, options.name, stdout);
    case CLI_COMMAND_KILL:
      // The browser supports kill.
      if (options.name.empty())
        return session_run_browse(&provider, session, stdout);
      return cli_kill_by_name(&provider, options.name, stdout);
    case CLI_COMMAND_HELP:
    case CLI_COMMAND_VERSION:
      break;
  }
  return 0;
}

int cli_main(int argc, char** argv) {
  // Search folds case in the user's locale.
  setlocale(LC_ALL, "");

  CliOptions options;
  if (cli_parse(argc, argv, &options, stderr) != 0) {
    fprintf(stderr, "\nFor more information, try '--help'.\n");
    return 2;
  }
  if (options.command == CLI_COMMAND_HELP) {
    cli_print_usage(stdout);
    return 0;
  }
  if (options.command == CLI_COMMAND_VERSION) {
    printf("appdeck %s\n", APPDECK_VERSION);
    return 0;
  }

  std::string config_dir;
  if (config_resolve_dir(options.config_dir.c_str(), &config_dir) != 0)
    return 2;
  AppdeckConfig config;
  if (config_load(config_dir, &config) != 0) {
    fprintf(stderr, "Error: invalid configuration in %s/%s\n", config_dir.c_str(), APPDECK_CONFIG_FILE);
    return 2;
  }
  appdeck_set_log_level(options.verbose ? LOG_LEVEL_TRACE : config.log_level);

  FILE* log_file = nullptr;
  if (!config.log_file.empty()) {
    log_file = fopen(config.log_file.c_str(), "a");
    if (!log_file)
      vlog(LOG_LEVEL_WARN, "cannot open log file %s: %s", config.log_file.c_str(), strerror(errno));
    else
      appdeck_set_log_file(log_file);
  }
  vlog(LOG_LEVEL_TRACE, "configuration loaded from %s", config_dir.c_str());

  int ret = run_command(options, config, log_file);

  if (log_file) {
    appdeck_set_log_file(stderr);
    fclose(log_file);
  }
  return ret;
}
