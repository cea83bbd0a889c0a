#ifndef APPDECK_PROVIDER_H_
#define APPDECK_PROVIDER_H_

#include <string>
#include <vector>

// Status codes shared by provider callbacks.
typedef enum {
  PROVIDER_OK = 0,
  // The OS call could not be issued or its output could not be parsed.
  PROVIDER_ERR_ISSUE = -1,
  // The call ran but reported failure (e.g. the application is unknown).
  PROVIDER_ERR_REQUEST = -2,
} ProviderStatus;

// Callbacks
// Each callback returns a ProviderStatus. Results are written to the out
// parameter only on PROVIDER_OK.
typedef int (*appdeck_list_running_cb)(void* user_data, std::vector<std::string>* out_names);
typedef int (*appdeck_scan_installed_cb)(void* user_data, std::vector<std::string>* out_names);
typedef int (*appdeck_launch_cb)(void* user_data, const std::string& name);
typedef int (*appdeck_quit_cb)(void* user_data, const std::string& name);

// The OS collaborators used by the selection state, the dispatcher and the
// CLI. osa.h provides the macOS implementation; tests install fakes.
typedef struct AppProvider {
  appdeck_list_running_cb list_running;
  appdeck_scan_installed_cb scan_installed;
  appdeck_launch_cb launch;
  appdeck_quit_cb quit;
  void* user_data;
} AppProvider;

#endif  // APPDECK_PROVIDER_H_
