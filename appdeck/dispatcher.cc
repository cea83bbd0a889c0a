#include "dispatcher.h"

#include <utility>
#include <vector>

#include "util.h"

int dispatcher_refresh(SelectionState* state, const AppProvider* provider) {
  std::vector<std::string> names;
  int ret = provider->list_running(provider->user_data, &names);
  if (ret != PROVIDER_OK) {
    vlog(LOG_LEVEL_WARN, "running-app refresh failed (%d), keeping %zu stale entries", ret,
         state->running_apps.size());
    return -1;
  }
  sel_refresh_running(state, std::move(names));
  return 0;
}

int dispatcher_open(SelectionState* state, const AppProvider* provider, const std::string& name) {
  // The name may point into a list the refresh below replaces.
  std::string app = name;
  if (provider->launch(provider->user_data, app) != PROVIDER_OK) {
    vlog(LOG_LEVEL_ERROR, "failed to open application: %s", app.c_str());
    return DISPATCH_ERR_ISSUE;
  }
  sel_record_opened(state, app);
  // A failed refresh keeps the stale list.
  (void)dispatcher_refresh(state, provider);
  return DISPATCH_OK;
}

int dispatcher_kill(SelectionState* state, const AppProvider* provider, const std::string& name) {
  std::string app = name;
  int ret = provider->quit(provider->user_data, app);
  if (ret == PROVIDER_ERR_REQUEST) {
    vlog(LOG_LEVEL_WARN, "%s did not accept the quit request", app.c_str());
    return DISPATCH_ERR_REQUEST;
  }
  if (ret != PROVIDER_OK) {
    vlog(LOG_LEVEL_ERROR, "failed to kill application: %s", app.c_str());
    return DISPATCH_ERR_ISSUE;
  }
  sel_record_killed(state, app);
  (void)dispatcher_refresh(state, provider);
  return DISPATCH_OK;
}
