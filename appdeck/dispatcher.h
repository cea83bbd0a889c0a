#ifndef APPDECK_DISPATCHER_H_
#define APPDECK_DISPATCHER_H_

#include <string>

#include "provider.h"
#include "selection.h"

typedef enum {
  DISPATCH_OK = 0,
  // The open/quit request could not be issued. Fatal to the session.
  DISPATCH_ERR_ISSUE = -1,
  // The quit request ran but failed. The session continues.
  DISPATCH_ERR_REQUEST = -2,
} DispatchStatus;

// Issues a fire-and-forget launch of `name`. On success records the Opened
// status and refreshes running_apps.
int dispatcher_open(SelectionState* state, const AppProvider* provider, const std::string& name);

// Asks `name` to quit and waits for the request. On success records the
// Killed status and refreshes running_apps.
int dispatcher_kill(SelectionState* state, const AppProvider* provider, const std::string& name);

// Re-queries the running applications. The previous list is kept if the
// query fails.
// @returns 0 if the list was replaced and -1 otherwise.
int dispatcher_refresh(SelectionState* state, const AppProvider* provider);

#endif  // APPDECK_DISPATCHER_H_
