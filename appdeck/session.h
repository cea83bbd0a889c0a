#ifndef APPDECK_SESSION_H_
#define APPDECK_SESSION_H_

#include <stdio.h>

#include <string>

#include "provider.h"
#include "render.h"
#include "selection.h"

typedef enum {
  SESSION_OK = 0,
  // An open/kill request could not be issued.
  SESSION_ERR_ACTION = -1,
  // The installed-app scan failed.
  SESSION_ERR_SCAN = -2,
  // The startup running-app query failed.
  SESSION_ERR_QUERY = -3,
  // The terminal could not be initialized.
  SESSION_ERR_TERMINAL = -4,
} SessionStatus;

// Screen callbacks driven by the loop. The terminal implementation draws with
// curses; tests script them.
typedef void (*session_draw_cb)(void* user_data, const Frame& frame);
// @returns 1 if `out_event` was filled and 0 on timeout.
typedef int (*session_poll_cb)(void* user_data, int timeout_ms, InputEvent* out_event);

typedef struct SessionIo {
  session_draw_cb draw;
  session_poll_cb poll;
  void* user_data;
} SessionIo;

struct SessionOptions {
  int poll_timeout_ms = 100;
  int status_ticks = APPDECK_STATUS_TICKS;
  // Log destination while the terminal is owned; nullptr discards.
  FILE* log_sink = nullptr;
  // Overrides the terminal. Used by tests.
  const SessionIo* io = nullptr;
};

// Runs the event loop until the state quits. Each iteration decays the status
// countdown, draws, polls one key and routes it.
// @param out_picked (out) - The name chosen with SEL_TX_OPEN_AND_QUIT, left
// empty otherwise. May be null.
//
// @returns a SessionStatus.
int session_loop(SelectionState* state,
                 const AppProvider* provider,
                 const SessionIo& io,
                 int poll_timeout_ms,
                 std::string* out_picked);

// Interactive browse over the running applications.
// @returns a process exit code.
int session_run_browse(const AppProvider* provider, const SessionOptions& options, FILE* out);

// Search-only picker over the installed applications. The chosen application
// is opened after the terminal is restored.
// @returns a process exit code.
int session_run_pick(const AppProvider* provider, const SessionOptions& options, FILE* out);

#endif  // APPDECK_SESSION_H_
