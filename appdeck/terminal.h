#ifndef APPDECK_TERMINAL_H_
#define APPDECK_TERMINAL_H_

#include <stdio.h>

#include "render.h"
#include "selection.h"

// Color pairs initialized by TerminalSession.
enum {
  CP_HEADER = 1,
  CP_QUERY,
  CP_CURSOR,
  CP_ITEM,
  CP_ITEM_SELECTED,
  CP_HIGHLIGHT,
  CP_KEYS,
  CP_OPENED,
  CP_KILLED,
};

// Owns the curses screen for one interactive flow. The constructor enters
// raw mode on the alternate screen; the destructor restores the terminal on
// every exit path. While active, log output goes to `log_sink` (nullptr
// discards it) and is restored afterwards.
class TerminalSession {
 public:
  explicit TerminalSession(FILE* log_sink);
  ~TerminalSession();

  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  // False if the terminal could not be initialized.
  bool active() const { return active_; }

 private:
  bool active_ = false;
  FILE* saved_log_sink_ = nullptr;
};

// Waits up to `timeout_ms` for one key.
// @returns 1 if `out_event` was filled and 0 on timeout or an ignored key.
int terminal_poll_key(int timeout_ms, InputEvent* out_event);

// Maps a wget_wch() result to an input event.
// @returns 0 if `out_event` was filled and -1 if the key is ignored.
int terminal_translate_key(int get_wch_ret, unsigned int wch, InputEvent* out_event);

#endif  // APPDECK_TERMINAL_H_
