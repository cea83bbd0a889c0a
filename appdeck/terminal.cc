#define NCURSES_WIDECHAR 1

#include "terminal.h"

#include <locale.h>
#include <ncurses.h>
#include <stdlib.h>

#include "util.h"

static SCREEN* g_screen = nullptr;

TerminalSession::TerminalSession(FILE* log_sink) {
  saved_log_sink_ = appdeck_get_log_file();
  appdeck_set_log_file(log_sink);

  setlocale(LC_ALL, "");
  g_screen = newterm(nullptr, stdout, stdin);
  if (!g_screen) {
    appdeck_set_log_file(saved_log_sink_);
    vlog(LOG_LEVEL_ERROR, "cannot initialize the terminal (TERM=%s)", getenv("TERM") ? getenv("TERM") : "");
    return;
  }
  set_term(g_screen);
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  curs_set(0);

  if (has_colors()) {
    start_color();
    use_default_colors();
    init_pair(CP_HEADER, COLOR_GREEN, -1);
    init_pair(CP_QUERY, COLOR_YELLOW, -1);
    init_pair(CP_CURSOR, COLOR_WHITE, -1);
    init_pair(CP_ITEM, COLOR_WHITE, -1);
    init_pair(CP_ITEM_SELECTED, COLOR_YELLOW, -1);
    init_pair(CP_HIGHLIGHT, COLOR_WHITE, COLOR_BLUE);
    init_pair(CP_KEYS, COLOR_YELLOW, -1);
    init_pair(CP_OPENED, COLOR_GREEN, -1);
    init_pair(CP_KILLED, COLOR_RED, -1);
  }
  active_ = true;
  vlog(LOG_LEVEL_TRACE, "terminal session started (%dx%d)", COLS, LINES);
}

TerminalSession::~TerminalSession() {
  if (active_) {
    curs_set(1);
    endwin();
    delscreen(g_screen);
    g_screen = nullptr;
    vlog(LOG_LEVEL_TRACE, "terminal session restored");
  }
  appdeck_set_log_file(saved_log_sink_);
}

int terminal_translate_key(int get_wch_ret, unsigned int wch, InputEvent* out_event) {
  InputEvent event = {INPUT_KEY_NONE, 0, false};

  if (get_wch_ret == KEY_CODE_YES) {
    switch (wch) {
      case KEY_UP:
        event.kind = INPUT_KEY_UP;
        break;
      case KEY_DOWN:
        event.kind = INPUT_KEY_DOWN;
        break;
      case KEY_ENTER:
        event.kind = INPUT_KEY_ENTER;
        break;
      case KEY_BACKSPACE:
        event.kind = INPUT_KEY_BACKSPACE;
        break;
      case KEY_RESIZE:
        event.kind = INPUT_KEY_OTHER;
        break;
      default:
        return -1;
    }
    *out_event = event;
    return 0;
  }
  if (get_wch_ret != OK)
    return -1;

  switch (wch) {
    case 27:
      event.kind = INPUT_KEY_ESC;
      break;
    case '\r':
    case '\n':
      event.kind = INPUT_KEY_ENTER;
      break;
    case 8:
    case 127:
      event.kind = INPUT_KEY_BACKSPACE;
      break;
    default:
      event.kind = INPUT_KEY_CHAR;
      if (wch >= 1 && wch <= 26) {
        // Ctrl-A .. Ctrl-Z
        event.ctrl = true;
        event.codepoint = 'a' + wch - 1;
      } else {
        event.codepoint = wch;
      }
      break;
  }
  *out_event = event;
  return 0;
}

int terminal_poll_key(int timeout_ms, InputEvent* out_event) {
  timeout(timeout_ms);
  wint_t wch = 0;
  int ret = get_wch(&wch);
  if (ret == ERR)
    return 0;
  if (terminal_translate_key(ret, (unsigned int)wch, out_event) != 0)
    return 0;
  return 1;
}
