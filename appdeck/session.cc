#include "session.h"

#include <utility>
#include <vector>

#include "dispatcher.h"
#include "terminal.h"
#include "util.h"

static void terminal_draw(void* user_data, const Frame& frame) {
  (void)user_data;
  render_draw(frame);
}

static int terminal_poll(void* user_data, int timeout_ms, InputEvent* out_event) {
  (void)user_data;
  return terminal_poll_key(timeout_ms, out_event);
}

int session_loop(SelectionState* state,
                 const AppProvider* provider,
                 const SessionIo& io,
                 int poll_timeout_ms,
                 std::string* out_picked) {
  if (out_picked)
    out_picked->clear();

  Frame frame;
  while (!state->should_quit) {
    sel_tick_status(state);
    render_build_frame(state, &frame);
    io.draw(io.user_data, frame);

    InputEvent event;
    if (io.poll(io.user_data, poll_timeout_ms, &event) != 1)
      continue;

    SelTransition tx = SEL_TX_NONE;
    sel_process_key_event(state, provider, event, &tx);
    switch (tx) {
      case SEL_TX_SCAN_FAILED:
        return SESSION_ERR_SCAN;
      case SEL_TX_OPEN_SELECTED: {
        std::string name = *sel_selected_name(state);
        if (dispatcher_open(state, provider, name) != DISPATCH_OK)
          return SESSION_ERR_ACTION;
        if (state->mode == SEL_MODE_SEARCH)
          sel_exit_search_mode(state);
        break;
      }
      case SEL_TX_KILL_SELECTED: {
        std::string name = *sel_selected_name(state);
        if (dispatcher_kill(state, provider, name) == DISPATCH_ERR_ISSUE)
          return SESSION_ERR_ACTION;
        break;
      }
      case SEL_TX_OPEN_AND_QUIT:
        if (out_picked)
          *out_picked = *sel_selected_name(state);
        state->should_quit = true;
        break;
      default:
        break;
    }
  }
  return SESSION_OK;
}

// Runs the loop on `options.io`, or on a terminal owned for the duration of
// the call.
static int run_loop(SelectionState* state,
                    const AppProvider* provider,
                    const SessionOptions& options,
                    std::string* out_picked) {
  if (options.io)
    return session_loop(state, provider, *options.io, options.poll_timeout_ms, out_picked);

  TerminalSession terminal(options.log_sink);
  if (!terminal.active())
    return SESSION_ERR_TERMINAL;
  SessionIo io = {terminal_draw, terminal_poll, nullptr};
  return session_loop(state, provider, io, options.poll_timeout_ms, out_picked);
}

static int report_session_status(int status) {
  switch (status) {
    case SESSION_OK:
      return 0;
    case SESSION_ERR_ACTION:
      fprintf(stderr, "Error: failed to issue the application request\n");
      break;
    case SESSION_ERR_SCAN:
      fprintf(stderr, "Error: failed to list installed applications\n");
      break;
    case SESSION_ERR_QUERY:
      fprintf(stderr, "Error: failed to list running applications\n");
      break;
    case SESSION_ERR_TERMINAL:
      fprintf(stderr, "Error: cannot initialize the terminal\n");
      break;
  }
  return 1;
}

int session_run_browse(const AppProvider* provider, const SessionOptions& options, FILE* out) {
  std::vector<std::string> apps;
  if (provider->list_running(provider->user_data, &apps) != PROVIDER_OK)
    return report_session_status(SESSION_ERR_QUERY);

  if (apps.empty()) {
    fprintf(out, "%s\n", ansi_paint(out, ANSI_YELLOW, "No visible applications found.").c_str());
    return 0;
  }

  SelectionState state;
  sel_init(&state, std::move(apps));
  state.status_duration = options.status_ticks;
  vlog(LOG_LEVEL_INFO, "browsing %zu running applications", state.running_apps.size());

  return report_session_status(run_loop(&state, provider, options, nullptr));
}

int session_run_pick(const AppProvider* provider, const SessionOptions& options, FILE* out) {
  SelectionState state;
  sel_init(&state, {});
  state.flow = SEL_FLOW_PICK;
  state.status_duration = options.status_ticks;
  if (sel_enter_search_mode(&state, provider) != 0)
    return report_session_status(SESSION_ERR_SCAN);

  std::string picked;
  int ret = run_loop(&state, provider, options, &picked);
  if (ret != SESSION_OK)
    return report_session_status(ret);
  if (picked.empty())
    return 0;

  // The terminal is restored at this point.
  fprintf(out, "%s %s\n", ansi_paint(out, ANSI_GREEN, "Opening:").c_str(), ansi_paint(out, ANSI_CYAN, picked).c_str());
  if (provider->launch(provider->user_data, picked) != PROVIDER_OK) {
    fprintf(stderr, "Error: failed to open application: %s\n", picked.c_str());
    return 1;
  }
  return 0;
}
