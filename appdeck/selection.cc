#include "selection.h"

#include <utility>

#include "util.h"

void sel_init(SelectionState* state, std::vector<std::string> running_apps) {
  *state = SelectionState{};
  state->running_apps = std::move(running_apps);
}

const std::vector<std::string>& sel_active_list(const SelectionState* state) {
  switch (state->mode) {
    case SEL_MODE_SEARCH:
      return state->filtered_apps;
    case SEL_MODE_NORMAL:
      break;
  }
  return state->running_apps;
}

void sel_advance(SelectionState* state, SelDirection direction) {
  size_t len = sel_active_list(state).size();
  if (len == 0)
    return;
  size_t delta = (direction == SEL_NEXT) ? 1 : len - 1;
  state->selected_index = (state->selected_index + delta) % len;
}

void sel_apply_filter(SelectionState* state) {
  if (state->search_query.empty()) {
    state->filtered_apps = state->installed_apps;
  } else {
    state->filtered_apps.clear();
    for (const std::string& app : state->installed_apps) {
      if (str_contains_nocase(app, state->search_query))
        state->filtered_apps.push_back(app);
    }
  }

  if (!state->filtered_apps.empty()) {
    if (state->selected_index > state->filtered_apps.size() - 1)
      state->selected_index = state->filtered_apps.size() - 1;
  } else {
    state->selected_index = 0;
  }
}

void sel_edit_query(SelectionState* state, SelQueryOp op, uint32_t codepoint) {
  switch (op) {
    case SEL_QUERY_APPEND:
      utf8_append(&state->search_query, codepoint);
      break;
    case SEL_QUERY_BACKSPACE:
      utf8_pop_back(&state->search_query);
      break;
  }
  sel_apply_filter(state);
  vlog(LOG_LEVEL_TRACE, "query '%s' matches %zu of %zu", state->search_query.c_str(),
       state->filtered_apps.size(), state->installed_apps.size());
}

int sel_enter_search_mode(SelectionState* state, const AppProvider* provider) {
  if (!state->installed_loaded) {
    std::vector<std::string> installed;
    if (!provider || !provider->scan_installed) {
      vlog(LOG_LEVEL_ERROR, "no installed-app scanner available");
      return -1;
    }
    int ret = provider->scan_installed(provider->user_data, &installed);
    if (ret != PROVIDER_OK) {
      vlog(LOG_LEVEL_ERROR, "installed-app scan failed (%d)", ret);
      return -1;
    }
    vlog(LOG_LEVEL_INFO, "scanned %zu installed applications", installed.size());
    state->installed_apps = std::move(installed);
    state->installed_loaded = true;
  }

  state->mode = SEL_MODE_SEARCH;
  state->search_query.clear();
  sel_apply_filter(state);
  state->selected_index = 0;
  return 0;
}

void sel_exit_search_mode(SelectionState* state) {
  state->mode = SEL_MODE_NORMAL;
  state->search_query.clear();
  state->selected_index = 0;
}

const std::string* sel_selected_name(const SelectionState* state) {
  const std::vector<std::string>& list = sel_active_list(state);
  if (state->selected_index >= list.size())
    return nullptr;
  return &list[state->selected_index];
}

void sel_record_opened(SelectionState* state, const std::string& name) {
  state->status = SEL_STATUS_OPENED;
  state->status_name = name;
  state->status_countdown = state->status_duration;
}

void sel_record_killed(SelectionState* state, const std::string& name) {
  state->status = SEL_STATUS_KILLED;
  state->status_name = name;
  state->status_countdown = state->status_duration;
}

void sel_tick_status(SelectionState* state) {
  if (state->status_countdown > 0) {
    state->status_countdown--;
    if (state->status_countdown == 0) {
      state->status = SEL_STATUS_NONE;
      state->status_name.clear();
    }
  }
}

void sel_refresh_running(SelectionState* state, std::vector<std::string> names) {
  state->running_apps = std::move(names);
  if (state->running_apps.empty()) {
    state->selected_index = 0;
  } else if (state->selected_index > state->running_apps.size() - 1) {
    state->selected_index = state->running_apps.size() - 1;
  }
}

static bool is_ctrl_c(const InputEvent& event) {
  return event.kind == INPUT_KEY_CHAR && event.ctrl && (event.codepoint == 'c' || event.codepoint == 'C');
}

static SelTransition process_normal_key(SelectionState* state, const AppProvider* provider, const InputEvent& event) {
  switch (event.kind) {
    case INPUT_KEY_ESC:
      state->should_quit = true;
      return SEL_TX_QUIT;
    case INPUT_KEY_UP:
      sel_advance(state, SEL_PREVIOUS);
      return SEL_TX_NAVIGATE_UP;
    case INPUT_KEY_DOWN:
      sel_advance(state, SEL_NEXT);
      return SEL_TX_NAVIGATE_DOWN;
    case INPUT_KEY_CHAR:
      break;
    default:
      return SEL_TX_NONE;
  }

  if (is_ctrl_c(event)) {
    state->should_quit = true;
    return SEL_TX_QUIT;
  }
  if (event.ctrl)
    return SEL_TX_NONE;

  switch (event.codepoint) {
    case 'q':
    case 'Q':
      state->should_quit = true;
      return SEL_TX_QUIT;
    case 'o':
    case 'O':
      return sel_selected_name(state) ? SEL_TX_OPEN_SELECTED : SEL_TX_NONE;
    case 'k':
    case 'K':
      return sel_selected_name(state) ? SEL_TX_KILL_SELECTED : SEL_TX_NONE;
    case '/':
      if (sel_enter_search_mode(state, provider) != 0)
        return SEL_TX_SCAN_FAILED;
      return SEL_TX_ADHERE_TO_MODE;
    default:
      return SEL_TX_NONE;
  }
}

static SelTransition process_search_key(SelectionState* state, const InputEvent& event) {
  switch (event.kind) {
    case INPUT_KEY_ESC:
      if (state->flow == SEL_FLOW_PICK) {
        state->should_quit = true;
        return SEL_TX_QUIT;
      }
      sel_exit_search_mode(state);
      return SEL_TX_ADHERE_TO_MODE;
    case INPUT_KEY_ENTER:
      if (!sel_selected_name(state))
        return SEL_TX_NONE;
      return (state->flow == SEL_FLOW_PICK) ? SEL_TX_OPEN_AND_QUIT : SEL_TX_OPEN_SELECTED;
    case INPUT_KEY_BACKSPACE:
      sel_edit_query(state, SEL_QUERY_BACKSPACE);
      return SEL_TX_UPDATE_FILTER;
    case INPUT_KEY_UP:
      sel_advance(state, SEL_PREVIOUS);
      return SEL_TX_NAVIGATE_UP;
    case INPUT_KEY_DOWN:
      sel_advance(state, SEL_NEXT);
      return SEL_TX_NAVIGATE_DOWN;
    case INPUT_KEY_CHAR:
      if (is_ctrl_c(event)) {
        state->should_quit = true;
        return SEL_TX_QUIT;
      }
      if (event.ctrl || event.codepoint < 0x20 || event.codepoint == 0x7f)
        return SEL_TX_NONE;
      sel_edit_query(state, SEL_QUERY_APPEND, event.codepoint);
      return SEL_TX_UPDATE_FILTER;
    default:
      return SEL_TX_NONE;
  }
}

void sel_process_key_event(SelectionState* state,
                           const AppProvider* provider,
                           const InputEvent& event,
                           SelTransition* out_transition) {
  SelTransition tx = SEL_TX_NONE;
  switch (state->mode) {
    case SEL_MODE_NORMAL:
      tx = process_normal_key(state, provider, event);
      break;
    case SEL_MODE_SEARCH:
      tx = process_search_key(state, event);
      break;
  }
  if (out_transition)
    *out_transition = tx;
}

void utf8_append(std::string* out, uint32_t cp) {
  if (cp < 0x80) {
    out->push_back((char)cp);
  } else if (cp < 0x800) {
    out->push_back((char)(0xC0 | (cp >> 6)));
    out->push_back((char)(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back((char)(0xE0 | (cp >> 12)));
    out->push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back((char)(0x80 | (cp & 0x3F)));
  } else if (cp <= 0x10FFFF) {
    out->push_back((char)(0xF0 | (cp >> 18)));
    out->push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back((char)(0x80 | (cp & 0x3F)));
  }
}

void utf8_pop_back(std::string* s) {
  if (s->empty())
    return;
  size_t i = s->size() - 1;
  // Walk back over continuation bytes.
  while (i > 0 && ((unsigned char)(*s)[i] & 0xC0) == 0x80)
    i--;
  s->erase(i);
}
