#ifndef APPDECK_SELECTION_H_
#define APPDECK_SELECTION_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "provider.h"

/// SELECTION API
// Manages the mode transitions and list state for the interactive browser.

#define APPDECK_STATUS_TICKS 30

typedef enum SelMode {
  // Running applications are listed and can be opened or killed.
  SEL_MODE_NORMAL,
  // User is typing a query over the installed applications.
  SEL_MODE_SEARCH,
} SelMode;

typedef enum SelFlow {
  // Full browser: normal list with a search sub-mode.
  SEL_FLOW_BROWSE,
  // Search-only picker. Esc cancels and Enter opens then quits.
  SEL_FLOW_PICK,
} SelFlow;

typedef enum SelStatus {
  SEL_STATUS_NONE,
  SEL_STATUS_OPENED,
  SEL_STATUS_KILLED,
} SelStatus;

typedef enum SelDirection { SEL_NEXT, SEL_PREVIOUS } SelDirection;

typedef enum SelQueryOp { SEL_QUERY_APPEND, SEL_QUERY_BACKSPACE } SelQueryOp;

// This communicates how the loop should respond to a key event.
typedef enum SelTransition {
  SEL_TX_NONE,
  SEL_TX_QUIT,
  SEL_TX_NAVIGATE_UP,
  SEL_TX_NAVIGATE_DOWN,
  SEL_TX_UPDATE_FILTER,
  // The loop should open sel_selected_name().
  SEL_TX_OPEN_SELECTED,
  // The loop should kill sel_selected_name().
  SEL_TX_KILL_SELECTED,
  // Pick flow only: tear the UI down, then open sel_selected_name().
  SEL_TX_OPEN_AND_QUIT,
  // The installed-app scan failed while entering search mode.
  SEL_TX_SCAN_FAILED,
  // SEL_TX_ADHERE_TO_MODE describes a transition that requires the
  // UI to adhere to the current mode.
  SEL_TX_ADHERE_TO_MODE,
} SelTransition;

typedef enum InputKeyKind {
  INPUT_KEY_NONE,
  INPUT_KEY_CHAR,
  INPUT_KEY_UP,
  INPUT_KEY_DOWN,
  INPUT_KEY_ENTER,
  INPUT_KEY_ESC,
  INPUT_KEY_BACKSPACE,
  INPUT_KEY_OTHER,
} InputKeyKind;

typedef struct InputEvent {
  InputKeyKind kind;
  // Unicode code point, valid for INPUT_KEY_CHAR.
  uint32_t codepoint;
  // Control modifier was held.
  bool ctrl;
} InputEvent;

struct SelectionState {
  std::vector<std::string> running_apps;
  std::vector<std::string> installed_apps;
  // Guards the installed-app scan. Set once the scan succeeded, even if it
  // found nothing.
  bool installed_loaded = false;
  std::vector<std::string> filtered_apps;

  SelMode mode = SEL_MODE_NORMAL;
  SelFlow flow = SEL_FLOW_BROWSE;
  std::string search_query;
  size_t selected_index = 0;

  SelStatus status = SEL_STATUS_NONE;
  std::string status_name;
  int status_countdown = 0;
  int status_duration = APPDECK_STATUS_TICKS;

  bool should_quit = false;
};

// Seeds a fresh browse session with the startup snapshot.
void sel_init(SelectionState* state, std::vector<std::string> running_apps);

// Returns the list navigation applies to: running_apps in normal mode,
// filtered_apps in search mode.
const std::vector<std::string>& sel_active_list(const SelectionState* state);

// Moves the selection with wrap-around. No-op on an empty list.
void sel_advance(SelectionState* state, SelDirection direction);

// Appends `codepoint` (UTF-8 encoded) to the query, or removes the last code
// point, then recomputes filtered_apps and clamps the selection.
void sel_edit_query(SelectionState* state, SelQueryOp op, uint32_t codepoint = 0);

// Loads installed apps through `provider` on first use and enters search mode.
// @returns 0 on success and -1 if the scan failed. On failure the state is
// left unchanged.
int sel_enter_search_mode(SelectionState* state, const AppProvider* provider);
void sel_exit_search_mode(SelectionState* state);

// Returns the selected name or nullptr when the active list is empty.
// The pointer is invalidated by the next mutation.
const std::string* sel_selected_name(const SelectionState* state);

void sel_record_opened(SelectionState* state, const std::string& name);
void sel_record_killed(SelectionState* state, const std::string& name);

// Called once per frame.
void sel_tick_status(SelectionState* state);

// Replaces running_apps and clamps the selection to the new bounds.
void sel_refresh_running(SelectionState* state, std::vector<std::string> names);

// Recomputes filtered_apps from installed_apps and the current query.
void sel_apply_filter(SelectionState* state);

void sel_process_key_event(SelectionState* state,
                           const AppProvider* provider,
                           const InputEvent& event,
                           SelTransition* out_transition);

// UTF-8 encodes a code point onto `out`.
void utf8_append(std::string* out, uint32_t codepoint);

// Removes the last UTF-8 code point of `s`. No-op on an empty string.
void utf8_pop_back(std::string* s);

#endif  // APPDECK_SELECTION_H_
