#ifndef APPDECK_RENDER_H_
#define APPDECK_RENDER_H_

#include <stddef.h>

#include <string>
#include <vector>

#include "selection.h"

typedef enum FooterKind {
  FOOTER_KEYBINDINGS,
  FOOTER_OPENED,
  FOOTER_KILLED,
} FooterKind;

// A text snapshot of one screen. Built from the selection state every frame
// and then drawn; it holds nothing across frames.
struct Frame {
  std::string header;
  // Search modes show the query with a cursor after the header.
  bool show_query = false;
  std::string query;

  std::string list_title;
  // "<glyph> <name>" per row of the active list.
  std::vector<std::string> items;
  size_t selected = 0;

  FooterKind footer_kind = FOOTER_KEYBINDINGS;
  // Keybinding help, or the application name for status footers.
  std::string footer;
};

void render_build_frame(const SelectionState* state, Frame* out_frame);

// Draws `frame` on stdscr. Requires an active TerminalSession.
void render_draw(const Frame& frame);

// First row of the list window so that `selected` is visible in `rows` rows.
size_t render_scroll_offset(size_t selected, size_t count, size_t rows);

#endif  // APPDECK_RENDER_H_
