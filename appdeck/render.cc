#define NCURSES_WIDECHAR 1

#include "render.h"

#include <ncurses.h>
#include <wchar.h>

#include <utility>

#include "icons.h"
#include "terminal.h"

static const char kBrowseKeys[] = "↑/↓: Navigate   O: Open   K: Kill   /: Search   Q: Quit";
static const char kSearchKeys[] = "↑/↓: Navigate   Enter: Open   Esc: Cancel   Backspace: Delete";

void render_build_frame(const SelectionState* state, Frame* out_frame) {
  Frame frame;
  bool searching = state->mode == SEL_MODE_SEARCH;

  if (searching) {
    frame.header = "Search Applications: ";
    frame.show_query = true;
    frame.query = state->search_query;
    frame.list_title = state->filtered_apps.empty() ? "No matching applications" : "Matching Applications";
  } else {
    frame.header = "Running Applications";
    frame.list_title = "Running Applications";
  }

  for (const std::string& app : sel_active_list(state))
    frame.items.push_back(std::string(icon_resolve(app)) + " " + app);
  frame.selected = state->selected_index;

  // The picker has no status line; it exits right after opening.
  if (state->flow == SEL_FLOW_BROWSE && state->status == SEL_STATUS_OPENED) {
    frame.footer_kind = FOOTER_OPENED;
    frame.footer = state->status_name;
  } else if (state->flow == SEL_FLOW_BROWSE && state->status == SEL_STATUS_KILLED) {
    frame.footer_kind = FOOTER_KILLED;
    frame.footer = state->status_name;
  } else {
    frame.footer_kind = FOOTER_KEYBINDINGS;
    frame.footer = searching ? kSearchKeys : kBrowseKeys;
  }

  *out_frame = std::move(frame);
}

size_t render_scroll_offset(size_t selected, size_t count, size_t rows) {
  if (rows == 0 || count <= rows || selected < rows)
    return 0;
  size_t offset = selected - rows + 1;
  if (offset > count - rows)
    offset = count - rows;
  return offset;
}

// Display width of a UTF-8 string, counting unprintable characters as 1.
static int text_width(const std::string& text) {
  mbstate_t mb = {};
  const char* p = text.c_str();
  const char* end = p + text.size();
  int width = 0;
  while (p < end) {
    wchar_t wc;
    size_t n = mbrtowc(&wc, p, end - p, &mb);
    if (n == (size_t)-1 || n == (size_t)-2) {
      mb = mbstate_t{};
      p++;
      width++;
      continue;
    }
    if (n == 0)
      break;
    int w = wcwidth(wc);
    width += w < 0 ? 1 : w;
    p += n;
  }
  return width;
}

// Longest prefix of `text` that fits in `cols` columns.
static std::string fit_columns(const std::string& text, int cols) {
  if (cols <= 0)
    return "";
  mbstate_t mb = {};
  const char* begin = text.c_str();
  const char* p = begin;
  const char* end = p + text.size();
  int width = 0;
  while (p < end) {
    wchar_t wc;
    size_t n = mbrtowc(&wc, p, end - p, &mb);
    int w = 1;
    if (n == (size_t)-1 || n == (size_t)-2 || n == 0) {
      mb = mbstate_t{};
      n = 1;
    } else {
      w = wcwidth(wc);
      if (w < 0)
        w = 1;
    }
    if (width + w > cols)
      break;
    width += w;
    p += n;
  }
  return std::string(begin, p - begin);
}

static void draw_box(int y, int x, int h, int w, const std::string& title) {
  if (h < 2 || w < 2)
    return;
  mvaddch(y, x, ACS_ULCORNER);
  mvhline(y, x + 1, ACS_HLINE, w - 2);
  mvaddch(y, x + w - 1, ACS_URCORNER);
  mvvline(y + 1, x, ACS_VLINE, h - 2);
  mvvline(y + 1, x + w - 1, ACS_VLINE, h - 2);
  mvaddch(y + h - 1, x, ACS_LLCORNER);
  mvhline(y + h - 1, x + 1, ACS_HLINE, w - 2);
  mvaddch(y + h - 1, x + w - 1, ACS_LRCORNER);
  if (!title.empty())
    mvaddstr(y, x + 1, fit_columns(title, w - 2).c_str());
}

static void draw_text(int y, int x, int cols, const std::string& text, int pair, attr_t attrs) {
  attron(COLOR_PAIR(pair) | attrs);
  mvaddstr(y, x, fit_columns(text, cols).c_str());
  attroff(COLOR_PAIR(pair) | attrs);
}

void render_draw(const Frame& frame) {
  erase();

  const int margin = 1;
  int width = COLS - 2 * margin;
  int height = LINES - 2 * margin;
  if (width < 10 || height < 11) {
    mvaddstr(0, 0, "Terminal too small");
    refresh();
    return;
  }

  int top = margin;
  int left = margin;
  int inner = width - 2;

  // Header: centered title, plus the query and a cursor while searching.
  draw_box(top, left, 3, width, "");
  std::string header_line = frame.header;
  if (frame.show_query)
    header_line += frame.query + "_";
  int header_x = left + 1 + (inner - text_width(header_line)) / 2;
  if (header_x < left + 1)
    header_x = left + 1;
  draw_text(top + 1, header_x, inner, frame.header, CP_HEADER, A_BOLD);
  if (frame.show_query) {
    int query_x = header_x + text_width(frame.header);
    int room = inner - (query_x - left - 1);
    draw_text(top + 1, query_x, room, frame.query, CP_QUERY, A_BOLD);
    int cursor_x = query_x + text_width(frame.query);
    if (cursor_x < left + 1 + inner)
      draw_text(top + 1, cursor_x, 1, "_", CP_CURSOR, A_BOLD);
  }

  // List
  int list_top = top + 3;
  int list_height = height - 6;
  draw_box(list_top, left, list_height, width, frame.list_title);
  size_t rows = (size_t)(list_height - 2);
  size_t offset = render_scroll_offset(frame.selected, frame.items.size(), rows);
  for (size_t row = 0; row < rows && offset + row < frame.items.size(); ++row) {
    size_t index = offset + row;
    bool selected = index == frame.selected;
    int y = list_top + 1 + (int)row;
    if (selected) {
      attron(COLOR_PAIR(CP_HIGHLIGHT) | A_BOLD);
      mvhline(y, left + 1, ' ', inner);
      mvaddstr(y, left + 1, fit_columns("➤ " + frame.items[index], inner).c_str());
      attroff(COLOR_PAIR(CP_HIGHLIGHT) | A_BOLD);
    } else {
      draw_text(y, left + 1, inner, "  " + frame.items[index], CP_ITEM, A_NORMAL);
    }
  }

  // Footer: keybindings or the transient status.
  int footer_top = list_top + list_height;
  draw_box(footer_top, left, 3, width, "");
  int fy = footer_top + 1;
  int fx = left + 1;
  switch (frame.footer_kind) {
    case FOOTER_KEYBINDINGS:
      draw_text(fy, fx, inner, frame.footer, CP_KEYS, A_NORMAL);
      break;
    case FOOTER_OPENED:
      draw_text(fy, fx, inner, "✅ ", CP_OPENED, A_NORMAL);
      fx += text_width("✅ ");
      draw_text(fy, fx, inner - (fx - left - 1), frame.footer, CP_OPENED, A_BOLD);
      fx += text_width(frame.footer);
      draw_text(fy, fx, inner - (fx - left - 1), " opened", CP_OPENED, A_NORMAL);
      break;
    case FOOTER_KILLED:
      draw_text(fy, fx, inner, "❌ ", CP_KILLED, A_NORMAL);
      fx += text_width("❌ ");
      draw_text(fy, fx, inner - (fx - left - 1), frame.footer, CP_KILLED, A_BOLD);
      fx += text_width(frame.footer);
      draw_text(fy, fx, inner - (fx - left - 1), " terminated", CP_KILLED, A_NORMAL);
      break;
  }

  refresh();
}
