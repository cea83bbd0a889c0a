#include "util.h"

#include <stdarg.h>
#include <string.h>
#include <strings.h>
#include <time.h>
#include <unistd.h>
#include <wchar.h>
#include <wctype.h>

static LogLevel g_log_level = LOG_LEVEL_ERROR;
static FILE* g_log_sink = stderr;
static bool g_log_sink_set = false;

static const char* log_level_name(LogLevel level) {
  switch (level) {
    case LOG_LEVEL_WARN:
      return "WARN";
    case LOG_LEVEL_ERROR:
      return "ERROR";
    case LOG_LEVEL_INFO:
      return "INFO";
    case LOG_LEVEL_TRACE:
      return "TRACE";
  }
  return "?";
}

void vlog(LogLevel level, const char* fmt, ...) {
  if (level > g_log_level)
    return;
  FILE* sink = g_log_sink_set ? g_log_sink : stderr;
  if (!sink)
    return;

  char stamp[32];
  time_t now = time(nullptr);
  struct tm tm_now;
  localtime_r(&now, &tm_now);
  strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm_now);

  fprintf(sink, "[%s] [%s] ", stamp, log_level_name(level));
  va_list args;
  va_start(args, fmt);
  vfprintf(sink, fmt, args);
  va_end(args);
  fputc('\n', sink);
  fflush(sink);
}

void appdeck_set_log_level(LogLevel level) {
  g_log_level = level;
}

LogLevel appdeck_get_log_level(void) {
  return g_log_level;
}

void appdeck_set_log_file(FILE* sink) {
  g_log_sink = sink;
  g_log_sink_set = true;
}

FILE* appdeck_get_log_file(void) {
  return g_log_sink_set ? g_log_sink : stderr;
}

int log_level_from_string(const char* name, LogLevel* out_level) {
  if (!name || !out_level)
    return -1;
  static const struct {
    const char* name;
    LogLevel level;
  } kLevels[] = {
      {"WARN", LOG_LEVEL_WARN},
      {"ERROR", LOG_LEVEL_ERROR},
      {"INFO", LOG_LEVEL_INFO},
      {"TRACE", LOG_LEVEL_TRACE},
  };
  for (const auto& entry : kLevels) {
    if (strcasecmp(entry.name, name) == 0) {
      *out_level = entry.level;
      return 0;
    }
  }
  return -1;
}

std::wstring str_fold_case(const std::string& s) {
  std::wstring out;
  out.reserve(s.size());
  mbstate_t mb = {};
  const char* p = s.c_str();
  const char* end = p + s.size();
  while (p < end) {
    wchar_t wc;
    size_t n = mbrtowc(&wc, p, end - p, &mb);
    if (n == (size_t)-1 || n == (size_t)-2 || n == 0) {
      // Undecodable byte: keep it as is.
      mb = mbstate_t{};
      wc = (wchar_t)(unsigned char)*p;
      n = 1;
    }
    out.push_back((wchar_t)towlower((wint_t)wc));
    p += n;
  }
  return out;
}

bool str_contains_nocase(const std::string& haystack, const std::string& needle) {
  if (needle.empty())
    return true;
  return str_fold_case(haystack).find(str_fold_case(needle)) != std::wstring::npos;
}

std::string ansi_paint(FILE* out, AnsiColor color, const std::string& text) {
  const char* code = nullptr;
  switch (color) {
    case ANSI_RED:
      code = "31";
      break;
    case ANSI_GREEN:
      code = "32";
      break;
    case ANSI_YELLOW:
      code = "33";
      break;
    case ANSI_CYAN:
      code = "36";
      break;
    case ANSI_NONE:
      break;
  }
  if (!code || !out || !isatty(fileno(out)))
    return text;
  return std::string("\033[") + code + "m" + text + "\033[0m";
}
