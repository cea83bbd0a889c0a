#ifndef APPDECK_UTIL_H_
#define APPDECK_UTIL_H_

#include <stdio.h>

#include <string>

typedef enum { LOG_LEVEL_WARN = 0, LOG_LEVEL_ERROR = 1, LOG_LEVEL_INFO = 2, LOG_LEVEL_TRACE = 3 } LogLevel;

// Log a message with the specified level
void vlog(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void appdeck_set_log_level(LogLevel level);
LogLevel appdeck_get_log_level(void);

// Redirects log output. A null sink discards messages.
// The default sink is stderr.
void appdeck_set_log_file(FILE* sink);
FILE* appdeck_get_log_file(void);

// Parses "WARN", "ERROR", "INFO" or "TRACE".
// @returns 0 on success and -1 if the name is unknown.
int log_level_from_string(const char* name, LogLevel* out_level);

typedef enum { ANSI_NONE, ANSI_RED, ANSI_GREEN, ANSI_YELLOW, ANSI_CYAN } AnsiColor;

// Wraps `text` in an ANSI color when `out` is a terminal.
std::string ansi_paint(FILE* out, AnsiColor color, const std::string& text);

// Decodes `s` in the current LC_CTYPE locale and lowercases every character.
std::wstring str_fold_case(const std::string& s);

// Case-insensitive substring test over str_fold_case().
bool str_contains_nocase(const std::string& haystack, const std::string& needle);

#endif  // APPDECK_UTIL_H_
