#include "config.h"

#include <cJSON.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

static const char* log_level_to_string(LogLevel level) {
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
  return "WARN";
}

int config_resolve_dir(const char* override_dir, std::string* out_dir) {
  if (override_dir && *override_dir) {
    *out_dir = override_dir;
    return 0;
  }
  const char* env_dir = getenv(APPDECK_CONFIG_DIR_ENV);
  if (env_dir && *env_dir) {
    *out_dir = env_dir;
    return 0;
  }
  const char* home = getenv("HOME");
  if (!home || !*home) {
    vlog(LOG_LEVEL_ERROR, "HOME is not set and no configuration directory was given");
    return -1;
  }
  *out_dir = std::string(home) + "/.config/appdeck";
  return 0;
}

// mkdir -p
static int make_dirs(const std::string& path) {
  if (path.empty())
    return -1;
  for (size_t pos = 1; pos <= path.size(); ++pos) {
    if (pos != path.size() && path[pos] != '/')
      continue;
    std::string partial = path.substr(0, pos);
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      vlog(LOG_LEVEL_WARN, "cannot create %s: %s", partial.c_str(), strerror(errno));
      return -1;
    }
  }
  return 0;
}

static int read_string(const cJSON* root, const char* key, std::string* out) {
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
  if (!item)
    return 0;
  if (!cJSON_IsString(item) || !item->valuestring) {
    vlog(LOG_LEVEL_ERROR, "config: %s must be a string", key);
    return -1;
  }
  *out = item->valuestring;
  return 0;
}

static int read_int(const cJSON* root, const char* key, int min, int max, int* out) {
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
  if (!item)
    return 0;
  if (!cJSON_IsNumber(item)) {
    vlog(LOG_LEVEL_ERROR, "config: %s must be a number", key);
    return -1;
  }
  double value = cJSON_GetNumberValue(item);
  if (value < min || value > max || value != (double)(int)value) {
    vlog(LOG_LEVEL_ERROR, "config: %s must be an integer in [%d, %d]", key, min, max);
    return -1;
  }
  *out = (int)value;
  return 0;
}

int config_parse(const char* json, AppdeckConfig* out_config) {
  cJSON* root = cJSON_Parse(json);
  if (!root) {
    const char* err = cJSON_GetErrorPtr();
    vlog(LOG_LEVEL_ERROR, "config: parse error near '%.20s'", err ? err : "");
    return -1;
  }
  if (!cJSON_IsObject(root)) {
    vlog(LOG_LEVEL_ERROR, "config: top level must be an object");
    cJSON_Delete(root);
    return -1;
  }

  AppdeckConfig config = *out_config;
  std::string level_name;
  int ret = 0;
  ret |= read_string(root, "LogLevel", &level_name);
  ret |= read_string(root, "LogFile", &config.log_file);
  ret |= read_string(root, "ApplicationsDir", &config.applications_dir);
  ret |= read_int(root, "ScanDepth", 1, 8, &config.scan_depth);
  ret |= read_int(root, "StatusTicks", 1, 600, &config.status_ticks);
  ret |= read_int(root, "PollTimeoutMs", 10, 1000, &config.poll_timeout_ms);
  cJSON_Delete(root);
  if (ret != 0)
    return -1;

  if (!level_name.empty() && log_level_from_string(level_name.c_str(), &config.log_level) != 0) {
    vlog(LOG_LEVEL_ERROR, "config: unknown LogLevel '%s'", level_name.c_str());
    return -1;
  }
  if (config.applications_dir.empty()) {
    vlog(LOG_LEVEL_ERROR, "config: ApplicationsDir must not be empty");
    return -1;
  }

  *out_config = config;
  return 0;
}

std::string config_to_json(const AppdeckConfig& config) {
  cJSON* root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "LogLevel", log_level_to_string(config.log_level));
  cJSON_AddStringToObject(root, "LogFile", config.log_file.c_str());
  cJSON_AddStringToObject(root, "ApplicationsDir", config.applications_dir.c_str());
  cJSON_AddNumberToObject(root, "ScanDepth", config.scan_depth);
  cJSON_AddNumberToObject(root, "StatusTicks", config.status_ticks);
  cJSON_AddNumberToObject(root, "PollTimeoutMs", config.poll_timeout_ms);

  char* printed = cJSON_Print(root);
  std::string out = printed ? printed : "{}";
  cJSON_free(printed);
  cJSON_Delete(root);
  return out;
}

static int write_default_config(const std::string& path) {
  FILE* fp = fopen(path.c_str(), "w");
  if (!fp) {
    vlog(LOG_LEVEL_WARN, "cannot create %s: %s", path.c_str(), strerror(errno));
    return -1;
  }
  std::string json = config_to_json(AppdeckConfig{});
  fprintf(fp, "%s\n", json.c_str());
  if (fclose(fp) != 0) {
    vlog(LOG_LEVEL_WARN, "cannot write %s: %s", path.c_str(), strerror(errno));
    return -1;
  }
  vlog(LOG_LEVEL_INFO, "created default configuration at %s", path.c_str());
  return 0;
}

static int read_file(const std::string& path, std::string* out) {
  FILE* fp = fopen(path.c_str(), "r");
  if (!fp) {
    vlog(LOG_LEVEL_ERROR, "cannot open %s: %s", path.c_str(), strerror(errno));
    return -1;
  }
  char buf[4096];
  size_t n;
  out->clear();
  while ((n = fread(buf, 1, sizeof(buf), fp)) > 0)
    out->append(buf, n);
  int failed = ferror(fp);
  fclose(fp);
  if (failed) {
    vlog(LOG_LEVEL_ERROR, "cannot read %s", path.c_str());
    return -1;
  }
  return 0;
}

int config_load(const std::string& config_dir, AppdeckConfig* out_config) {
  std::string path = config_dir + "/" APPDECK_CONFIG_FILE;

  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    if (make_dirs(config_dir) != 0 || write_default_config(path) != 0)
      vlog(LOG_LEVEL_WARN, "cannot create %s, using the defaults", path.c_str());
    *out_config = AppdeckConfig{};
    return 0;
  }

  std::string contents;
  if (read_file(path, &contents) != 0)
    return -1;

  AppdeckConfig config;
  if (config_parse(contents.c_str(), &config) != 0) {
    vlog(LOG_LEVEL_ERROR, "invalid configuration in %s", path.c_str());
    return -1;
  }
  *out_config = config;
  return 0;
}
