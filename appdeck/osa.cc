#include "osa.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <filesystem>
#include <system_error>

#include "util.h"

namespace fs = std::filesystem;

static const char kRunningAppsScript[] =
    "tell application \"System Events\" to get name of (processes where background only is false)";

AppProvider osa_provider(OsaOptions* options) {
  AppProvider provider = {};
  provider.list_running = osa_list_running;
  provider.scan_installed = osa_scan_installed;
  provider.launch = osa_launch;
  provider.quit = osa_quit;
  provider.user_data = options;
  return provider;
}

static std::string trim(const std::string& s, const char* chars) {
  size_t begin = s.find_first_not_of(chars);
  if (begin == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(chars);
  return s.substr(begin, end - begin + 1);
}

void osa_parse_name_list(const std::string& output, std::vector<std::string>* out_names) {
  out_names->clear();
  std::string body = trim(trim(output, " \t\r\n"), "{}");

  size_t pos = 0;
  while (pos <= body.size()) {
    size_t sep = body.find(", ", pos);
    std::string item = body.substr(pos, sep == std::string::npos ? std::string::npos : sep - pos);
    item = trim(trim(item, " \t\r\n"), "\"");
    if (!item.empty())
      out_names->push_back(item);
    if (sep == std::string::npos)
      break;
    pos = sep + 2;
  }
}

std::string osa_escape_string(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '"' || c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

std::string osa_bundle_display_name(const std::string& path, const std::string& apps_dir) {
  std::string name = trim(path, " \t\r\n");
  std::string prefix = apps_dir;
  if (prefix.empty() || prefix.back() != '/')
    prefix.push_back('/');
  if (name.compare(0, prefix.size(), prefix) == 0)
    name.erase(0, prefix.size());

  static const std::string kSuffix = ".app";
  if (name.size() >= kSuffix.size() && name.compare(name.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0)
    name.erase(name.size() - kSuffix.size());
  return name;
}

int osa_scan_dir(const std::string& dir, int max_depth, std::vector<std::string>* out_names) {
  std::error_code ec;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    vlog(LOG_LEVEL_ERROR, "cannot read %s: %s", dir.c_str(), ec.message().c_str());
    return PROVIDER_ERR_ISSUE;
  }

  out_names->clear();
  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      vlog(LOG_LEVEL_WARN, "scan of %s stopped early: %s", dir.c_str(), ec.message().c_str());
      break;
    }
    if (it.depth() + 1 >= max_depth)
      it.disable_recursion_pending();

    const fs::path& path = it->path();
    if (path.extension() == ".app")
      out_names->push_back(osa_bundle_display_name(path.string(), dir));
  }
  return PROVIDER_OK;
}

// pipe(2) with the close-on-exec flag on both ends.
static int cloexec_pipe(int fds[2]) {
  if (pipe(fds) < 0)
    return -1;
  fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return 0;
}

static std::vector<char*> to_exec_argv(const std::vector<std::string>& argv) {
  std::vector<char*> c_args;
  for (const auto& arg : argv)
    c_args.push_back(const_cast<char*>(arg.c_str()));
  c_args.push_back(nullptr);
  return c_args;
}

static void redirect_to_null(int fd) {
  int null_fd = open("/dev/null", O_RDWR);
  if (null_fd >= 0) {
    dup2(null_fd, fd);
    close(null_fd);
  }
}

// Execs `c_args` in the current (child) process. On failure errno is written
// to `err_fd`, which is close-on-exec, so the parent reads EOF on success.
[[noreturn]] static void exec_or_report(std::vector<char*>& c_args, int err_fd) {
  execvp(c_args[0], c_args.data());
  int err = errno;
  ssize_t n = write(err_fd, &err, sizeof(err));
  (void)n;
  _exit(127);
}

// Reads the exec status written by exec_or_report.
// @returns 0 if exec succeeded, otherwise the child's errno.
static int read_exec_status(int err_fd) {
  int err = 0;
  ssize_t n;
  do {
    n = read(err_fd, &err, sizeof(err));
  } while (n < 0 && errno == EINTR);
  return n == (ssize_t)sizeof(err) ? err : 0;
}

static int wait_child(pid_t pid, int* out_status) {
  while (waitpid(pid, out_status, 0) < 0) {
    if (errno != EINTR)
      return -1;
  }
  return 0;
}

int process_run_capture(const std::vector<std::string>& argv, std::string* out_stdout, int* out_exit_code) {
  if (argv.empty())
    return -1;
  std::vector<char*> c_args = to_exec_argv(argv);

  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) < 0)
    return -1;
  if (cloexec_pipe(err_pipe) < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    return -1;
  }

  pid_t pid = fork();
  if (pid < 0) {
    vlog(LOG_LEVEL_ERROR, "fork failed: %s", strerror(errno));
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return -1;
  }
  if (pid == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    dup2(out_pipe[1], STDOUT_FILENO);
    close(out_pipe[1]);
    redirect_to_null(STDIN_FILENO);
    redirect_to_null(STDERR_FILENO);
    exec_or_report(c_args, err_pipe[1]);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);

  std::string captured;
  char buf[4096];
  for (;;) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break;
    captured.append(buf, (size_t)n);
  }
  close(out_pipe[0]);

  int exec_err = read_exec_status(err_pipe[0]);
  close(err_pipe[0]);

  int status = 0;
  if (wait_child(pid, &status) < 0)
    return -1;
  if (exec_err != 0) {
    vlog(LOG_LEVEL_ERROR, "cannot run %s: %s", argv[0].c_str(), strerror(exec_err));
    return -1;
  }

  if (out_stdout)
    *out_stdout = captured;
  if (out_exit_code)
    *out_exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
  return 0;
}

int process_spawn_detached(const std::vector<std::string>& argv) {
  if (argv.empty())
    return -1;
  std::vector<char*> c_args = to_exec_argv(argv);

  int err_pipe[2];
  if (cloexec_pipe(err_pipe) < 0)
    return -1;

  // Double fork so the launched process is reparented and never becomes a
  // zombie of the UI loop.
  pid_t pid = fork();
  if (pid < 0) {
    vlog(LOG_LEVEL_ERROR, "fork failed: %s", strerror(errno));
    close(err_pipe[0]);
    close(err_pipe[1]);
    return -1;
  }
  if (pid == 0) {
    close(err_pipe[0]);
    setsid();
    pid_t grandchild = fork();
    if (grandchild < 0) {
      int err = errno;
      ssize_t n = write(err_pipe[1], &err, sizeof(err));
      (void)n;
      _exit(1);
    }
    if (grandchild > 0)
      _exit(0);
    redirect_to_null(STDIN_FILENO);
    redirect_to_null(STDOUT_FILENO);
    redirect_to_null(STDERR_FILENO);
    exec_or_report(c_args, err_pipe[1]);
  }

  close(err_pipe[1]);
  int exec_err = read_exec_status(err_pipe[0]);
  close(err_pipe[0]);

  int status = 0;
  if (wait_child(pid, &status) < 0)
    return -1;
  if (exec_err != 0) {
    vlog(LOG_LEVEL_ERROR, "cannot start %s: %s", argv[0].c_str(), strerror(exec_err));
    return -1;
  }
  return 0;
}

int osa_list_running(void* user_data, std::vector<std::string>* out_names) {
  (void)user_data;
  std::string output;
  int exit_code = 0;
  if (process_run_capture({"osascript", "-e", kRunningAppsScript}, &output, &exit_code) != 0)
    return PROVIDER_ERR_ISSUE;
  if (exit_code != 0) {
    vlog(LOG_LEVEL_ERROR, "osascript exited with %d while listing processes", exit_code);
    return PROVIDER_ERR_ISSUE;
  }

  osa_parse_name_list(output, out_names);
  vlog(LOG_LEVEL_TRACE, "System Events reported %zu visible applications", out_names->size());
  return PROVIDER_OK;
}

int osa_scan_installed(void* user_data, std::vector<std::string>* out_names) {
  const OsaOptions* options = static_cast<const OsaOptions*>(user_data);
  OsaOptions defaults;
  if (!options)
    options = &defaults;
  return osa_scan_dir(options->applications_dir, options->scan_depth, out_names);
}

int osa_launch(void* user_data, const std::string& name) {
  (void)user_data;
  vlog(LOG_LEVEL_INFO, "launching %s", name.c_str());
  if (process_spawn_detached({"open", "-a", name}) != 0)
    return PROVIDER_ERR_ISSUE;
  return PROVIDER_OK;
}

int osa_quit(void* user_data, const std::string& name) {
  (void)user_data;
  std::string script = "tell application \"" + osa_escape_string(name) + "\" to quit";
  vlog(LOG_LEVEL_INFO, "asking %s to quit", name.c_str());

  int exit_code = 0;
  if (process_run_capture({"osascript", "-e", script}, nullptr, &exit_code) != 0)
    return PROVIDER_ERR_ISSUE;
  if (exit_code != 0) {
    vlog(LOG_LEVEL_WARN, "quit request for %s failed (osascript exit %d)", name.c_str(), exit_code);
    return PROVIDER_ERR_REQUEST;
  }
  return PROVIDER_OK;
}
