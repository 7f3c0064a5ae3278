#include "subprocess.hpp"
#include "log.hpp"
#include "posix_fd.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>

static std::shared_ptr<spdlog::logger> proc_log() {
  static auto logger = category_logger("subprocess");
  return logger;
}

static std::vector<char*> c_argv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for (const auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
  out.push_back(nullptr);
  return out;
}

ProcessResult PosixProcessLauncher::run(const std::vector<std::string>& argv) {
  ProcessResult res;
  if (argv.empty() || argv[0].empty()) { res.error = "empty command"; return res; }

  // exec errors travel back over a close-on-exec pipe
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    res.error = std::string("pipe failed: ") + std::strerror(errno);
    return res;
  }
  UniqueFd rd(fds[0]);
  UniqueFd wr(fds[1]);
  auto cargv = c_argv(argv);

  pid_t pid = ::fork();
  if (pid < 0) {
    res.error = std::string("fork failed: ") + std::strerror(errno);
    return res;
  }
  if (pid == 0) {
    ::execvp(cargv[0], cargv.data());
    int err = errno;
    (void)!::write(wr.get(), &err, sizeof(err));
    ::_exit(127);
  }
  wr.reset();

  int child_errno = 0;
  ssize_t got;
  do { got = ::read(rd.get(), &child_errno, sizeof(child_errno)); } while (got < 0 && errno == EINTR);

  int status = 0;
  pid_t w;
  do { w = ::waitpid(pid, &status, 0); } while (w < 0 && errno == EINTR);
  if (w < 0) {
    res.error = std::string("waitpid failed: ") + std::strerror(errno);
    return res;
  }

  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    res.exit_code = 127;
    res.error = "exec " + argv[0] + ": " + std::strerror(child_errno);
    return res;
  }
  if (WIFEXITED(status)) {
    res.exit_code = WEXITSTATUS(status);
    if (res.exit_code != 0) {
      res.error = "exit status " + std::to_string(res.exit_code);
      return res;
    }
    res.ok = true;
    return res;
  }
  if (WIFSIGNALED(status)) {
    res.error = std::string("killed by signal ") + std::to_string(WTERMSIG(status));
    return res;
  }
  res.error = "abnormal exit";
  return res;
}

bool launch_detached(const std::vector<std::string>& argv, std::string& msg) {
  if (argv.empty() || argv[0].empty()) { msg = "empty command"; return false; }
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) { msg = std::string("pipe failed: ") + std::strerror(errno); return false; }
  UniqueFd rd(fds[0]);
  UniqueFd wr(fds[1]);
  auto cargv = c_argv(argv);

  pid_t pid = ::fork();
  if (pid < 0) { msg = std::string("fork failed: ") + std::strerror(errno); return false; }
  if (pid == 0) {
    // the intermediate child exits at once so the opener is reparented and never left a zombie
    ::setsid();
    pid_t grand = ::fork();
    if (grand < 0) {
      int err = errno;
      (void)!::write(wr.get(), &err, sizeof(err));
      ::_exit(1);
    }
    if (grand > 0) ::_exit(0);
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
      ::dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) ::close(devnull);
    }
    ::execvp(cargv[0], cargv.data());
    int err = errno;
    (void)!::write(wr.get(), &err, sizeof(err));
    ::_exit(127);
  }
  wr.reset();
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

  int child_errno = 0;
  ssize_t got;
  do { got = ::read(rd.get(), &child_errno, sizeof(child_errno)); } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    msg = "exec " + argv[0] + ": " + std::strerror(child_errno);
    return false;
  }
  msg.clear();
  return true;
}

std::vector<std::string> split_command(const std::string& command) {
  std::istringstream iss(command);
  std::vector<std::string> words;
  std::string w;
  while (iss >> w) words.push_back(w);
  return words;
}

std::string join_argv(const std::vector<std::string>& argv) {
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i) out += ' ';
    out += argv[i];
  }
  return out;
}

std::vector<std::string> editor_argv(const std::string& editor, const std::string& path, int line) {
  std::vector<std::string> argv = split_command(editor);
  if (argv.empty()) argv.push_back("vim");
  if (line > 0) argv.push_back("+" + std::to_string(line));
  argv.push_back(path);
  return argv;
}

std::vector<std::string> agent_argv(const std::string& agent, const std::string& prompt) {
  std::vector<std::string> argv = split_command(agent);
  if (argv.empty()) argv.push_back("claude");
  argv.push_back(prompt);
  return argv;
}

std::vector<std::string> browser_argv(const std::string& url) {
#if defined(__APPLE__)
  return {"open", url};
#else
  return {"xdg-open", url};
#endif
}

Orchestrator::Orchestrator(ITerminal& term, IProcessLauncher& launcher, ITaskRunner& runner)
  : term_(term), launcher_(launcher), runner_(runner) {}

void Orchestrator::run_external(ExternalKind kind, std::vector<std::string> argv, Done done) {
  active_ = true;
  proc_log()->info("launch {}: {}", external_kind_name(kind), argv.empty() ? std::string() : argv[0]);
  term_.suspend();
  IProcessLauncher& launcher = launcher_;
  runner_.submit([&launcher, kind, argv = std::move(argv), done = std::move(done)]() {
    ProcessResult res = launcher.run(argv);
    if (res.ok) proc_log()->info("{} exited ok", external_kind_name(kind));
    else proc_log()->warn("{} failed: {}", external_kind_name(kind), res.error);
    done(kind, res);
  });
}

void Orchestrator::finish() {
  if (!active_) return;
  term_.resume();
  active_ = false;
}
