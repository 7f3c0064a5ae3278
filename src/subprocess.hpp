#pragma once
/*
 * Subprocess
 *
 * Purpose: run external programs (editor, agent, browser opener) for the selector.
 * Design: IProcessLauncher blocks until the child exits; Orchestrator releases the tty,
 *         hands the blocking run to an ITaskRunner and reports exactly one completion.
 * Note: while a run is active the event loop reads no keys; the child owns the terminal.
 */
#include "iterminal.hpp"
#include "task_runner.hpp"
#include "types.hpp"
#include <functional>
#include <string>
#include <vector>

struct ProcessResult {
  bool ok = false;
  int exit_code = -1;
  std::string error; // empty when ok
};

class IProcessLauncher {
public:
  virtual ~IProcessLauncher() = default;
  virtual ProcessResult run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp/waitpid; exec failure is exit code 127 with the errno text.
class PosixProcessLauncher : public IProcessLauncher {
public:
  ProcessResult run(const std::vector<std::string>& argv) override;
};

// Starts argv without waiting (double fork, stdio to /dev/null). False + msg on spawn failure.
bool launch_detached(const std::vector<std::string>& argv, std::string& msg);

// Splits a command setting on whitespace: "code -w" -> {"code", "-w"}.
std::vector<std::string> split_command(const std::string& command);
std::string join_argv(const std::vector<std::string>& argv);

// <editor words...> [+line] path
std::vector<std::string> editor_argv(const std::string& editor, const std::string& path, int line);
// <agent words...> prompt
std::vector<std::string> agent_argv(const std::string& agent, const std::string& prompt);
// open url (macOS) / xdg-open url
std::vector<std::string> browser_argv(const std::string& url);

class Orchestrator {
public:
  using Done = std::function<void(ExternalKind, const ProcessResult&)>;
  Orchestrator(ITerminal& term, IProcessLauncher& launcher, ITaskRunner& runner);
  // Suspends the terminal and runs argv on the task runner; done is called once from the job.
  void run_external(ExternalKind kind, std::vector<std::string> argv, Done done);
  // Called by the loop when it consumes the completion event; resumes the terminal.
  void finish();
  bool active() const { return active_; }
private:
  ITerminal& term_;
  IProcessLauncher& launcher_;
  ITaskRunner& runner_;
  bool active_ = false;
};
