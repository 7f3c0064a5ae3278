#include "subprocess.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_launcher_exit_codes() {
  PosixProcessLauncher p;
  ProcessResult ok = p.run({"true"});
  assert(ok.ok && ok.exit_code == 0 && ok.error.empty());

  ProcessResult fail = p.run({"false"});
  assert(!fail.ok && fail.exit_code == 1);
  assert(fail.error == "exit status 1");

  ProcessResult code = p.run({"sh", "-c", "exit 3"});
  assert(!code.ok && code.exit_code == 3);

  ProcessResult missing = p.run({"mselect-no-such-binary"});
  assert(!missing.ok && missing.exit_code == 127);
  assert(missing.error.rfind("exec mselect-no-such-binary: ", 0) == 0);

  ProcessResult empty = p.run({});
  assert(!empty.ok && empty.error == "empty command");
}

static void test_launch_detached() {
  std::string msg;
  assert(launch_detached({"true"}, msg));
  assert(msg.empty());
  assert(!launch_detached({"mselect-no-such-binary"}, msg));
  assert(msg.rfind("exec mselect-no-such-binary", 0) == 0);
  assert(!launch_detached({}, msg));
  assert(msg == "empty command");
}

static void test_argv_builders() {
  assert((split_command("  code   -w ") == std::vector<std::string>{"code", "-w"}));
  assert(split_command("").empty());
  assert(join_argv({"vim", "+3", "a.md"}) == "vim +3 a.md");

  assert((editor_argv("vim", "/tmp/x.md", 0) == std::vector<std::string>{"vim", "/tmp/x.md"}));
  assert((editor_argv("code -w", "src/a.cpp", 12) == std::vector<std::string>{"code", "-w", "+12", "src/a.cpp"}));
  assert((editor_argv("", "a", 0) == std::vector<std::string>{"vim", "a"}));

  assert((agent_argv("claude", "fix it") == std::vector<std::string>{"claude", "fix it"}));
  assert((agent_argv("", "p") == std::vector<std::string>{"claude", "p"}));

  std::vector<std::string> b = browser_argv("https://example.com");
  assert(b.size() == 2 && b[1] == "https://example.com");
}

class RecordingLauncher : public IProcessLauncher {
public:
  std::vector<std::vector<std::string>> calls;
  bool suspended_during_run = false;
  const HeadlessTerminal* term = nullptr;

  ProcessResult run(const std::vector<std::string>& argv) override {
    calls.push_back(argv);
    suspended_during_run = term && term->suspended();
    return ProcessResult{false, 2, "exit status 2"};
  }
};

static void test_orchestrator_suspends_and_resumes() {
  HeadlessTerminal term;
  RecordingLauncher launcher;
  launcher.term = &term;
  InlineTaskRunner runner;
  Orchestrator orch(term, launcher, runner);

  int done_calls = 0;
  ExternalKind seen_kind = ExternalKind::Editor;
  ProcessResult seen;
  orch.run_external(ExternalKind::Agent, {"agent", "prompt"}, [&](ExternalKind k, const ProcessResult& r) {
    done_calls++;
    seen_kind = k;
    seen = r;
  });
  assert(done_calls == 1);
  assert(seen_kind == ExternalKind::Agent);
  assert(!seen.ok && seen.error == "exit status 2");
  assert(launcher.suspended_during_run);
  assert(orch.active() && term.suspended());

  orch.finish();
  assert(!orch.active() && !term.suspended());
  assert(term.suspend_count() == 1 && term.resume_count() == 1);
  orch.finish(); // no second resume
  assert(term.resume_count() == 1);
}

int main() {
  test_launcher_exit_codes();
  test_launch_detached();
  test_argv_builders();
  test_orchestrator_suspends_and_resumes();
  return 0;
}
