#include "editor_session.hpp"
#include "types.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

static void test_sanitize() {
  assert(sanitize_editor_content("body\n# instructions\n") == "body");
  assert(sanitize_editor_content("  body  \n\n") == "body");
  assert(sanitize_editor_content("# only\n# comments\n") == "");
  assert(sanitize_editor_content("") == "");
  assert(sanitize_editor_content("\n\n   \n") == "");
  // headings followed by real text survive
  assert(sanitize_editor_content("# Title\ntext") == "# Title\ntext");
  assert(sanitize_editor_content("a\nb\n  # note\n\n# more\n") == "a\nb");
  assert(sanitize_editor_content("> quoted\n\nreply\n") == "> quoted\n\nreply");
}

static void test_temp_file_lifecycle() {
  std::string path;
  {
    TempFile f = TempFile::create();
    assert(f.valid());
    path = f.path();
    std::filesystem::path p(path);
    assert(p.filename().string().rfind("mselect-", 0) == 0);
    assert(p.extension() == ".md");
    assert(std::filesystem::exists(p));

    std::string msg;
    assert(f.write("hello\nworld\n", msg));
    std::string back;
    assert(f.read(back, msg));
    assert(back == "hello\nworld\n");

    // rewriting truncates
    assert(f.write("x", msg));
    assert(f.read(back, msg));
    assert(back == "x");

    TempFile moved = std::move(f);
    assert(!f.valid());
    assert(moved.path() == path);
    assert(std::filesystem::exists(path));
  }
  assert(!std::filesystem::exists(path));
}

static void test_temp_file_remove_and_read_error() {
  TempFile f = TempFile::create();
  std::string path = f.path();
  f.remove();
  assert(!f.valid());
  assert(!std::filesystem::exists(path));
  std::string out, msg;
  assert(!f.read(out, msg));
  assert(msg.rfind("Failed to read temp file", 0) == 0);
  assert(!f.write("x", msg));
  assert(msg.rfind("Failed to write temp file", 0) == 0);
}

static void test_create_failure_is_fatal() {
  const char* old = std::getenv("TMPDIR");
  std::string saved = old ? old : "";
  setenv("TMPDIR", "/nonexistent-mselect-dir/sub", 1);
  bool thrown = false;
  try {
    TempFile f = TempFile::create();
  } catch (const SelectorError& e) {
    thrown = true;
    assert(std::string(e.what()).rfind("Failed to create temp file", 0) == 0);
  }
  assert(thrown);
  if (old) setenv("TMPDIR", saved.c_str(), 1);
  else unsetenv("TMPDIR");
}

static void test_temp_directory() {
  setenv("TMPDIR", "/var/tmp//", 1);
  assert(temp_directory() == "/var/tmp");
  unsetenv("TMPDIR");
  assert(temp_directory() == "/tmp");
}

int main() {
  test_sanitize();
  test_temp_file_lifecycle();
  test_temp_file_remove_and_read_error();
  test_create_failure_is_fatal();
  test_temp_directory();
  return 0;
}
