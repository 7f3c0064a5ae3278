#pragma once
/*
 * Editor session helpers
 *
 * Purpose: the temporary file an editor session edits, and the cleanup applied to
 *          what the user wrote before it reaches a completer.
 * TempFile: created with mkstemps under $TMPDIR (or /tmp) as mselect-XXXXXX.md; the file is
 *           removed when the object is destroyed, whatever the outcome of the session.
 */
#include <string>

class TempFile {
public:
  // Creates an empty file. Throws SelectorError when the file can not be created.
  static TempFile create();

  TempFile() = default;
  ~TempFile();
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  TempFile(TempFile&& other) noexcept;
  TempFile& operator=(TempFile&& other) noexcept;

  const std::string& path() const { return path_; }
  bool valid() const { return !path_.empty(); }
  bool write(const std::string& content, std::string& msg);
  bool read(std::string& out, std::string& msg) const;
  void remove();

private:
  explicit TempFile(std::string path) : path_(std::move(path)) {}
  std::string path_;
};

std::string temp_directory();

// Trim, then drop trailing lines starting with '#' (re-trimming after each), until none remain.
std::string sanitize_editor_content(const std::string& text);
