#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (View/StatusLevel/ExternalKind) and the fatal error type.
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <stdexcept>
#include <string>

// Which page sits under a transient mode; modes return here on cancel.
enum class View { List, Detail };

enum class StatusLevel { Info, Success, Error };

// Which external program a subprocess session runs.
enum class ExternalKind { Editor, FileEdit, Agent };

// Editor-backed actions; each pairs a preparer with a completer.
enum class EditAction { ResolveWithComment, Quote, QuoteWithContext };

// Fatal failures: terminal driver init and temp file creation.
class SelectorError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

inline const char* view_name(View v) { return v == View::List ? "list" : "detail"; }

inline const char* external_kind_name(ExternalKind k) {
  switch (k) {
    case ExternalKind::Editor: return "editor";
    case ExternalKind::FileEdit: return "file-edit";
    case ExternalKind::Agent: return "agent";
  }
  return "unknown";
}
