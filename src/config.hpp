#pragma once
/*
 * Config
 *
 * Purpose: compile-time defaults plus the runtime settings read from ~/.mselectrc.
 * Override order: built-in defaults < rc file < environment.
 */
#include <string>
#include <vector>
#include <filesystem>

#ifndef MS_DEFAULT_EDITOR
#define MS_DEFAULT_EDITOR "vim"
#endif

#ifndef MS_DEFAULT_AGENT
#define MS_DEFAULT_AGENT "claude"
#endif

#define MS_TMP_PREFIX "mselect-"
#define MS_TMP_SUFFIX ".md"

#ifndef MS_STATUS_SECONDS
#define MS_STATUS_SECONDS 3
#endif

/* poll interval of the event loop when no key arrives */
#define MS_KEY_TIMEOUT_MS 100

#define MS_RC_NAME ".mselectrc"
#define MS_ENV_AGENT "MSELECT_AGENT"
#define MS_ENV_LOG "MSELECT_LOG"
#define MS_ENV_USER "MSELECT_USER"
#define MS_DEFAULT_USER "me"

struct SelectorConfig {
  std::string editor = MS_DEFAULT_EDITOR;
  std::string agent = MS_DEFAULT_AGENT;
  std::string log_path;
  std::string user; // author of replies written from the browser
  int status_seconds = MS_STATUS_SECONDS;
  bool hide_resolved = true;
  bool debug = false;
};

// One rc line: comments/blank lines succeed without effect.
bool apply_config_line(SelectorConfig& cfg, const std::string& line, std::string& msg);

// Missing file is not an error. Bad lines are collected into messages and skipped.
bool load_config_file(const std::filesystem::path& path,
                      SelectorConfig& cfg,
                      std::vector<std::string>& messages);

void apply_environment(SelectorConfig& cfg);

// defaults, then $HOME/.mselectrc, then environment
SelectorConfig load_config(std::vector<std::string>& messages);
