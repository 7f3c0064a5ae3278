#pragma once
/*
 * Log
 *
 * Purpose: spdlog setup for the selector. The terminal owns stdout/stderr while
 * the TUI runs, so records go to a file sink (MSELECT_LOG / `set log`) or nowhere.
 * Usage: init_logging() once in main; modules keep a static category_logger("...").
 */
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

// Installs the default "mselect" logger; file sink when path is non-empty, null sink otherwise.
bool init_logging(const std::string& path, bool debug, std::string& msg);

// Lazily installs a null-sink default logger so tests and tools never log to the tty.
void ensure_default_logger();

// Child logger sharing the default logger's sinks, named after a subsystem.
std::shared_ptr<spdlog::logger> category_logger(const std::string& name);
