#include "log.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <mutex>

static std::mutex g_log_mu;
static bool g_installed = false;

static void install_locked(std::shared_ptr<spdlog::logger> logger, bool debug) {
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v");
  logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_installed = true;
}

bool init_logging(const std::string& path, bool debug, std::string& msg) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (path.empty()) {
    install_locked(std::make_shared<spdlog::logger>("mselect", std::make_shared<spdlog::sinks::null_sink_mt>()), debug);
    msg.clear();
    return true;
  }
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    install_locked(std::make_shared<spdlog::logger>("mselect", sink), debug);
  } catch (const spdlog::spdlog_ex& ex) {
    install_locked(std::make_shared<spdlog::logger>("mselect", std::make_shared<spdlog::sinks::null_sink_mt>()), debug);
    msg = std::string("log disabled: ") + ex.what();
    return false;
  }
  msg = "logging to " + path;
  return true;
}

void ensure_default_logger() {
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (g_installed) return;
  install_locked(std::make_shared<spdlog::logger>("mselect", std::make_shared<spdlog::sinks::null_sink_mt>()), false);
}

std::shared_ptr<spdlog::logger> category_logger(const std::string& name) {
  ensure_default_logger();
  auto parent = spdlog::default_logger();
  auto child = std::make_shared<spdlog::logger>(name, parent->sinks().begin(), parent->sinks().end());
  child->set_level(parent->level());
  child->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v");
  child->flush_on(spdlog::level::warn);
  return child;
}
