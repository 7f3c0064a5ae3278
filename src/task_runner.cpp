#include "task_runner.hpp"
#include "log.hpp"
#include <chrono>

static std::shared_ptr<spdlog::logger> task_log() {
  static auto logger = category_logger("tasks");
  return logger;
}

ThreadTaskRunner::~ThreadTaskRunner() { wait_all(); }

void ThreadTaskRunner::submit(Job job) {
  std::lock_guard<std::mutex> lk(mu_);
  // drop finished jobs so the vector does not grow with every refresh
  std::vector<std::future<void>> live;
  for (auto& f : jobs_) {
    if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) live.push_back(std::move(f));
  }
  jobs_ = std::move(live);
  jobs_.push_back(std::async(std::launch::async, [job = std::move(job)]() {
    try {
      job();
    } catch (const std::exception& e) {
      task_log()->error("background job failed: {}", e.what());
      throw;
    }
  }));
}

void ThreadTaskRunner::wait_all() {
  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending = std::move(jobs_);
    jobs_.clear();
  }
  for (auto& f : pending) {
    if (f.valid()) f.wait();
  }
}
