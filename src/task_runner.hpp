#pragma once
/*
 * TaskRunner
 *
 * Purpose: run background jobs (refresh fetch, blocking subprocess) off the event loop.
 * Contract: a job reports back only by pushing onto an EventQueue; it never touches engine state.
 * Note: no cancellation. ThreadTaskRunner's destructor waits for every outstanding job.
 */
#include <functional>
#include <future>
#include <mutex>
#include <vector>

class ITaskRunner {
public:
  using Job = std::function<void()>;
  virtual ~ITaskRunner() = default;
  virtual void submit(Job job) = 0;
};

class ThreadTaskRunner : public ITaskRunner {
public:
  ThreadTaskRunner() = default;
  ~ThreadTaskRunner() override;
  ThreadTaskRunner(const ThreadTaskRunner&) = delete;
  ThreadTaskRunner& operator=(const ThreadTaskRunner&) = delete;
  void submit(Job job) override;
  void wait_all();
private:
  std::mutex mu_;
  std::vector<std::future<void>> jobs_;
};

// Runs the job before submit() returns; results still travel through the queue.
class InlineTaskRunner : public ITaskRunner {
public:
  void submit(Job job) override { job(); }
};
