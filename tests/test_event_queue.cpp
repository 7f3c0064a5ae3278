#include "event_queue.hpp"
#include "task_runner.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>

static void test_fifo() {
  EventQueue<int> q;
  assert(q.empty());
  assert(!q.try_pop());
  q.push(1);
  q.push(2);
  q.push(3);
  assert(q.size() == 3);
  assert(*q.try_pop() == 1);
  assert(q.pop() == 2);
  assert(*q.pop_for(std::chrono::milliseconds(1)) == 3);
  assert(!q.pop_for(std::chrono::milliseconds(5)));
}

static void test_cross_thread() {
  EventQueue<std::string> q;
  std::thread producer([&q] {
    for (int i = 0; i < 100; ++i) q.push("event " + std::to_string(i));
  });
  for (int i = 0; i < 100; ++i) assert(q.pop() == "event " + std::to_string(i));
  producer.join();
  assert(q.empty());
}

static void test_thread_runner() {
  EventQueue<int> q;
  std::atomic<int> ran{0};
  {
    ThreadTaskRunner runner;
    for (int i = 0; i < 8; ++i) {
      runner.submit([&q, &ran, i] {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        ran++;
        q.push(i);
      });
    }
  } // destructor joins every job
  assert(ran == 8);
  assert(q.size() == 8);
}

static void test_inline_runner() {
  EventQueue<int> q;
  InlineTaskRunner runner;
  runner.submit([&q] { q.push(42); });
  assert(q.size() == 1);
  assert(q.pop() == 42);
}

int main() {
  test_fifo();
  test_cross_thread();
  test_thread_runner();
  test_inline_runner();
  return 0;
}
