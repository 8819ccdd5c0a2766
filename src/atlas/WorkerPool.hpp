#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace atlas {

// Fixed-size pool of threads pulling tasks from one FIFO queue.
//
// Tasks report their results through a Mailbox; the pool itself only runs them.
// A task that throws is logged and the thread keeps serving the queue.
class WorkerPool {
public:
  using Task = std::function<void()>;

  explicit WorkerPool(std::string name);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Starts `threads` workers. On failure (e.g. the platform refuses to create
  // threads) any started workers are stopped and outError is set.
  bool start(int threads, std::string& outError);

  // Finishes queued tasks, then joins. Safe to call repeatedly.
  void stop();

  bool running() const { return !m_threads.empty(); }
  int size() const { return static_cast<int>(m_threads.size()); }
  const std::string& name() const { return m_name; }

  // False when the pool is not running (the task is not queued).
  bool submit(Task task);

  // Blocks until the queue is empty and no task is executing, or the timeout passes.
  bool waitIdle(std::chrono::milliseconds timeout);

  std::size_t pending() const;

private:
  void run(int index);

  std::string m_name;
  std::vector<std::thread> m_threads;

  mutable std::mutex m_mutex;
  std::condition_variable m_wake;
  std::condition_variable m_idle;
  std::deque<Task> m_queue;
  int m_active = 0;
  bool m_stopping = false;
};

// max(1, cores - 1) for machines with at least 4 cores, otherwise all cores.
// 0 (unknown) counts as 1.
int ComputeRenderWorkerCount(unsigned cores);

// Analysis runs on demand only; it gets half the cores, at least one.
int ComputeAnalysisWorkerCount(unsigned cores);

} // namespace atlas
