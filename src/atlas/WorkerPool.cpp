#include "atlas/WorkerPool.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <system_error>
#include <utility>

namespace atlas {

int ComputeRenderWorkerCount(unsigned cores)
{
  if (cores == 0) cores = 1;
  if (cores >= 4) return std::max(1, static_cast<int>(cores) - 1);
  return static_cast<int>(cores);
}

int ComputeAnalysisWorkerCount(unsigned cores)
{
  if (cores == 0) cores = 1;
  return std::max(1, static_cast<int>(cores) / 2);
}

WorkerPool::WorkerPool(std::string name)
    : m_name(std::move(name))
{
}

WorkerPool::~WorkerPool()
{
  stop();
}

bool WorkerPool::start(int threads, std::string& outError)
{
  outError.clear();
  if (running()) return true;
  if (threads <= 0) {
    outError = "worker count must be positive";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = false;
  }

  m_threads.reserve(static_cast<std::size_t>(threads));
  for (int i = 0; i < threads; ++i) {
    try {
      m_threads.emplace_back([this, i]() { run(i); });
    } catch (const std::system_error& e) {
      outError = "failed to start worker " + std::to_string(i) + ": " + e.what();
      stop();
      return false;
    }
  }
  return true;
}

void WorkerPool::stop()
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = true;
  }
  m_wake.notify_all();

  for (std::thread& th : m_threads) {
    if (th.joinable()) th.join();
  }
  m_threads.clear();
}

bool WorkerPool::submit(Task task)
{
  if (!running()) return false;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopping) return false;
    m_queue.push_back(std::move(task));
  }
  m_wake.notify_one();
  return true;
}

bool WorkerPool::waitIdle(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_idle.wait_for(lock, timeout, [this]() { return m_queue.empty() && m_active == 0; });
}

std::size_t WorkerPool::pending() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queue.size();
}

void WorkerPool::run(int index)
{
  for (;;) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_wake.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
      if (m_queue.empty()) return; // stopping and drained
      task = std::move(m_queue.front());
      m_queue.pop_front();
      ++m_active;
    }

    try {
      task();
    } catch (const std::exception& e) {
      std::cerr << "[" << m_name << "] worker " << index << " task threw: " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[" << m_name << "] worker " << index << " task threw a non-standard exception\n";
    }

    {
      std::lock_guard<std::mutex> lock(m_mutex);
      --m_active;
    }
    m_idle.notify_all();
  }
}

} // namespace atlas
