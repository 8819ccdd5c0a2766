#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace atlas {

// Multi-producer queue of typed messages from worker tasks to the coordinator.
//
// The coordinator drains it without blocking (drain()). waitFor() exists for
// headless tools and tests that have nothing else to do while a frame renders.
template <typename T>
class Mailbox {
public:
  void post(T msg)
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queue.push_back(std::move(msg));
    }
    m_cv.notify_all();
  }

  std::vector<T> drain()
  {
    std::vector<T> out;
    std::lock_guard<std::mutex> lock(m_mutex);
    out.reserve(m_queue.size());
    while (!m_queue.empty()) {
      out.push_back(std::move(m_queue.front()));
      m_queue.pop_front();
    }
    return out;
  }

  // True when at least one message is queued before the timeout.
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> timeout)
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this]() { return !m_queue.empty(); });
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
  }

private:
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<T> m_queue;
};

} // namespace atlas
