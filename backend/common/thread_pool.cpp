#include "thread_pool.hpp"

namespace common {

ThreadPool::ThreadPool(unsigned int size) {
  if (size < 1) {
    _poolSize = 2;
  } else {
    _poolSize = size;
  }
  _threads.reserve(_poolSize);

  for (size_t i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this]() -> void { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  _stop.store(true, std::memory_order_release);
  _cv.notify_all();
  // queued tasks still run before the workers exit
  _threads.clear();
}

void ThreadPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{_mtx};
      _cv.wait(lock, [this]() -> bool {
        return _stop.load(std::memory_order_acquire) || !_tasks.empty();
      });

      if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
        break;
      }

      task = std::move(_tasks.front());
      _tasks.pop();
    }
    task();
  }
}

} // namespace common
