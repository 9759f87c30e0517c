//  Copyright 2025 Yurun Zi

//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at

//      http://www.apache.org/licenses/LICENSE-2.0

//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "concurrency/thread_pool.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace galleon {
ThreadPool::ThreadPool(size_t thread_count) : stop(false) {
  if (thread_count == 0) {
    throw std::invalid_argument("ThreadPool: thread count must be positive");
  }
  workers.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    workers.emplace_back(&ThreadPool::WorkerThread, this, i);
  }
}

ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(mtx);
    stop = true;
  }
  condition.notify_all();
  for (std::thread& worker : workers) {
    worker.join();
  }
}

void ThreadPool::Submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx);
    tasks.push(std::move(task));
  }
  condition.notify_one();
}

void ThreadPool::WorkerThread(worker_slot_t slot) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mtx);
      condition.wait(lock, [this] { return stop || !tasks.empty(); });
      if (stop && tasks.empty()) return;
      task = std::move(tasks.front());
      tasks.pop();
    }
    task(slot);
  }
}

};  // namespace galleon
