/*
 * @file        galleon/src/include/utils/queue/queue.hpp
 * @brief       Blocking queue used as a completion channel between workers and their owner
 * @author      Yurun Zi
 * @date        2025-03-20
 * @license     MIT
 *
 * @copyright   Copyright (c) 2025 Yurun Zi
 */

// Copyright (c) 2025 Yurun Zi
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

#pragma once

namespace galleon {
/**
 * @brief A thread-safe unbounded blocking queue. Producers never block; a consumer blocks in
 * pop() until an element is available, which makes it a "wait for any completion" primitive.
 */
template <typename T>
class ConcurrentBlockingQueue {
 public:
  ConcurrentBlockingQueue() = default;

  ConcurrentBlockingQueue(const ConcurrentBlockingQueue&)            = delete;
  ConcurrentBlockingQueue& operator=(const ConcurrentBlockingQueue&) = delete;

  /**
   * @brief A thread-safe wrapper for the underlying push() method
   *
   * @param item the element to enqueue
   */
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      _queue.push(std::move(item));
    }
    _consumer_cv.notify_one();
  }

  /**
   * @brief Blocks until an element is available, then removes and returns it
   *
   * @return the front-most element of the queue
   */
  T pop() {
    std::unique_lock<std::mutex> lock(mtx);
    _consumer_cv.wait(lock, [this] { return !_queue.empty(); });

    T handled = std::move(_queue.front());
    _queue.pop();

    return handled;
  }

  auto size() const -> size_t {
    std::lock_guard<std::mutex> lock(mtx);
    return _queue.size();
  }

  auto empty() const -> bool {
    std::lock_guard<std::mutex> lock(mtx);
    return _queue.empty();
  }

 private:
  std::queue<T>           _queue;
  mutable std::mutex      mtx;
  std::condition_variable _consumer_cv;
};
};  // namespace galleon
