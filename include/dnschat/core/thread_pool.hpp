// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include "dnschat/core/logger.hpp"

namespace dnschat
{
namespace core
{

/// Fixed-size worker pool for long-running jobs (backend generations).
/// Exceptions escaping a fire-and-forget task are handed to the error
/// handler; the pool drains queued work before joining on shutdown.
class ThreadPool
{
public:
  /// @param size          Number of worker threads.
  /// @param maxQueueSize  Maximum number of queued tasks before enqueue
  /// throws.
  /// @param onTaskError   Optional handler for uncaught exceptions in tasks.
  explicit ThreadPool(std::size_t size = 4, std::size_t maxQueueSize = 256,
                      std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _maxQueueSize(maxQueueSize), _onTaskError(std::move(onTaskError))
  {
    if (size == 0)
    {
      size = 1;
    }
    _threads.reserve(size);
    for (std::size_t i = 0; i < size; ++i)
    {
      _threads.emplace_back([this]() { workerLoop(); });
    }
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /// Enqueue a fire-and-forget task with arguments.
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
    enqueueImpl(
      [bound = std::move(bound), this]() mutable
      {
        try
        {
          bound();
        }
        catch (...)
        {
          reportTaskError(std::current_exception());
        }
      });
  }

  /// Enqueue a task that returns a value and get a future for it.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    enqueueImpl([task]() { (*task)(); });
    return future;
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  std::size_t getThreadCount() const { return _threads.size(); }

  /// Stop accepting work, run what is already queued, and join the workers.
  void shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        return;
      }
      _shutdown = true;
    }
    _condition.notify_all();
    for (auto &t : _threads)
    {
      if (t.joinable())
      {
        t.join();
      }
    }
    Logger::debug("ThreadPool: all workers joined");
  }

private:
  void enqueueImpl(std::function<void()> task)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        throw std::runtime_error("ThreadPool is shutting down");
      }
      if (_tasks.size() >= _maxQueueSize)
      {
        throw std::runtime_error("ThreadPool task queue is full");
      }
      _tasks.push(std::move(task));
    }
    _condition.notify_one();
  }

  void workerLoop()
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        _condition.wait(lock, [this]() { return _shutdown || !_tasks.empty(); });
        if (_tasks.empty())
        {
          return;
        }
        task = std::move(_tasks.front());
        _tasks.pop();
      }
      task();
    }
  }

  void reportTaskError(std::exception_ptr error)
  {
    if (_onTaskError)
    {
      _onTaskError(error);
      return;
    }
    try
    {
      std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
      Logger::error(std::string("ThreadPool: unhandled exception in task: ") + e.what());
    }
    catch (...)
    {
      Logger::error("ThreadPool: unhandled non-standard exception in task");
    }
  }

  std::size_t _maxQueueSize;
  std::function<void(std::exception_ptr)> _onTaskError;
  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::queue<std::function<void()>> _tasks;
  std::vector<std::thread> _threads;
  bool _shutdown = false;
};

} // namespace core
} // namespace dnschat
