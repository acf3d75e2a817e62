// Copyright 2025 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCLUDED_SRC_CASCLIENT_MULTITHREADING_TASK_SYSTEM_HPP
#define INCLUDED_SRC_CASCLIENT_MULTITHREADING_TASK_SYSTEM_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/// \brief Fixed-size worker pool sharing one task queue. At most
/// NumberOfThreads() tasks execute at any time; further tasks wait in the
/// queue until a worker becomes free.
class TaskSystem {
  public:
    using Task = std::function<void()>;

    // Creates as many threads as specified (or
    // std::thread::hardware_concurrency() many if not specified), but at least
    // one. If a thread cannot be created, the ones already running are joined
    // and the exception is rethrown.
    TaskSystem();
    explicit TaskSystem(std::size_t number_of_threads);

    TaskSystem(TaskSystem const&) = delete;
    TaskSystem(TaskSystem&&) = delete;
    auto operator=(TaskSystem const&) -> TaskSystem& = delete;
    auto operator=(TaskSystem&&) -> TaskSystem& = delete;

    // Waits for all queued tasks to finish, then joins the workers.
    ~TaskSystem();

    // Throws if the task cannot be enqueued.
    void QueueTask(Task task);

    [[nodiscard]] auto NumberOfThreads() const noexcept -> std::size_t {
        return threads_.size();
    }

    // Wait for the queue to become empty _and_ all running tasks to finish.
    void Finish() noexcept;

  private:
    std::mutex mutex_;
    std::condition_variable task_available_;
    std::condition_variable idle_;
    std::deque<Task> queue_;
    std::size_t running_{0};
    bool done_{false};
    std::vector<std::thread> threads_;

    void Run() noexcept;
    void Shutdown() noexcept;
};

#endif  // INCLUDED_SRC_CASCLIENT_MULTITHREADING_TASK_SYSTEM_HPP
