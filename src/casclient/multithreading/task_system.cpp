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

#include "src/casclient/multithreading/task_system.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/logger.hpp"

TaskSystem::TaskSystem() : TaskSystem(std::thread::hardware_concurrency()) {}

TaskSystem::TaskSystem(std::size_t number_of_threads) {
    auto const count = std::max(std::size_t{1}, number_of_threads);
    try {
        threads_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            threads_.emplace_back([this]() { Run(); });
        }
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "TaskSystem: started {} of {} workers:\n{}",
                    threads_.size(),
                    count,
                    e.what());
        Shutdown();
        throw;
    }
}

TaskSystem::~TaskSystem() {
    Finish();
    Shutdown();
}

void TaskSystem::Shutdown() noexcept {
    {
        std::unique_lock lock{mutex_};
        done_ = true;
    }
    task_available_.notify_all();
    for (auto& t : threads_) {
        t.join();
    }
}

void TaskSystem::QueueTask(Task task) {
    {
        std::unique_lock lock{mutex_};
        queue_.emplace_back(std::move(task));
    }
    task_available_.notify_one();
}

void TaskSystem::Finish() noexcept {
    std::unique_lock lock{mutex_};
    idle_.wait(lock, [this] { return queue_.empty() and running_ == 0; });
}

void TaskSystem::Run() noexcept {
    while (true) {
        Task task{};
        {
            std::unique_lock lock{mutex_};
            task_available_.wait(lock,
                                 [this] { return done_ or not queue_.empty(); });
            if (queue_.empty()) {
                return;  // done_ is set and nothing is left
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }
        try {
            task();
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "TaskSystem: task failed with exception:\n{}",
                        e.what());
        }
        {
            std::unique_lock lock{mutex_};
            --running_;
            if (queue_.empty() and running_ == 0) {
                idle_.notify_all();
            }
        }
    }
}
