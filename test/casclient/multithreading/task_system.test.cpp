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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <limits>
#include <mutex>
#include <numeric>  // std::iota
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "catch2/catch.hpp"
#include "src/casclient/multithreading/task_system.hpp"

namespace {

enum class CallStatus { kNotExecuted, kExecuted };

}  // namespace

TEST_CASE("Basic", "[task_system]") {
    SECTION("Empty task system terminates") {
        { TaskSystem ts; }
        CHECK(true);
    }
    SECTION("0-arguments constructor") {
        TaskSystem ts;
        CHECK(ts.NumberOfThreads() ==
              std::max(1U, std::thread::hardware_concurrency()));
    }
    SECTION("1-argument constructor") {
        std::size_t const desired_number_of_threads_in_ts =
            GENERATE(1U, 2U, 5U, 10U);
        TaskSystem ts(desired_number_of_threads_in_ts);
        CHECK(ts.NumberOfThreads() == desired_number_of_threads_in_ts);
    }
    SECTION("Zero threads are raised to one") {
        TaskSystem ts(0);
        CHECK(ts.NumberOfThreads() == 1);
    }
}

TEST_CASE("Side effects of tasks are reflected out of ts", "[task_system]") {
    SECTION("Lambda function") {
        auto status = CallStatus::kNotExecuted;
        {  // Make sure that all tasks will be completed before the checks
            TaskSystem ts;
            ts.QueueTask([&status]() { status = CallStatus::kExecuted; });
        }
        CHECK(status == CallStatus::kExecuted);
    }
    SECTION("std::function") {
        auto status = CallStatus::kNotExecuted;
        {
            TaskSystem ts;
            std::function<void()> f{
                [&status]() { status = CallStatus::kExecuted; }};
            ts.QueueTask(f);
        }
        CHECK(status == CallStatus::kExecuted);
    }
}

TEST_CASE("All tasks are executed", "[task_system]") {
    std::size_t const number_of_tasks = 1000;
    std::vector<int> tasks_executed;
    std::vector<int> queued_tasks(number_of_tasks);
    std::iota(std::begin(queued_tasks), std::end(queued_tasks), 0);
    std::mutex m;

    {
        TaskSystem ts{4};
        for (auto task_num : queued_tasks) {
            ts.QueueTask([&tasks_executed, &m, task_num]() {
                std::unique_lock l{m};
                tasks_executed.push_back(task_num);
            });
        }
    }

    std::sort(tasks_executed.begin(), tasks_executed.end());
    CHECK(tasks_executed == queued_tasks);
}

TEST_CASE("Tasks may queue further tasks", "[task_system]") {
    std::atomic<int> executed{0};
    {
        TaskSystem ts{2};
        ts.QueueTask([&ts, &executed]() {
            ++executed;
            for (int i = 0; i < 10; ++i) {
                ts.QueueTask([&executed]() { ++executed; });
            }
        });
    }
    CHECK(executed == 11);
}

TEST_CASE("Never more tasks run than threads exist", "[task_system]") {
    using namespace std::chrono_literals;
    constexpr std::size_t kThreads = 3;
    std::atomic<std::size_t> active{0};
    std::atomic<std::size_t> max_active{0};
    {
        TaskSystem ts{kThreads};
        for (int i = 0; i < 30; ++i) {
            ts.QueueTask([&active, &max_active]() {
                auto const now = ++active;
                auto max = max_active.load();
                while (now > max and
                       not max_active.compare_exchange_weak(max, now)) {
                }
                std::this_thread::sleep_for(2ms);
                --active;
            });
        }
    }
    CHECK(max_active <= kThreads);
    CHECK(max_active >= 1);
}

TEST_CASE("Finish waits for running tasks", "[task_system]") {
    using namespace std::chrono_literals;
    std::atomic<bool> done{false};
    TaskSystem ts{2};
    ts.QueueTask([&done]() {
        std::this_thread::sleep_for(20ms);
        done = true;
    });
    ts.Finish();
    CHECK(done);
}

TEST_CASE("Failing to create workers throws", "[task_system]") {
    constexpr auto kTooMany = std::numeric_limits<std::size_t>::max();
    CHECK_THROWS_AS(TaskSystem{kTooMany}, std::length_error);

    // a later pool is unaffected
    std::atomic<int> executed{0};
    {
        TaskSystem ts{2};
        ts.QueueTask([&executed]() { ++executed; });
    }
    CHECK(executed == 1);
}
