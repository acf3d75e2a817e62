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

#include <atomic>
#include <chrono>
#include <thread>

#include "catch2/catch.hpp"
#include "src/casclient/multithreading/cancellation.hpp"

TEST_CASE("Cancellation propagates to children", "[cancellation]") {
    CancellationToken parent{};
    auto child = parent.MakeChild();
    auto grandchild = child.MakeChild();
    CHECK_FALSE(parent.IsCancelled());
    CHECK_FALSE(grandchild.IsCancelled());

    SECTION("Cancelling the parent") {
        parent.Cancel();
        CHECK(child.IsCancelled());
        CHECK(grandchild.IsCancelled());
    }

    SECTION("Cancelling a child does not affect the parent") {
        child.Cancel();
        CHECK(grandchild.IsCancelled());
        CHECK_FALSE(parent.IsCancelled());
    }

    SECTION("Children of cancelled tokens start cancelled") {
        parent.Cancel();
        CHECK(parent.MakeChild().IsCancelled());
    }

    SECTION("Cancel is idempotent") {
        parent.Cancel();
        parent.Cancel();
        CHECK(parent.IsCancelled());
    }
}

TEST_CASE("Copies share the cancellation state", "[cancellation]") {
    CancellationToken token{};
    auto copy = token;
    copy.Cancel();
    CHECK(token.IsCancelled());
}

TEST_CASE("Waiting is interrupted by cancellation", "[cancellation]") {
    using namespace std::chrono_literals;
    CancellationToken parent{};
    auto child = parent.MakeChild();

    SECTION("Timeout without cancellation") {
        CHECK_FALSE(child.WaitFor(5ms));
    }

    SECTION("Cancelled from another thread") {
        auto const start = std::chrono::steady_clock::now();
        std::thread canceller{[&parent]() {
            std::this_thread::sleep_for(10ms);
            parent.Cancel();
        }};
        CHECK(child.WaitFor(10s));
        canceller.join();
        CHECK(std::chrono::steady_clock::now() - start < 5s);
    }

    SECTION("Already cancelled") {
        parent.Cancel();
        CHECK(child.WaitFor(10s));
    }
}
