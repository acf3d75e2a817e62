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

#ifndef INCLUDED_SRC_CASCLIENT_MULTITHREADING_CANCELLATION_HPP
#define INCLUDED_SRC_CASCLIENT_MULTITHREADING_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

/// \brief Cooperative cancellation signal shared by copies of a token.
/// Cancellation propagates from a token to all children created via
/// MakeChild(), never upwards.
class CancellationToken final {
  public:
    CancellationToken() : state_{std::make_shared<State>()} {}

    /// \brief Request cancellation. Idempotent.
    void Cancel() const noexcept { CancelState(state_); }

    [[nodiscard]] auto IsCancelled() const noexcept -> bool {
        std::unique_lock lock{state_->mutex};
        return state_->cancelled;
    }

    /// \brief Sleep for the given duration, waking up early on cancellation.
    /// \returns true if the token was cancelled.
    template <class TRep, class TPeriod>
    [[nodiscard]] auto WaitFor(
        std::chrono::duration<TRep, TPeriod> const& duration) const noexcept
        -> bool {
        std::unique_lock lock{state_->mutex};
        return state_->cv.wait_for(
            lock, duration, [this] { return state_->cancelled; });
    }

    /// \brief Create a token that is cancelled together with this one, but
    /// can also be cancelled on its own.
    [[nodiscard]] auto MakeChild() const -> CancellationToken;

  private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled{false};
        std::vector<std::weak_ptr<State>> children;
    };

    std::shared_ptr<State> state_;

    explicit CancellationToken(std::shared_ptr<State> state) noexcept
        : state_{std::move(state)} {}

    static void CancelState(std::shared_ptr<State> const& state) noexcept;
};

#endif  // INCLUDED_SRC_CASCLIENT_MULTITHREADING_CANCELLATION_HPP
