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

#include "src/casclient/multithreading/cancellation.hpp"

#include <algorithm>
#include <utility>

auto CancellationToken::MakeChild() const -> CancellationToken {
    auto child = std::make_shared<State>();
    std::unique_lock lock{state_->mutex};
    if (state_->cancelled) {
        child->cancelled = true;
    }
    else {
        auto& children = state_->children;
        children.erase(std::remove_if(children.begin(),
                                      children.end(),
                                      [](auto const& c) { return c.expired(); }),
                       children.end());
        children.emplace_back(child);
    }
    return CancellationToken{std::move(child)};
}

void CancellationToken::CancelState(
    std::shared_ptr<State> const& state) noexcept {
    std::vector<std::weak_ptr<State>> children{};
    {
        std::unique_lock lock{state->mutex};
        if (state->cancelled) {
            return;
        }
        state->cancelled = true;
        children = std::move(state->children);
        state->children.clear();
    }
    state->cv.notify_all();
    for (auto const& weak_child : children) {
        if (auto child = weak_child.lock()) {
            CancelState(child);
        }
    }
}
