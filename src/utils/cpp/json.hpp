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

#ifndef INCLUDED_SRC_UTILS_CPP_JSON_HPP
#define INCLUDED_SRC_UTILS_CPP_JSON_HPP

#include <exception>
#include <optional>
#include <string>

#include "fmt/core.h"
#include "nlohmann/json.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Read a mandatory key of a JSON object as the given type.
template <typename ValueT>
[[nodiscard]] auto ExtractValueAs(nlohmann::json const& j,
                                  std::string const& key) noexcept
    -> expected<ValueT, std::string> {
    try {
        auto it = j.find(key);
        if (it == j.end()) {
            return unexpected{
                fmt::format("key \"{}\" cannot be found in JSON object", key)};
        }
        return it->template get<ValueT>();
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("reading key \"{}\" failed: {}", key, e.what())};
    }
}

/// \brief Read an optional key of a JSON object as the given type.
/// \returns std::nullopt if the key is absent or null, an error if the value
/// has the wrong type.
template <typename ValueT>
[[nodiscard]] auto ExtractOptionalValueAs(nlohmann::json const& j,
                                          std::string const& key) noexcept
    -> expected<std::optional<ValueT>, std::string> {
    try {
        auto it = j.find(key);
        if (it == j.end() or it->is_null()) {
            return std::optional<ValueT>{};
        }
        return std::optional<ValueT>{it->template get<ValueT>()};
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("reading key \"{}\" failed: {}", key, e.what())};
    }
}

#endif  // INCLUDED_SRC_UTILS_CPP_JSON_HPP
