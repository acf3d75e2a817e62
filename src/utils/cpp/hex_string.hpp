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

#ifndef INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP
#define INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

/// \brief Lowercase hexadecimal rendering of raw bytes.
[[nodiscard]] static inline auto ToHexString(std::string_view bytes)
    -> std::string {
    static constexpr std::array<char, 16> kDigits{'0', '1', '2', '3',
                                                  '4', '5', '6', '7',
                                                  '8', '9', 'a', 'b',
                                                  'c', 'd', 'e', 'f'};
    static constexpr unsigned int kNibble = 4U;
    static constexpr unsigned int kLowMask = 0x0fU;
    std::string hex{};
    hex.reserve(bytes.size() * 2);
    for (auto const b : bytes) {
        auto const byte = static_cast<unsigned char>(b);
        hex.push_back(kDigits.at(byte >> kNibble));
        hex.push_back(kDigits.at(byte & kLowMask));
    }
    return hex;
}

/// \brief Check for a non-empty string of lowercase hexadecimal digits.
[[nodiscard]] static inline auto IsHexString(std::string_view s) noexcept
    -> bool {
    return not s.empty() and std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' and c <= '9') or (c >= 'a' and c <= 'f');
    });
}

#endif  // INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP
