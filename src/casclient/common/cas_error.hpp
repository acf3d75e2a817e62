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

#ifndef INCLUDED_SRC_CASCLIENT_COMMON_CAS_ERROR_HPP
#define INCLUDED_SRC_CASCLIENT_COMMON_CAS_ERROR_HPP

#include <cstdint>
#include <string>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/utils/cpp/expected.hpp"

/// \brief Classification of every failure reported by the transfer engine.
enum class ErrorKind : std::uint8_t {
    // caller supplied data and configuration
    MalformedDigest,
    InvalidConfig,
    // chunk protocol
    SeekError,
    ChunkerExhausted,
    OutOfOrderChunk,
    IncompleteBlob,
    // local file system
    FileUnreadable,
    LocalIoError,
    // tree resolution
    MissingNode,
    MalformedTree,
    TreeTooDeep,
    // remote protocol
    PresenceCheckFailed,
    DigestMismatch,
    MalformedResponse,
    NotFound,
    // transient transport failures
    Unavailable,
    DeadlineExceeded,
    ResourceExhausted,
    TransportReset,
    // fatal failures
    Unauthenticated,
    PermissionDenied,
    RetryBudgetExceeded,
    // other
    Cancelled,
    Internal
};

[[nodiscard]] constexpr auto IsTransient(ErrorKind kind) noexcept -> bool {
    switch (kind) {
        case ErrorKind::Unavailable:
        case ErrorKind::DeadlineExceeded:
        case ErrorKind::ResourceExhausted:
        case ErrorKind::TransportReset:
            return true;
        default:
            return false;
    }
}

/// \brief Errors that abort an entire dispatch instead of a single item.
[[nodiscard]] constexpr auto IsFatal(ErrorKind kind) noexcept -> bool {
    return kind == ErrorKind::Unauthenticated or
           kind == ErrorKind::PermissionDenied or
           kind == ErrorKind::RetryBudgetExceeded;
}

[[nodiscard]] static inline auto ToString(ErrorKind kind) -> std::string {
    switch (kind) {
        case ErrorKind::MalformedDigest:
            return "MalformedDigest";
        case ErrorKind::InvalidConfig:
            return "InvalidConfig";
        case ErrorKind::SeekError:
            return "SeekError";
        case ErrorKind::ChunkerExhausted:
            return "ChunkerExhausted";
        case ErrorKind::OutOfOrderChunk:
            return "OutOfOrderChunk";
        case ErrorKind::IncompleteBlob:
            return "IncompleteBlob";
        case ErrorKind::FileUnreadable:
            return "FileUnreadable";
        case ErrorKind::LocalIoError:
            return "LocalIoError";
        case ErrorKind::MissingNode:
            return "MissingNode";
        case ErrorKind::MalformedTree:
            return "MalformedTree";
        case ErrorKind::TreeTooDeep:
            return "TreeTooDeep";
        case ErrorKind::PresenceCheckFailed:
            return "PresenceCheckFailed";
        case ErrorKind::DigestMismatch:
            return "DigestMismatch";
        case ErrorKind::MalformedResponse:
            return "MalformedResponse";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::Unavailable:
            return "Unavailable";
        case ErrorKind::DeadlineExceeded:
            return "DeadlineExceeded";
        case ErrorKind::ResourceExhausted:
            return "ResourceExhausted";
        case ErrorKind::TransportReset:
            return "TransportReset";
        case ErrorKind::Unauthenticated:
            return "Unauthenticated";
        case ErrorKind::PermissionDenied:
            return "PermissionDenied";
        case ErrorKind::RetryBudgetExceeded:
            return "RetryBudgetExceeded";
        case ErrorKind::Cancelled:
            return "Cancelled";
        case ErrorKind::Internal:
            return "Internal";
    }
    Ensures(false);  // unreachable
}

/// \brief Error value carried by expected<T, CasError>.
struct CasError {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;

    [[nodiscard]] auto IsTransient() const noexcept -> bool {
        return ::IsTransient(kind);
    }
    [[nodiscard]] auto IsFatal() const noexcept -> bool {
        return ::IsFatal(kind);
    }
    [[nodiscard]] auto ToString() const -> std::string {
        return fmt::format("{}: {}", ::ToString(kind), message);
    }
};

/// \brief Shorthand for creating the error alternative of an expected.
template <class... TArgs>
[[nodiscard]] static inline auto MakeError(ErrorKind kind,
                                           std::string const& fmt_str,
                                           TArgs&&... args)
    -> unexpected<CasError> {
    if constexpr (sizeof...(TArgs) == 0) {
        return unexpected{CasError{.kind = kind, .message = fmt_str}};
    }
    else {
        return unexpected{CasError{
            .kind = kind,
            .message = fmt::vformat(fmt_str, fmt::make_format_args(args...))}};
    }
}

#endif  // INCLUDED_SRC_CASCLIENT_COMMON_CAS_ERROR_HPP
