// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZLease a distributed lease lock on top of a strongly-consistent store.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef SRC_COMMON_ERROR_HPP
#define SRC_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <memory>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <type_traits>

namespace zlease {

// Codes below ConsistencyViolation are reported by stores, the rest by the lock client.
// Anything that is not InvalidArg or one of the lock codes is a store failure and is
// propagated to the caller as is.
enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    ServiceTemporarilyUnavailable = 2,
    VersionMismatch = 3,
    KeyNotFound = 4,
    AlreadyExists = 5,
    Timeout = 6,
    Internal = 7,
    Cancelled = 8,
    ConsistencyUnsupported = 9,
    ConsistencyViolation = 10,
    LockUnavailable = 11,
    LockReleased = 12,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

extern const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes;
bool isRetriable(const std::string& op, const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string key;
    std::string version;
    std::shared_ptr<const Error> cause;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string k, std::string ver);
    Error(const ErrorCode& c, std::string w, std::string k, const Error& inner);
    explicit Error(const ErrorCode& c);
};

} // namespace zlease

#endif // SRC_COMMON_ERROR_HPP
