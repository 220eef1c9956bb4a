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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <memory>
#include <ostream>
#include <unordered_set>
#include <unordered_map>

namespace zlease {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::ServiceTemporarilyUnavailable: return "ServiceTemporarilyUnavailable";
        case ErrorCode::VersionMismatch: return "VersionMismatch";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::ConsistencyUnsupported: return "ConsistencyUnsupported";
        case ErrorCode::ConsistencyViolation: return "ConsistencyViolation";
        case ErrorCode::LockUnavailable: return "LockUnavailable";
        case ErrorCode::LockReleased: return "LockReleased";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

// A create or replace whose reply was lost may already be applied; retrying it turns our
// own write into AlreadyExists or VersionMismatch, so those are never retried here.
const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes = {
    {"create", {}},
    {"replace", {}},
    {"erase", {
        ErrorCode::ServiceTemporarilyUnavailable,
        ErrorCode::Timeout,
    }},
    {"default", {
        ErrorCode::Unknown,
        ErrorCode::ServiceTemporarilyUnavailable,
        ErrorCode::Timeout,
    }}
};

bool isRetriable(const std::string& op, const ErrorCode& code) {
    auto it = retriableErrorCodes.find(op);
    if (it != retriableErrorCodes.end()) {
        return it->second.contains(code);
    } else {
        auto d = retriableErrorCodes.find("default");
        return d->second.contains(code);
    }
}

Error::Error(const ErrorCode& c, std::string w, std::string k, std::string ver)
    : code {c}, what {std::move(w)}, key {std::move(k)}, version {std::move(ver)}, cause {} {}
Error::Error(const ErrorCode& c, std::string w, std::string k, const Error& inner)
    : code {c}, what {std::move(w)}, key {std::move(k)}, version {inner.version}, cause {std::make_shared<const Error>(inner)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key{}, version{}, cause{} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, key{}, version{}, cause{} {}

} // namespace zlease
