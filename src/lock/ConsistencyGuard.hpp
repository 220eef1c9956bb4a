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
#ifndef CONSISTENCY_GUARD_H
#define CONSISTENCY_GUARD_H

#include <expected>
#include <variant>
#include "common/Error.hpp"
#include "storage/LeaseStore.hpp"

namespace zlease {

// Leases are only safe when every read sees the latest write, so anything weaker than
// Strong fails with ConsistencyViolation. The client override wins over the account level.
std::expected<std::monostate, Error> checkConsistency(const LeaseStore& store);

} // namespace zlease

#endif // CONSISTENCY_GUARD_H
