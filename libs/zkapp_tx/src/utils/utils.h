/*
 * Bullet Ledger
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once
#include "blst.h"
#include "result.h"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

using bytes32 = std::array<byte, 32>;

bytes32 gen_rand_32();

std::string to_hex(const byte* data, size_t len);
Result<std::vector<byte>, int> from_hex(const std::string& hex);

// "..abcd", used by the pretty printers
std::string short_str(const std::string& s);
