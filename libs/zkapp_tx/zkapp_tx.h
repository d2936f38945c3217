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

// utils
#include "codes.h"
#include "field.h"
#include "hashing.h"
#include "key_sig.h"
#include "logging.h"
#include "result.h"

// model
#include "body.h"
#include "int.h"
#include "permissions.h"
#include "preconditions.h"
#include "token.h"

// encodings
#include "fields.h"
#include "json_codec.h"

// tree, forest and pipeline
#include "account_update.h"
#include "call_forest.h"
#include "proving.h"
#include "provable.h"
#include "settings.h"
#include "signing.h"
#include "transaction.h"
#include "zkapp_command.h"
