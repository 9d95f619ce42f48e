/*
 * Sieve - runtime value validation and coercion engine
 * Copyright (C) 2025  Ivan Pidhurskyi
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

#include "sieve/builtins.hpp"
#include "sieve/coerce.hpp"
#include "sieve/compiler.hpp"
#include "sieve/descriptor.hpp"
#include "sieve/exceptions.hpp"
#include "sieve/format.hpp"
#include "sieve/functional.hpp"
#include "sieve/literal_reader.hpp"
#include "sieve/pattern.hpp"
#include "sieve/registry.hpp"
#include "sieve/result.hpp"
#include "sieve/type.hpp"
#include "sieve/value.hpp"
#include "sieve/variants.hpp"
