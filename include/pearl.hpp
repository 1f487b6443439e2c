// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pearl.hpp
 * @brief Umbrella header for the Pearl embedding library.
 */

#pragma once

#include "pr_core.hpp"
#include "pr_error.hpp"
#include "pr_value.hpp"
#include "pr_convert.hpp"
#include "pr_scalar.hpp"
#include "pr_array.hpp"
#include "pr_hash.hpp"
#include "pr_call.hpp"
#include "pr_sub.hpp"
#include "pr_object.hpp"
#include "pr_interpreter.hpp"
