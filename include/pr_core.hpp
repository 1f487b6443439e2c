// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_core.hpp
 * @brief Core definitions shared by every Pearl header.
 *
 * Forward declarations of the libperl structures, the wrapper variant
 * enumeration, ownership modes and the debug/assert macros.
 */

#pragma once

#include <cassert>
#include <cstdint>
#include <cstdio>

// libperl types. Only src/common/pr_perl.hpp includes perl.h itself.
struct sv;
struct av;
struct hv;
struct cv;
struct interpreter;

namespace pearl {

// Forward declarations
class Interpreter;
class Value;
class Scalar;
class Array;
class Hash;
class Sub;
class Object;

// Underlying PerlInterpreter of an Interpreter (pr_interpreter.cpp)
::interpreter* interpreter_handle(const Interpreter& interp);

// How a wrapper takes hold of an SV reference
enum class Ownership : uint8_t {
    Adopt = 0,   // Reference already counted for us (e.g. returned by newSV*)
    Retain = 1   // Borrowed reference, wrapper increments on construction
};

// Wrapper variant enumeration
enum class ValueKind : uint8_t {
    Generic,
    Scalar,
    Array,
    Hash,
    Sub,
    Object
};

// Runtime-side tag of an SV
enum class SvType : uint8_t {
    Scalar,
    Array,
    Hash,
    Code,
    Glob,
    IO,
    Format,
    Unknown
};

// Utility: ValueKind to string
inline const char* value_kind_name(ValueKind k) {
    switch (k) {
        case ValueKind::Generic: return "Value";
        case ValueKind::Scalar:  return "Scalar";
        case ValueKind::Array:   return "Array";
        case ValueKind::Hash:    return "Hash";
        case ValueKind::Sub:     return "Sub";
        case ValueKind::Object:  return "Object";
    }
    return "Unknown";
}

// Utility: SvType to string
inline const char* sv_type_name(SvType t) {
    switch (t) {
        case SvType::Scalar:  return "scalar";
        case SvType::Array:   return "array";
        case SvType::Hash:    return "hash";
        case SvType::Code:    return "code";
        case SvType::Glob:    return "glob";
        case SvType::IO:      return "io";
        case SvType::Format:  return "format";
        case SvType::Unknown: return "unknown";
    }
    return "unknown";
}

// Debug utilities
#ifdef PR_DEBUG
    #define PR_DEBUG_RC(fmt, ...) \
        std::printf("[RC] " fmt "\n", ##__VA_ARGS__)
#else
    #define PR_DEBUG_RC(fmt, ...)
#endif

#define PR_ASSERT(cond, msg) assert((cond) && (msg))

} // namespace pearl
