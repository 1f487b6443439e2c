// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_error.hpp
 * @brief Error taxonomy of the marshaling layer.
 *
 * All errors are recoverable and derive from PerlError, itself a
 * std::runtime_error.
 */

#pragma once

#include "pr_core.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace pearl {

class PerlError : public std::runtime_error {
public:
    explicit PerlError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Handle tag does not match the requested wrapper variant
class UnexpectedValueType : public PerlError {
public:
    UnexpectedValueType(ValueKind expected, SvType actual)
        : PerlError(std::string("Unexpected value type: expected ") + value_kind_name(expected) +
                    ", got " + sv_type_name(actual))
        , expected_(expected)
        , actual_(actual) {}

    UnexpectedValueType(ValueKind expected, const std::string& detail)
        : PerlError(std::string("Unexpected value type: expected ") + value_kind_name(expected) +
                    ", got " + detail)
        , expected_(expected)
        , actual_(SvType::Unknown) {}

    ValueKind expected() const { return expected_; }
    SvType actual() const { return actual_; }

private:
    ValueKind expected_;
    SvType actual_;
};

class ConversionError : public PerlError {
public:
    explicit ConversionError(const std::string& msg)
        : PerlError("Conversion error: " + msg) {}
};

// Positional argument outside the current call's argument view
class NoArgumentOnStack : public PerlError {
public:
    NoArgumentOnStack(size_t index, size_t available)
        : PerlError("No argument on stack at index " + std::to_string(index) +
                    " (" + std::to_string(available) + " passed)")
        , index_(index)
        , available_(available) {}

    size_t index() const { return index_; }
    size_t available() const { return available_; }

private:
    size_t index_;
    size_t available_;
};

// Perl died during evaluation or a call; message is $@ verbatim
class InterpreterError : public PerlError {
public:
    explicit InterpreterError(const std::string& msg)
        : PerlError(msg) {}
};

} // namespace pearl
