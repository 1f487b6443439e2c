// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_interpreter.hpp
 * @brief Owner of one embedded Perl interpreter.
 *
 * An Interpreter and every wrapper created from it belong to the thread
 * that constructed it. Wrappers must be destroyed before their
 * Interpreter.
 */

#pragma once

#include "pr_array.hpp"
#include "pr_hash.hpp"
#include "pr_object.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pearl {

// Interpreter Configuration
struct InterpreterConfig {
    std::vector<std::string> switches;        // Extra perl switches, e.g. "-Mstrict"
    std::vector<std::string> include_paths;   // Passed as -I<path>
    bool enable_warnings = false;             // -w
    int destruct_level = 1;                   // PL_perl_destruct_level; 0 skips the final sweep
};

class Interpreter {
public:
    explicit Interpreter(InterpreterConfig config = InterpreterConfig{});
    ~Interpreter();

    // Prevent copying
    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // ========== Evaluation ==========

    // Evaluates `source` in scalar context. Source with non-ASCII bytes is
    // compiled as UTF-8. Throws InterpreterError with $@ on die or a
    // compile error.
    Scalar eval(std::string_view source);

    template<typename T>
    T eval(std::string_view source) {
        Scalar result = eval(source);
        return result.as<T>();
    }

    // ========== Globals ==========
    // Fully qualified names ("main::x", "Foo::Bar::baz"); std::nullopt
    // when the symbol does not exist.

    std::optional<Scalar> find_scalar(std::string_view name) const;
    std::optional<Array> find_array(std::string_view name) const;
    std::optional<Hash> find_hash(std::string_view name) const;
    std::optional<Sub> find_sub(std::string_view name) const;

    // Creates the package variable when missing
    Scalar global_scalar(std::string_view name);

    // ========== Calls ==========

    // Calls a named sub; the context follows R as in Sub::call
    template<typename R = void, typename... Args>
    R call(const std::string& name, const Args&... args) {
        SvList results = detail::invoke_named(perl_, name, detail::pack_args(perl_, args...),
                                              call_context_for<R>());
        return detail::unpack_result<R>(results);
    }

    template<typename... Args>
    std::vector<Scalar> call_list(const std::string& name, const Args&... args) {
        return detail::adopt_list(detail::invoke_named(perl_, name, detail::pack_args(perl_, args...),
                                                       CallContext::List));
    }

    // ========== Accessors ==========

    // Makes this the current interpreter of the calling thread
    void make_current() const;

    ::interpreter* raw() const { return perl_; }
    const InterpreterConfig& config() const { return config_; }

private:
    InterpreterConfig config_;
    ::interpreter* perl_{nullptr};

    // perl_parse keeps pointers into argv for $0
    std::vector<std::string> args_;
    std::vector<char*> argv_;
};

} // namespace pearl
