// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_sub.hpp
 * @brief Subroutine wrapper: calling Perl code and exposing C++ callables.
 */

#pragma once

#include "pr_call.hpp"
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace pearl {

class Sub : public Value {
public:
    static constexpr ValueKind static_kind = ValueKind::Sub;

    // Throws UnexpectedValueType unless the handle is a CV
    Sub(RawSv handle, Ownership ownership);

    // Referent of a code reference (&$ref)
    explicit Sub(const Scalar& ref);

    // Exposes `fn` to Perl, installed as `name` (fully qualified, main::
    // when unqualified) or anonymous when `name` is empty. The sub keeps a
    // copy of `fn` until Perl frees it.
    template<typename F>
    Sub(Interpreter& interp, std::string_view name, F&& fn,
        std::source_location where = std::source_location::current())
        : Sub(create(interp, name, make_host_body(std::forward<F>(fn)), where.file_name())) {}

    template<typename F>
    static Sub define(Interpreter& interp, std::string_view name, F&& fn,
                      std::source_location where = std::source_location::current()) {
        return Sub(interp, name, std::forward<F>(fn), where);
    }

    ValueKind kind() const override { return ValueKind::Sub; }

    // Calls the sub. The context follows R: void, std::tuple<...> for list
    // context, anything else for scalar context.
    template<typename R = void, typename... Args>
    R call(const Args&... args) const {
        SvList results = detail::invoke_sv(handle_, detail::pack_args(perl(), args...),
                                           call_context_for<R>());
        return detail::unpack_result<R>(results);
    }

    // List-context call returning every value
    template<typename... Args>
    std::vector<Scalar> call_list(const Args&... args) const {
        return detail::adopt_list(detail::invoke_sv(handle_, detail::pack_args(perl(), args...),
                                                    CallContext::List));
    }

    // Name as Perl reports it ("main::foo", "__ANON__"), empty if unknown
    std::string name() const;

    // File the sub was defined in ("-e", "(eval 3)", a C++ source path)
    std::string source_file() const;

    bool is_host() const;

    std::string debug_description() const override;

private:
    explicit Sub(Value&& created) : Value(std::move(created)) {}

    static Value create(Interpreter& interp, std::string_view name, HostBody body, const char* file);
};

} // namespace pearl
