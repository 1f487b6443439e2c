// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_interpreter.cpp
 * @brief Interpreter lifecycle, evaluation and symbol lookups.
 */

#include "pr_perl.hpp"
#include "pr_interpreter.hpp"
#include <cstdlib>

EXTERN_C void boot_DynaLoader(pTHX_ CV* cv);

namespace pearl {

namespace {

std::once_flag g_sys_init;

void sys_term() {
    PERL_SYS_TERM();
}

// Process-wide libperl setup, once per process
void ensure_sys_init() {
    std::call_once(g_sys_init, [] {
        static int argc = 1;
        static char arg0[] = "pearl";
        static char* argv_storage[] = {arg0, nullptr};
        static char** argv = argv_storage;
        static char* env_storage[] = {nullptr};
        static char** env = env_storage;
        PERL_SYS_INIT3(&argc, &argv, &env);
        std::atexit(sys_term);
    });
}

// Makes XS modules loadable through DynaLoader
void xs_init(pTHX) {
    static const char file[] = __FILE__;
    newXS("DynaLoader::boot_DynaLoader", boot_DynaLoader, file);
}

U32 name_flags(std::string_view name) {
    return is_utf8_text(name) ? SVf_UTF8 : 0;
}

} // anonymous namespace

::interpreter* interpreter_handle(const Interpreter& interp) {
    return interp.raw();
}

// ============================================================================
// Lifecycle
// ============================================================================

Interpreter::Interpreter(InterpreterConfig config)
    : config_(std::move(config)) {
    ensure_sys_init();

    args_.push_back("pearl");
    if (config_.enable_warnings) {
        args_.push_back("-w");
    }
    for (const auto& path : config_.include_paths) {
        args_.push_back("-I" + path);
    }
    for (const auto& sw : config_.switches) {
        args_.push_back(sw);
    }
    args_.push_back("-e");
    args_.push_back("0");

    argv_.reserve(args_.size() + 1);
    for (auto& arg : args_) {
        argv_.push_back(arg.data());
    }
    argv_.push_back(nullptr);

    perl_ = perl_alloc();
    if (perl_ == nullptr) {
        throw InterpreterError("perl_alloc failed");
    }
    dTHXa(perl_);
    PERL_SET_CONTEXT(perl_);
    perl_construct(perl_);
    PL_exit_flags |= PERL_EXIT_DESTRUCT_END;

    int status = perl_parse(perl_, xs_init, static_cast<int>(args_.size()), argv_.data(), nullptr);
    if (status == 0) {
        status = perl_run(perl_);
    }
    if (status != 0) {
        std::string error = SvTRUE(ERRSV) ? RawSv(ERRSV, perl_).text() : std::string();
        PL_perl_destruct_level = config_.destruct_level;
        perl_destruct(perl_);
        perl_free(perl_);
        perl_ = nullptr;
        throw InterpreterError("Perl startup failed (status " + std::to_string(status) + ")" +
                               (error.empty() ? std::string() : ": " + error));
    }
}

Interpreter::~Interpreter() {
    if (perl_ == nullptr) {
        return;
    }
    dTHXa(perl_);
    PERL_SET_CONTEXT(perl_);
    PL_perl_destruct_level = config_.destruct_level;
    perl_destruct(perl_);
    perl_free(perl_);
    perl_ = nullptr;
}

void Interpreter::make_current() const {
    PERL_SET_CONTEXT(perl_);
}

// ============================================================================
// Evaluation
// ============================================================================

Scalar Interpreter::eval(std::string_view source) {
    dTHXa(perl_);
    PERL_SET_CONTEXT(perl_);

    dSP;
    ENTER;
    SAVETMPS;
    SV* code = newSVpvn_flags(source.data(), source.size(), SVs_TEMP | name_flags(source));
    I32 count = eval_sv(code, G_SCALAR);
    SPAGAIN;
    SV* top = count > 0 ? POPs : &PL_sv_undef;
    PUTBACK;

    bool failed = SvTRUE(ERRSV);
    std::string error;
    RawSv result;
    if (failed) {
        error = RawSv(ERRSV, perl_).text();
    } else {
        // The stack slot is a temporary; keep an independent copy
        result = RawSv(newSVsv(top), perl_);
    }
    FREETMPS;
    LEAVE;

    if (failed) {
        throw InterpreterError(error);
    }
    return Scalar(result, Ownership::Adopt);
}

// ============================================================================
// Globals
// ============================================================================

std::optional<Scalar> Interpreter::find_scalar(std::string_view name) const {
    dTHXa(perl_);
    std::string n(name);
    SV* sv = get_sv(n.c_str(), name_flags(n));
    if (sv == nullptr) {
        return std::nullopt;
    }
    return Scalar(RawSv(sv, perl_), Ownership::Retain);
}

std::optional<Array> Interpreter::find_array(std::string_view name) const {
    dTHXa(perl_);
    std::string n(name);
    AV* av = get_av(n.c_str(), name_flags(n));
    if (av == nullptr) {
        return std::nullopt;
    }
    return Array(RawSv(MUTABLE_SV(av), perl_), Ownership::Retain);
}

std::optional<Hash> Interpreter::find_hash(std::string_view name) const {
    dTHXa(perl_);
    std::string n(name);
    HV* hv = get_hv(n.c_str(), name_flags(n));
    if (hv == nullptr) {
        return std::nullopt;
    }
    return Hash(RawSv(MUTABLE_SV(hv), perl_), Ownership::Retain);
}

std::optional<Sub> Interpreter::find_sub(std::string_view name) const {
    dTHXa(perl_);
    CV* code = get_cvn_flags(name.data(), name.size(), name_flags(name));
    if (code == nullptr) {
        return std::nullopt;
    }
    return Sub(RawSv(MUTABLE_SV(code), perl_), Ownership::Retain);
}

Scalar Interpreter::global_scalar(std::string_view name) {
    dTHXa(perl_);
    std::string n(name);
    SV* sv = get_sv(n.c_str(), GV_ADD | name_flags(n));
    return Scalar(RawSv(sv, perl_), Ownership::Retain);
}

} // namespace pearl
