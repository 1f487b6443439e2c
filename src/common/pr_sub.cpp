// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_sub.cpp
 * @brief Perl call stack plumbing: call_sv wrappers and the XSUB trampoline.
 */

#include "pr_perl.hpp"
#include "pr_sub.hpp"

namespace pearl {

// ============================================================================
// Arguments
// ============================================================================

RawSv Arguments::value_at(size_t index) const {
    if (index >= count_) {
        return RawSv();
    }
    dTHXa(perl_);
    // PL_stack_base moves when the stack grows, so recompute every time
    return RawSv(PL_stack_base[ax_ + static_cast<int32_t>(index)], perl_);
}

RawSv Arguments::required(size_t index) const {
    if (index >= count_) {
        throw NoArgumentOnStack(index, count_);
    }
    return value_at(index);
}

Scalar Arguments::operator[](size_t index) const {
    return Scalar(required(index), Ownership::Retain);
}

// ============================================================================
// Calls into Perl
// ============================================================================

namespace {

I32 context_flags(CallContext context) {
    switch (context) {
        case CallContext::Void:   return G_VOID;
        case CallContext::Scalar: return G_SCALAR;
        case CallContext::List:   return G_LIST;
    }
    return G_SCALAR;
}

// Pushes `args`, runs `dispatch(flags)` under G_EVAL and copies the results
// off the stack before the temporaries are freed.
template<typename Dispatch>
SvList run_call(::interpreter* perl, SvList args, CallContext context, Dispatch&& dispatch) {
    dTHXa(perl);
    PERL_SET_CONTEXT(perl);

    std::vector<RawSv> pushed = args.release();

    dSP;
    ENTER;
    SAVETMPS;
    PUSHMARK(SP);
    EXTEND(SP, static_cast<SSize_t>(pushed.size()));
    for (const RawSv& arg : pushed) {
        // The mortal takes over our reference
        PUSHs(sv_2mortal(arg.sv));
    }
    PUTBACK;

    I32 count = dispatch(context_flags(context) | G_EVAL);

    SPAGAIN;
    bool failed = SvTRUE(ERRSV);
    std::string error;
    SvList results;
    if (failed) {
        error = RawSv(ERRSV, perl).text();
    } else {
        results.reserve(static_cast<size_t>(count));
        SV** first = SP - count + 1;
        for (I32 i = 0; i < count; ++i) {
            results.push_back(RawSv(newSVsv(first[i]), perl));
        }
    }
    SP -= count;
    PUTBACK;
    FREETMPS;
    LEAVE;

    if (failed) {
        throw InterpreterError(error);
    }
    return results;
}

} // anonymous namespace

namespace detail {

SvList invoke_sv(const RawSv& code, SvList args, CallContext context) {
    dTHXa(code.perl);
    return run_call(code.perl, std::move(args), context, [&](I32 flags) {
        return call_sv(code.sv, flags);
    });
}

SvList invoke_named(::interpreter* perl, const std::string& name, SvList args, CallContext context) {
    dTHXa(perl);
    CV* code = get_cvn_flags(name.data(), name.size(), is_utf8_text(name) ? SVf_UTF8 : 0);
    if (code == nullptr) {
        throw InterpreterError("Undefined subroutine &" + name + " called");
    }
    return invoke_sv(RawSv(MUTABLE_SV(code), perl), std::move(args), context);
}

SvList invoke_method(::interpreter* perl, const std::string& method, SvList args, CallContext context) {
    if (args.empty()) {
        throw NoArgumentOnStack(0, 0);
    }
    dTHXa(perl);
    U32 name_flags = is_utf8_text(method) ? SVf_UTF8 : 0;
    return run_call(perl, std::move(args), context, [&](I32 flags) {
        // Mortal inside run_call's scope
        SV* method_name = sv_2mortal(newSVpvn_flags(method.data(), method.size(), name_flags));
        return call_sv(method_name, flags | G_METHOD_NAMED);
    });
}

std::vector<Scalar> adopt_list(SvList results) {
    std::vector<RawSv> owned = results.release();
    std::vector<Scalar> out;
    out.reserve(owned.size());
    for (size_t i = 0; i < owned.size(); ++i) {
        out.emplace_back(owned[i], Ownership::Adopt);
    }
    return out;
}

} // namespace detail

// ============================================================================
// Host subs
// ============================================================================

namespace {

struct HostSub {
    HostBody body;
};

int free_host_sub(pTHX_ SV* sv, MAGIC* mg) {
    PERL_UNUSED_ARG(mg);
    CV* code = MUTABLE_CV(sv);
    delete static_cast<HostSub*>(CvXSUBANY(code).any_ptr);
    CvXSUBANY(code).any_ptr = nullptr;
    return 0;
}

MGVTBL host_sub_vtbl = {
    nullptr,        // get
    nullptr,        // set
    nullptr,        // len
    nullptr,        // clear
    free_host_sub,  // free
    nullptr,        // copy
    nullptr,        // dup
    nullptr         // local
};

// Runs the body with every C++ object confined to this frame. Results are
// left on the stack; the return value is a mortal error message or null.
SV* dispatch_host_sub(pTHX_ CV* cv, I32 ax, I32 items, I32* returned) {
    auto* host = static_cast<HostSub*>(CvXSUBANY(cv).any_ptr);
    std::string error;
    try {
        Arguments args(aTHX, ax, static_cast<size_t>(items));
        SvList results = host->body(args);

        // The body may have grown the stack
        SV** sp = PL_stack_base + ax - 1;
        EXTEND(sp, static_cast<SSize_t>(results.size()));
        std::vector<RawSv> owned = results.release();
        for (const RawSv& result : owned) {
            PUSHs(sv_2mortal(result.sv));
        }
        PUTBACK;
        *returned = static_cast<I32>(owned.size());
        return nullptr;
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = "unknown C++ exception";
    }
    *returned = 0;
    return sv_2mortal(newSVpvn_flags(error.data(), error.size(),
                                     is_utf8_text(error) ? SVf_UTF8 : 0));
}

void host_sub_trampoline(pTHX_ CV* cv) {
    dXSARGS;
    PERL_UNUSED_VAR(sp);
    I32 returned = 0;
    SV* error = dispatch_host_sub(aTHX_ cv, ax, items, &returned);
    if (error != nullptr) {
        // No C++ frame is live past this point
        croak_sv(error);
    }
    XSRETURN(returned);
}

} // anonymous namespace

Value Sub::create(Interpreter& interp, std::string_view name, HostBody body, const char* file) {
    ::interpreter* perl = interpreter_handle(interp);
    dTHXa(perl);
    PERL_SET_CONTEXT(perl);

    std::string qualified(name);
    U32 flags = is_utf8_text(qualified) ? SVf_UTF8 : 0;
    CV* code = newXS_flags(qualified.empty() ? nullptr : qualified.c_str(),
                           host_sub_trampoline, file, nullptr, flags);

    auto* host = new HostSub{std::move(body)};
    CvXSUBANY(code).any_ptr = host;
    sv_magicext(MUTABLE_SV(code), nullptr, PERL_MAGIC_ext, &host_sub_vtbl, nullptr, 0);

    PR_DEBUG_RC("host sub %s at %p", qualified.empty() ? "__ANON__" : qualified.c_str(),
                static_cast<void*>(code));

    // A named sub is owned by its glob; an anonymous one is ours
    RawSv handle(MUTABLE_SV(code), perl);
    return Value(handle, qualified.empty() ? Ownership::Adopt : Ownership::Retain);
}

Sub::Sub(RawSv handle, Ownership ownership)
    : Value(check_type(handle, SvType::Code, ValueKind::Sub), ownership) {}

Sub::Sub(const Scalar& ref)
    : Value(detail::resolve_container(ref.handle(), ValueKind::Sub), Ownership::Retain) {}

std::string Sub::name() const {
    dTHXa(perl());
    CV* code = MUTABLE_CV(handle_.sv);
    GV* gv = CvGV(code);
    if (gv == nullptr) {
        return std::string();
    }
    Scalar full(RawSv(newSV(0), perl()), Ownership::Adopt);
    gv_efullname4(full.handle().sv, gv, nullptr, TRUE);
    return full.handle().text();
}

std::string Sub::source_file() const {
    CV* code = MUTABLE_CV(handle_.sv);
    const char* file = CvFILE(code);
    return file ? std::string(file) : std::string();
}

bool Sub::is_host() const {
    CV* code = MUTABLE_CV(handle_.sv);
    return CvISXSUB(code) && CvXSUB(code) == host_sub_trampoline;
}

std::string Sub::debug_description() const {
    std::string n = name();
    return "Sub(" + (n.empty() ? std::string("__ANON__") : n) + ")";
}

} // namespace pearl
