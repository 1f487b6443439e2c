// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_perl.hpp
 * @brief Private libperl include.
 *
 * The only place perl.h is pulled in. Every function that touches the
 * Perl API declares its interpreter with dTHXa() first, since the build
 * uses PERL_NO_GET_CONTEXT.
 */

#pragma once

// Standard headers go first: perl.h defines macros (die, warn, croak,
// form, ...) that must not leak into them.
#include <array>
#include <atomic>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#define PERL_NO_GET_CONTEXT
#include <EXTERN.h>
#include <perl.h>
#include <XSUB.h>

// Names perl.h defines that clash with C++ headers and with Pearl's own
// member functions (Sub::call_list, RawSv::looks_like_number). The Perl
// functions stay reachable as Perl_call_list and Perl_looks_like_number.
#undef do_open
#undef do_close
#undef call_list
#undef looks_like_number

namespace pearl {

// ENTER/SAVETMPS for the lifetime of the object. Mortals created inside
// (av_delete/hv_delete results, tied element proxies) are freed when it
// goes out of scope, also when a conversion throws.
class TmpsScope {
public:
    explicit TmpsScope(PerlInterpreter* perl) : perl_(perl) {
        dTHXa(perl_);
        ENTER;
        SAVETMPS;
    }

    ~TmpsScope() {
        dTHXa(perl_);
        FREETMPS;
        LEAVE;
    }

    TmpsScope(const TmpsScope&) = delete;
    TmpsScope& operator=(const TmpsScope&) = delete;

private:
    PerlInterpreter* perl_;
};

} // namespace pearl
