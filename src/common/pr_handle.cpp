// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_handle.cpp
 * @brief RawSv primitives on top of the libperl API.
 */

#include "pr_perl.hpp"
#include "pr_handle.hpp"

namespace pearl {

std::string latin1_to_utf8(const char* data, size_t len) {
    std::string out;
    out.reserve(len + len / 2);
    for (size_t i = 0; i < len; ++i) {
        auto c = static_cast<unsigned char>(data[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

bool is_utf8_text(std::string_view text) {
    const auto* data = reinterpret_cast<const U8*>(text.data());
    bool high = false;
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) {
            high = true;
            break;
        }
    }
    return high && is_utf8_string(data, text.size());
}

// ============================================================================
// Reference Counting
// ============================================================================

void RawSv::refcnt_inc() const {
    PR_ASSERT(sv != nullptr, "refcnt_inc on null handle");
    SvREFCNT_inc_simple_void_NN(sv);
    PR_DEBUG_RC("inc %p -> %u", static_cast<void*>(sv), static_cast<unsigned>(SvREFCNT(sv)));
}

void RawSv::refcnt_dec() const {
    PR_ASSERT(sv != nullptr, "refcnt_dec on null handle");
    PR_ASSERT(SvREFCNT(sv) > 0, "refcnt_dec on freed SV");
    dTHXa(perl);
    PR_DEBUG_RC("dec %p -> %u", static_cast<void*>(sv), static_cast<unsigned>(SvREFCNT(sv) - 1));
    SvREFCNT_dec_NN(sv);
}

uint32_t RawSv::refcnt() const {
    return static_cast<uint32_t>(SvREFCNT(sv));
}

// ============================================================================
// Tag Inspection
// ============================================================================

SvType RawSv::type() const {
    switch (SvTYPE(sv)) {
        case SVt_NULL:
        case SVt_IV:
        case SVt_NV:
        case SVt_PV:
        case SVt_PVIV:
        case SVt_PVNV:
        case SVt_PVMG:
        case SVt_REGEXP:
        case SVt_PVLV:
            return SvType::Scalar;
        case SVt_PVAV: return SvType::Array;
        case SVt_PVHV: return SvType::Hash;
        case SVt_PVCV: return SvType::Code;
        case SVt_PVGV: return SvType::Glob;
        case SVt_PVIO: return SvType::IO;
        case SVt_PVFM: return SvType::Format;
        default:
            return SvType::Unknown;
    }
}

// Containers, code and globs count as defined values
bool RawSv::defined() const {
    return type() != SvType::Scalar || SvOK(sv);
}

bool RawSv::is_int() const { return SvIOK(sv); }
bool RawSv::is_double() const { return SvNOK(sv); }
bool RawSv::is_string() const { return SvPOK(sv); }
bool RawSv::is_ref() const { return SvROK(sv); }
bool RawSv::is_utf8() const { return SvUTF8(sv); }

bool RawSv::is_object() const {
    return SvROK(sv) && SvOBJECT(SvRV(sv));
}

bool RawSv::looks_like_number() const {
    dTHXa(perl);
    return Perl_looks_like_number(aTHX_ sv) != 0;
}

void RawSv::get_magic() const {
    dTHXa(perl);
    SvGETMAGIC(sv);
}

// ============================================================================
// Native Coercion
// ============================================================================

int64_t RawSv::iv() const {
    dTHXa(perl);
    if (!SvOK(sv)) return 0;
    return static_cast<int64_t>(SvIV_nomg(sv));
}

uint64_t RawSv::uv() const {
    dTHXa(perl);
    if (!SvOK(sv)) return 0;
    return static_cast<uint64_t>(SvUV_nomg(sv));
}

double RawSv::nv() const {
    dTHXa(perl);
    if (!SvOK(sv)) return 0.0;
    return static_cast<double>(SvNV_nomg(sv));
}

bool RawSv::truthy() const {
    dTHXa(perl);
    return SvTRUE_nomg(sv);
}

std::string RawSv::bytes() const {
    dTHXa(perl);
    if (!SvOK(sv)) return std::string();
    STRLEN len = 0;
    const char* data = SvPV_nomg_const(sv, len);
    return std::string(data, len);
}

std::string RawSv::text() const {
    dTHXa(perl);
    if (!SvOK(sv)) return std::string();
    STRLEN len = 0;
    const char* data = SvPV_nomg_const(sv, len);
    // Stringification may set the flag, read it afterwards
    if (SvUTF8(sv)) {
        return std::string(data, len);
    }
    return latin1_to_utf8(data, len);
}

RawSv RawSv::referent() const {
    if (!SvROK(sv)) return RawSv();
    return RawSv(SvRV(sv), perl);
}

std::optional<std::string> RawSv::classname() const {
    if (!is_object()) return std::nullopt;
    HV* stash = SvSTASH(SvRV(sv));
    if (!stash || !HvNAME(stash)) return std::nullopt;
    return std::string(HvNAME(stash), HvNAMELEN(stash));
}

void RawSv::dump() const {
    dTHXa(perl);
    sv_dump(sv);
}

// ============================================================================
// Mutation
// ============================================================================

void RawSv::set_undef() const {
    dTHXa(perl);
    sv_set_undef(sv);
    SvSETMAGIC(sv);
}

void RawSv::set_int(int64_t value) const {
    dTHXa(perl);
    sv_setiv_mg(sv, static_cast<IV>(value));
}

void RawSv::set_uint(uint64_t value) const {
    dTHXa(perl);
    sv_setuv_mg(sv, static_cast<UV>(value));
}

void RawSv::set_double(double value) const {
    dTHXa(perl);
    sv_setnv_mg(sv, static_cast<NV>(value));
}

void RawSv::set_text(std::string_view value) const {
    dTHXa(perl);
    sv_setpvn(sv, value.data(), value.size());
    if (is_utf8_text(value)) {
        SvUTF8_on(sv);
    } else {
        SvUTF8_off(sv);
    }
    SvSETMAGIC(sv);
}

void RawSv::set_sv(const RawSv& source) const {
    dTHXa(perl);
    sv_setsv_mg(sv, source.sv);
}

// ============================================================================
// Construction
// ============================================================================

RawSv RawSv::new_undef(::interpreter* perl) {
    dTHXa(perl);
    return RawSv(newSV(0), perl);
}

RawSv RawSv::new_int(::interpreter* perl, int64_t value) {
    dTHXa(perl);
    return RawSv(newSViv(static_cast<IV>(value)), perl);
}

RawSv RawSv::new_uint(::interpreter* perl, uint64_t value) {
    dTHXa(perl);
    return RawSv(newSVuv(static_cast<UV>(value)), perl);
}

RawSv RawSv::new_double(::interpreter* perl, double value) {
    dTHXa(perl);
    return RawSv(newSVnv(static_cast<NV>(value)), perl);
}

RawSv RawSv::new_text(::interpreter* perl, std::string_view value) {
    dTHXa(perl);
    U32 flags = is_utf8_text(value) ? SVf_UTF8 : 0;
    return RawSv(newSVpvn_flags(value.data(), value.size(), flags), perl);
}

RawSv RawSv::new_copy(const RawSv& source) {
    dTHXa(source.perl);
    return RawSv(newSVsv(source.sv), source.perl);
}

RawSv RawSv::new_ref(const RawSv& target) {
    dTHXa(target.perl);
    return RawSv(newRV_inc(target.sv), target.perl);
}

RawSv RawSv::new_array(::interpreter* perl) {
    dTHXa(perl);
    return RawSv(MUTABLE_SV(newAV()), perl);
}

RawSv RawSv::new_hash(::interpreter* perl) {
    dTHXa(perl);
    return RawSv(MUTABLE_SV(newHV()), perl);
}

} // namespace pearl
