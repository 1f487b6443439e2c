// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_convert.cpp
 * @brief Checked scalar conversions and container helpers.
 */

#include "pr_perl.hpp"
#include "pr_convert.hpp"
#include <cmath>

namespace pearl {
namespace detail {

namespace {

void require_scalar_payload(const RawSv& sv, const char* target) {
    if (is_undef(sv)) {
        throw ConversionError(std::string("undefined value cannot be converted to ") + target);
    }
    if (sv.is_ref()) {
        throw ConversionError(std::string("reference cannot be converted to ") + target);
    }
}

[[noreturn]] void throw_not_numeric(const RawSv& sv, const char* target) {
    throw ConversionError("'" + sv.text() + "' is not a valid " + target);
}

// Range limits of IV as doubles; the upper bound is exclusive
constexpr double kIvMin = -9223372036854775808.0;
constexpr double kIvLimit = 9223372036854775808.0;
constexpr double kUvLimit = 18446744073709551616.0;

int64_t double_to_int(double d) {
    if (std::isnan(d)) {
        throw ConversionError("NaN cannot be converted to integer");
    }
    double t = std::trunc(d);
    if (t < kIvMin || t >= kIvLimit) {
        throw ConversionError("value " + std::to_string(d) + " is out of range for integer");
    }
    return static_cast<int64_t>(t);
}

uint64_t double_to_uint(double d) {
    if (std::isnan(d)) {
        throw ConversionError("NaN cannot be converted to unsigned integer");
    }
    double t = std::trunc(d);
    if (t < 0.0 || t >= kUvLimit) {
        throw ConversionError("value " + std::to_string(d) + " is out of range for unsigned integer");
    }
    return static_cast<uint64_t>(t);
}

} // anonymous namespace

// ============================================================================
// Checked Conversions
// ============================================================================

bool checked_bool(const RawSv& sv) {
    if (is_undef(sv)) {
        throw ConversionError("undefined value cannot be converted to bool");
    }
    if (sv.is_ref()) {
        return true;
    }
    return sv.truthy();
}

int64_t checked_int(const RawSv& sv) {
    require_scalar_payload(sv, "integer");
    dTHXa(sv.perl);
    SV* s = sv.sv;
    if (SvIOK(s)) {
        if (SvIsUV(s) && SvUVX(s) > static_cast<UV>(IV_MAX)) {
            throw_out_of_range(static_cast<int64_t>(SvUVX(s)), "integer");
        }
        return static_cast<int64_t>(SvIVX(s));
    }
    if (SvNOKp(s)) {
        return double_to_int(static_cast<double>(SvNVX(s)));
    }
    if (SvPOKp(s)) {
        if (!sv.looks_like_number()) {
            throw_not_numeric(sv, "integer");
        }
        (void)SvIV_please_nomg(s);
        if (SvIOK(s) && !SvIsUV(s)) {
            return static_cast<int64_t>(SvIVX(s));
        }
        // Fractions and exponents go through NV so "42.5" truncates
        return double_to_int(static_cast<double>(SvNV_nomg(s)));
    }
    // Fetched magic values may carry only the private flag
    if (SvIOKp(s)) {
        if (SvIsUV(s) && SvUVX(s) > static_cast<UV>(IV_MAX)) {
            throw_out_of_range(static_cast<int64_t>(SvUVX(s)), "integer");
        }
        return static_cast<int64_t>(SvIVX(s));
    }
    throw ConversionError("value cannot be converted to integer");
}

uint64_t checked_uint(const RawSv& sv) {
    require_scalar_payload(sv, "unsigned integer");
    dTHXa(sv.perl);
    SV* s = sv.sv;
    if (SvIOK(s) || (SvIOKp(s) && !SvNOKp(s) && !SvPOKp(s))) {
        if (!SvIsUV(s) && SvIVX(s) < 0) {
            throw ConversionError("value " + std::to_string(SvIVX(s)) +
                                  " is out of range for unsigned integer");
        }
        return static_cast<uint64_t>(SvUVX(s));
    }
    if (SvNOKp(s)) {
        return double_to_uint(static_cast<double>(SvNVX(s)));
    }
    if (SvPOKp(s)) {
        if (!sv.looks_like_number()) {
            throw_not_numeric(sv, "unsigned integer");
        }
        (void)SvIV_please_nomg(s);
        if (SvIOK(s) && (SvIsUV(s) || SvIVX(s) >= 0)) {
            return static_cast<uint64_t>(SvUVX(s));
        }
        return double_to_uint(static_cast<double>(SvNV_nomg(s)));
    }
    throw ConversionError("value cannot be converted to unsigned integer");
}

double checked_double(const RawSv& sv) {
    require_scalar_payload(sv, "double");
    dTHXa(sv.perl);
    SV* s = sv.sv;
    if (SvNOKp(s)) {
        return static_cast<double>(SvNVX(s));
    }
    if (SvIOKp(s) && !SvPOKp(s)) {
        if (SvIsUV(s)) return static_cast<double>(SvUVX(s));
        return static_cast<double>(SvIVX(s));
    }
    if (SvPOKp(s)) {
        if (!sv.looks_like_number()) {
            throw_not_numeric(sv, "double");
        }
        return static_cast<double>(SvNV_nomg(s));
    }
    throw ConversionError("value cannot be converted to double");
}

std::string checked_text(const RawSv& sv) {
    require_scalar_payload(sv, "string");
    return sv.text();
}

bool unchecked_bool(const RawSv& sv) {
    if (sv.is_null()) return false;
    return sv.truthy();
}

[[noreturn]] void throw_out_of_range(int64_t value, const char* type_name) {
    throw ConversionError("value " + std::to_string(value) + " is out of range for " + type_name);
}

// ============================================================================
// Construction Helpers
// ============================================================================

RawSv new_bool(::interpreter* perl, bool value) {
    dTHXa(perl);
    return RawSv(newSVsv(value ? &PL_sv_yes : &PL_sv_no), perl);
}

RawSv resolve_container(const RawSv& sv, ValueKind kind) {
    SvType wanted;
    switch (kind) {
        case ValueKind::Array: wanted = SvType::Array; break;
        case ValueKind::Hash:  wanted = SvType::Hash; break;
        case ValueKind::Sub:   wanted = SvType::Code; break;
        default:
            return sv;
    }
    if (sv.type() == wanted) {
        return sv;
    }
    if (!sv.is_ref()) {
        throw UnexpectedValueType(kind, sv.type());
    }
    RawSv target = sv.referent();
    if (target.type() != wanted) {
        throw UnexpectedValueType(kind, target.type());
    }
    return target;
}

// ============================================================================
// Container Helpers
// ============================================================================

size_t array_size(const RawSv& av) {
    dTHXa(av.perl);
    return static_cast<size_t>(av_top_index(MUTABLE_AV(av.sv)) + 1);
}

bool array_index_in_range(size_t index) {
    return index <= static_cast<size_t>(SSize_t_MAX);
}

RawSv array_element(const RawSv& av, size_t index) {
    if (!array_index_in_range(index)) {
        return RawSv();
    }
    dTHXa(av.perl);
    SV** slot = av_fetch(MUTABLE_AV(av.sv), static_cast<SSize_t>(index), 0);
    if (slot == nullptr || *slot == nullptr) {
        return RawSv();
    }
    return RawSv(*slot, av.perl);
}

void hash_each(const RawSv& hv, const std::function<void(std::string, const RawSv&)>& fn) {
    dTHXa(hv.perl);
    // Tied hashes hand out mortal values
    TmpsScope scope(hv.perl);
    HV* h = MUTABLE_HV(hv.sv);
    hv_iterinit(h);
    HE* entry;
    while ((entry = hv_iternext(h)) != nullptr) {
        I32 klen = 0;
        const char* kdata = hv_iterkey(entry, &klen);
        std::string key = HeUTF8(entry) ? std::string(kdata, static_cast<size_t>(klen))
                                        : latin1_to_utf8(kdata, static_cast<size_t>(klen));
        fn(std::move(key), RawSv(hv_iterval(h, entry), hv.perl));
    }
}

RawSv new_array_ref(::interpreter* perl, SvList elements) {
    dTHXa(perl);
    AV* av = newAV();
    auto owned = elements.release();
    if (!owned.empty()) {
        av_extend(av, static_cast<SSize_t>(owned.size() - 1));
    }
    for (size_t i = 0; i < owned.size(); ++i) {
        // av_store takes over the element's reference
        av_store(av, static_cast<SSize_t>(i), owned[i].sv);
    }
    return RawSv(newRV_noinc(MUTABLE_SV(av)), perl);
}

RawSv new_hash_ref(::interpreter* perl, std::vector<std::string> keys, SvList values) {
    dTHXa(perl);
    HV* hv = newHV();
    auto owned = values.release();
    for (size_t i = 0; i < owned.size(); ++i) {
        const std::string& key = keys[i];
        I32 klen = static_cast<I32>(key.size());
        if (is_utf8_text(key)) klen = -klen;
        if (!hv_store(hv, key.data(), klen, owned[i].sv, 0)) {
            SvREFCNT_dec(owned[i].sv);
        }
    }
    return RawSv(newRV_noinc(MUTABLE_SV(hv)), perl);
}

} // namespace detail
} // namespace pearl
