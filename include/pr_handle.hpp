// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_handle.hpp
 * @brief Raw SV handle.
 *
 * RawSv pairs an SV pointer with the interpreter owning it. It does not
 * own a reference: lifetime is governed by the SV's own reference count,
 * and the wrappers in pr_value.hpp balance every increment with exactly
 * one decrement.
 */

#pragma once

#include "pr_core.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pearl {

struct RawSv {
    ::sv* sv{nullptr};
    ::interpreter* perl{nullptr};

    RawSv() = default;
    RawSv(::sv* s, ::interpreter* p) : sv(s), perl(p) {}

    bool is_null() const { return sv == nullptr; }

    // ========== Reference Counting ==========

    void refcnt_inc() const;
    void refcnt_dec() const;
    uint32_t refcnt() const;

    // ========== Tag Inspection ==========

    SvType type() const;
    bool defined() const;
    bool is_int() const;      // Public integer flag
    bool is_double() const;   // Public float flag
    bool is_string() const;   // Public string flag
    bool is_ref() const;
    bool is_utf8() const;
    bool is_object() const;   // Reference to a blessed referent

    // Perl's looks_like_number(): whole string is a numeric literal
    bool looks_like_number() const;

    // Runs get-magic once ($1, tied FETCH). The flag tests above and the
    // coercions below read the fetched value and never trigger it again.
    void get_magic() const;

    // ========== Native Coercion ==========
    // These follow Perl's own rules and never fail.

    int64_t iv() const;
    uint64_t uv() const;
    double nv() const;
    bool truthy() const;
    std::string bytes() const;   // Raw PV bytes, no transcoding
    std::string text() const;    // UTF-8 text, Latin-1 payloads transcoded

    // Target of a reference (borrowed), null handle when not a reference
    RawSv referent() const;

    // Package a referent is blessed into
    std::optional<std::string> classname() const;

    // Dumps the SV to STDERR
    void dump() const;

    // ========== Mutation ==========

    void set_undef() const;
    void set_int(int64_t value) const;
    void set_uint(uint64_t value) const;
    void set_double(double value) const;
    void set_text(std::string_view value) const;
    void set_sv(const RawSv& source) const;

    // ========== Construction ==========
    // Each returns a new SV whose single reference belongs to the caller.

    static RawSv new_undef(::interpreter* perl);
    static RawSv new_int(::interpreter* perl, int64_t value);
    static RawSv new_uint(::interpreter* perl, uint64_t value);
    static RawSv new_double(::interpreter* perl, double value);
    static RawSv new_text(::interpreter* perl, std::string_view value);
    static RawSv new_copy(const RawSv& source);
    static RawSv new_ref(const RawSv& target);
    static RawSv new_array(::interpreter* perl);
    static RawSv new_hash(::interpreter* perl);
};

// Non-ASCII text that is well-formed UTF-8, i.e. text stored with the
// UTF-8 flag. Any other high bytes are stored as octets.
bool is_utf8_text(std::string_view text);

// Latin-1 octets to UTF-8; ASCII passes through unchanged
std::string latin1_to_utf8(const char* data, size_t len);

// ============================================================================
// SvList - owned SV references
// ============================================================================

// Every element holds one reference, given back on destruction unless
// released to a new owner first.
class SvList {
public:
    SvList() = default;
    ~SvList() { clear(); }

    SvList(const SvList&) = delete;
    SvList& operator=(const SvList&) = delete;

    SvList(SvList&& other) noexcept : items_(std::move(other.items_)) {
        other.items_.clear();
    }

    SvList& operator=(SvList&& other) noexcept {
        if (this != &other) {
            clear();
            items_ = std::move(other.items_);
            other.items_.clear();
        }
        return *this;
    }

    void push_back(RawSv owned) { items_.push_back(owned); }
    void reserve(size_t n) { items_.reserve(n); }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const RawSv& operator[](size_t index) const { return items_[index]; }

    // Hands every reference over; the list is left empty
    std::vector<RawSv> release() {
        std::vector<RawSv> out = std::move(items_);
        items_.clear();
        return out;
    }

    void clear() {
        for (auto& item : items_) {
            if (!item.is_null()) item.refcnt_dec();
        }
        items_.clear();
    }

private:
    std::vector<RawSv> items_;
};

} // namespace pearl
