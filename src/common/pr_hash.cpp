// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_hash.cpp
 * @brief HV proxy on top of hv_fetch/hv_store/hv_delete.
 */

#include "pr_perl.hpp"
#include "pr_hash.hpp"

namespace pearl {

namespace {

// hv_* take a negative length for UTF-8 keys
I32 key_length(std::string_view key) {
    I32 len = static_cast<I32>(key.size());
    return is_utf8_text(key) ? -len : len;
}

} // anonymous namespace

Hash::Hash(RawSv handle, Ownership ownership)
    : Value(check_type(handle, SvType::Hash, ValueKind::Hash), ownership) {}

Hash::Hash(const Scalar& ref)
    : Value(detail::resolve_container(ref.handle(), ValueKind::Hash), Ownership::Retain) {}

Hash::Hash(Interpreter& interp)
    : Value(RawSv::new_hash(interpreter_handle(interp)), Ownership::Adopt) {}

RawSv Hash::slot(std::string_view key) const {
    dTHXa(perl());
    SV** value = hv_fetch(MUTABLE_HV(handle_.sv), key.data(), key_length(key), 0);
    if (value == nullptr || *value == nullptr) {
        return RawSv();
    }
    return RawSv(*value, perl());
}

std::optional<Scalar> Hash::fetch(std::string_view key) const {
    RawSv value = slot(key);
    if (value.is_null()) {
        return std::nullopt;
    }
    return Scalar(value, Ownership::Retain);
}

void Hash::store_owned(std::string_view key, RawSv owned) {
    dTHXa(perl());
    if (!hv_store(MUTABLE_HV(handle_.sv), key.data(), key_length(key), owned.sv, 0)) {
        owned.refcnt_dec();
        throw PerlError("Unable to store hash element '" + std::string(key) + "'");
    }
}

std::optional<Scalar> Hash::remove(std::string_view key) {
    dTHXa(perl());
    // The returned SV is mortal; our reference is taken before it is freed
    TmpsScope scope(perl());
    SV* prior = hv_delete(MUTABLE_HV(handle_.sv), key.data(), key_length(key), 0);
    if (prior == nullptr) {
        return std::nullopt;
    }
    return Scalar(RawSv(prior, perl()), Ownership::Retain);
}

bool Hash::exists(std::string_view key) const {
    dTHXa(perl());
    return hv_exists(MUTABLE_HV(handle_.sv), key.data(), key_length(key));
}

std::vector<std::string> Hash::keys() const {
    std::vector<std::string> out;
    detail::hash_each(handle_, [&out](std::string key, const RawSv&) {
        out.push_back(std::move(key));
    });
    return out;
}

size_t Hash::size() const {
    dTHXa(perl());
    return static_cast<size_t>(hv_iterinit(MUTABLE_HV(handle_.sv)));
}

void Hash::clear() {
    dTHXa(perl());
    hv_clear(MUTABLE_HV(handle_.sv));
}

std::string Hash::debug_description() const {
    return "Hash(" + std::to_string(size()) + ")";
}

} // namespace pearl
