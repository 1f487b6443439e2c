// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_array.cpp
 * @brief AV proxy on top of av_fetch/av_store/av_delete.
 */

#include "pr_perl.hpp"
#include "pr_array.hpp"

namespace pearl {

Array::Array(RawSv handle, Ownership ownership)
    : Value(check_type(handle, SvType::Array, ValueKind::Array), ownership) {}

Array::Array(const Scalar& ref)
    : Value(detail::resolve_container(ref.handle(), ValueKind::Array), Ownership::Retain) {}

Array::Array(Interpreter& interp)
    : Value(RawSv::new_array(interpreter_handle(interp)), Ownership::Adopt) {}

size_t Array::size() const {
    return detail::array_size(handle_);
}

RawSv Array::slot(size_t index) const {
    return detail::array_element(handle_, index);
}

std::optional<Scalar> Array::fetch(size_t index) const {
    RawSv element = slot(index);
    if (element.is_null()) {
        return std::nullopt;
    }
    element.get_magic();
    if (!element.defined()) {
        return std::nullopt;
    }
    return Scalar(element, Ownership::Retain);
}

Scalar Array::operator[](size_t index) const {
    RawSv element = slot(index);
    if (element.is_null()) {
        return Scalar(RawSv::new_undef(perl()), Ownership::Adopt);
    }
    return Scalar(element, Ownership::Retain);
}

void Array::store_owned(size_t index, RawSv owned) {
    if (!detail::array_index_in_range(index)) {
        owned.refcnt_dec();
        throw PerlError("Array index " + std::to_string(index) + " is out of range");
    }
    dTHXa(perl());
    AV* av = MUTABLE_AV(handle_.sv);
    if (!av_store(av, static_cast<SSize_t>(index), owned.sv)) {
        // Tied or read-only array: the reference was not taken
        owned.refcnt_dec();
        throw PerlError("Unable to store array element " + std::to_string(index));
    }
}

std::optional<Scalar> Array::remove(size_t index) {
    if (!detail::array_index_in_range(index)) {
        return std::nullopt;
    }
    dTHXa(perl());
    // av_delete hands back a mortal: take our reference before the scope
    // frees it, so the wrapper ends up as the only owner
    TmpsScope scope(perl());
    SV* prior = av_delete(MUTABLE_AV(handle_.sv), static_cast<SSize_t>(index), 0);
    if (prior == nullptr) {
        return std::nullopt;
    }
    RawSv removed(prior, perl());
    removed.get_magic();
    if (!removed.defined()) {
        return std::nullopt;
    }
    return Scalar(removed, Ownership::Retain);
}

bool Array::exists(size_t index) const {
    if (!detail::array_index_in_range(index)) {
        return false;
    }
    dTHXa(perl());
    return av_exists(MUTABLE_AV(handle_.sv), static_cast<SSize_t>(index));
}

void Array::push_owned(RawSv owned) {
    dTHXa(perl());
    av_push(MUTABLE_AV(handle_.sv), owned.sv);
}

std::optional<Scalar> Array::pop() {
    dTHXa(perl());
    if (size() == 0) {
        return std::nullopt;
    }
    // av_pop transfers its reference to us, except for a hole, where it
    // returns the immortal undef without one
    SV* last = av_pop(MUTABLE_AV(handle_.sv));
    if (last == &PL_sv_undef) {
        return Scalar(RawSv::new_undef(perl()), Ownership::Adopt);
    }
    return Scalar(RawSv(last, perl()), Ownership::Adopt);
}

void Array::clear() {
    dTHXa(perl());
    av_clear(MUTABLE_AV(handle_.sv));
}

std::string Array::debug_description() const {
    return "Array(" + std::to_string(size()) + ")";
}

} // namespace pearl
