// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_object.cpp
 * @brief Blessed reference wrapper and class registry.
 */

#include "pr_object.hpp"

namespace pearl {

// ============================================================================
// Object Implementation
// ============================================================================

const RawSv& Object::check_blessed(const RawSv& handle) {
    check_type(handle, SvType::Scalar, ValueKind::Object);
    if (!handle.is_object()) {
        throw UnexpectedValueType(ValueKind::Object,
                                  handle.is_ref() ? "unblessed reference" : "plain scalar");
    }
    return handle;
}

Object::Object(RawSv handle, Ownership ownership)
    : Scalar(check_blessed(handle), ownership) {}

Object::Object(const Scalar& scalar)
    : Scalar(check_blessed(scalar.handle()), Ownership::Retain) {}

std::string Object::perl_class() const {
    return classname().value_or(std::string());
}

std::string Object::debug_description() const {
    return "Object(" + perl_class() + ")";
}

// ============================================================================
// ObjectRegistry Implementation
// ============================================================================

ObjectRegistry& ObjectRegistry::instance() {
    static ObjectRegistry instance;
    return instance;
}

void ObjectRegistry::register_factory(const std::string& perl_class, ObjectFactory factory) {
    factories_[perl_class] = std::move(factory);
}

const ObjectFactory* ObjectRegistry::find(const std::string& perl_class) const {
    auto it = factories_.find(perl_class);
    if (it != factories_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool ObjectRegistry::has(const std::string& perl_class) const {
    return factories_.find(perl_class) != factories_.end();
}

void ObjectRegistry::unregister(const std::string& perl_class) {
    factories_.erase(perl_class);
}

std::unique_ptr<Object> ObjectRegistry::create(RawSv handle, Ownership ownership) const {
    std::optional<std::string> cls = handle.classname();
    if (cls) {
        if (const ObjectFactory* factory = find(*cls)) {
            return (*factory)(handle, ownership);
        }
    }
    return std::make_unique<Object>(handle, ownership);
}

void ObjectRegistry::clear() {
    factories_.clear();
}

std::vector<std::string> ObjectRegistry::class_names() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        names.push_back(name);
    }
    return names;
}

} // namespace pearl
