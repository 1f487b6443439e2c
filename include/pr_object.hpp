// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_object.hpp
 * @brief Blessed references and the Perl class registry.
 *
 * Object is a Scalar holding a reference to a blessed referent. C++
 * classes mirroring a Perl package derive from Object, name the package in
 * `perl_class_name` and are registered with ObjectRegistry; from then on
 * Value::init_derived builds them for references blessed into that
 * package.
 */

#pragma once

#include "pr_sub.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pearl {

class Object : public Scalar {
public:
    static constexpr ValueKind static_kind = ValueKind::Object;

    // Throws UnexpectedValueType unless the handle is a blessed reference
    Object(RawSv handle, Ownership ownership);

    // Rewraps a scalar holding a blessed reference
    explicit Object(const Scalar& scalar);

    ValueKind kind() const override { return ValueKind::Object; }

    // Package the referent is blessed into
    std::string perl_class() const;

    // $obj->method(args...); the context follows R as in Sub::call
    template<typename R = void, typename... Args>
    R invoke(const std::string& method, const Args&... args) const {
        SvList results = detail::invoke_method(perl(), method,
                                               detail::pack_args(perl(), *this, args...),
                                               call_context_for<R>());
        return detail::unpack_result<R>(results);
    }

    template<typename... Args>
    std::vector<Scalar> invoke_list(const std::string& method, const Args&... args) const {
        return detail::adopt_list(detail::invoke_method(perl(), method,
                                                        detail::pack_args(perl(), *this, args...),
                                                        CallContext::List));
    }

    // Class->method(args...)
    template<typename R = void, typename... Args>
    static R invoke_static(Interpreter& interp, const std::string& perl_class,
                           const std::string& method, const Args&... args) {
        ::interpreter* perl = interpreter_handle(interp);
        SvList results = detail::invoke_method(perl, method,
                                               detail::pack_args(perl, perl_class, args...),
                                               call_context_for<R>());
        return detail::unpack_result<R>(results);
    }

    std::string debug_description() const override;

private:
    static const RawSv& check_blessed(const RawSv& handle);
};

// ============================================================================
// Object Registry (Singleton)
// ============================================================================

// Builds the wrapper for one blessed reference
using ObjectFactory = std::function<std::unique_ptr<Object>(RawSv, Ownership)>;

class ObjectRegistry {
public:
    // Get the singleton instance
    static ObjectRegistry& instance();

    // ========== Class Registration ==========

    void register_factory(const std::string& perl_class, ObjectFactory factory);

    // Registers T under T::perl_class_name
    template<typename T>
    void register_class() {
        static_assert(std::is_base_of_v<Object, T>, "Registered classes must derive from Object");
        register_factory(T::perl_class_name, [](RawSv handle, Ownership ownership) {
            return std::unique_ptr<Object>(new T(handle, ownership));
        });
    }

    // Find a registered factory (returns nullptr if not found)
    const ObjectFactory* find(const std::string& perl_class) const;

    bool has(const std::string& perl_class) const;

    void unregister(const std::string& perl_class);

    // ========== Construction ==========

    // Registered wrapper for the handle's class, a plain Object otherwise
    std::unique_ptr<Object> create(RawSv handle, Ownership ownership) const;

    // ========== Utility ==========

    // Clear all registrations
    void clear();

    std::vector<std::string> class_names() const;
    size_t class_count() const { return factories_.size(); }

private:
    // Private constructor for singleton
    ObjectRegistry() = default;

    // Prevent copying
    ObjectRegistry(const ObjectRegistry&) = delete;
    ObjectRegistry& operator=(const ObjectRegistry&) = delete;

    std::unordered_map<std::string, ObjectFactory> factories_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define PR_REGISTER_CLASS(T) \
    pearl::ObjectRegistry::instance().register_class<T>()

} // namespace pearl
