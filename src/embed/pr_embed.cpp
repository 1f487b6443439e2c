// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_embed.cpp
 * @brief C embedding API on top of pearl::Interpreter.
 */

#include "pr_embed.h"

#include <cstring>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pr_interpreter.hpp"

using namespace pearl;

/* ============================================================================
 * Version
 * ============================================================================ */

static constexpr int PR_VERSION_MAJOR = 1;
static constexpr int PR_VERSION_MINOR = 0;
static constexpr int PR_VERSION_PATCH = 0;
static const char* PR_VERSION_STRING = "1.0.0";

/* ============================================================================
 * Internal Context Structure
 * ============================================================================ */

struct PRContext_ {
    std::unique_ptr<Interpreter> interp;

    // Callbacks
    PRErrorFunc error_callback{ nullptr };
    void* error_user_data{ nullptr };

    // User data
    void* user_data{ nullptr };

    // Error state
    std::string last_error;

    // Backing store for string results, valid until the next API call
    std::string result_buffer;

    // References handed out as PR_TYPE_REF, keyed by ref_ptr
    std::unordered_map<void*, std::unique_ptr<Scalar>> refs;

    // Registered native functions (name -> Perl sub)
    std::unordered_map<std::string, std::unique_ptr<Sub>> registered_functions;

    void set_error(PRResult code, const std::string& msg) {
        last_error = msg;
        if (error_callback) {
            error_callback(this, code, msg.c_str(), error_user_data);
        }
    }

    void clear_error() {
        last_error.clear();
    }

    ~PRContext_() {
        // Wrappers go before their interpreter
        refs.clear();
        registered_functions.clear();
        interp.reset();
    }
};

/* ============================================================================
 * Value Conversion Helpers
 * ============================================================================ */

static Scalar prvalue_to_internal(PRContext ctx, const PRValue& val) {
    Interpreter& interp = *ctx->interp;
    switch (val.type) {
        case PR_TYPE_UNDEF:
            return Scalar(interp);
        case PR_TYPE_INT:
            return Scalar(interp, val.data.int_val);
        case PR_TYPE_FLOAT:
            return Scalar(interp, val.data.float_val);
        case PR_TYPE_STRING: {
            const char* data = val.data.string_val.data;
            if (!data) return Scalar(interp);
            size_t length = val.data.string_val.length;
            if (length == PR_NPOS) length = std::strlen(data);
            return Scalar(interp, std::string_view(data, length));
        }
        case PR_TYPE_REF: {
            auto it = ctx->refs.find(val.data.ref_ptr);
            if (it == ctx->refs.end()) {
                throw ConversionError("unknown reference handle");
            }
            return *it->second;
        }
    }
    return Scalar(interp);
}

// Strings land in `storage`, which must outlive the returned value
static PRValue internal_to_prvalue(PRContext ctx, const Scalar& val, std::string& storage) {
    PRValue result;
    result.data.int_val = 0; // Zero initialize

    if (!val.defined()) {
        result.type = PR_TYPE_UNDEF;
    }
    else if (val.is_ref()) {
        auto ref = std::make_unique<Scalar>(val);
        void* key = ref.get();
        ctx->refs.emplace(key, std::move(ref));
        result.type = PR_TYPE_REF;
        result.data.ref_ptr = key;
    }
    else if (val.is_int()) {
        result.type = PR_TYPE_INT;
        result.data.int_val = val.unchecked_as<int64_t>();
    }
    else if (val.is_double()) {
        result.type = PR_TYPE_FLOAT;
        result.data.float_val = val.unchecked_as<double>();
    }
    else {
        result.type = PR_TYPE_STRING;
        storage = val.unchecked_as<std::string>();
        result.data.string_val.data = storage.c_str();
        result.data.string_val.length = storage.size();
    }

    return result;
}

static PRResult error_code_for(const PerlError& e) {
    if (dynamic_cast<const ConversionError*>(&e) || dynamic_cast<const UnexpectedValueType*>(&e)) {
        return PR_ERROR_CONVERSION;
    }
    if (dynamic_cast<const NoArgumentOnStack*>(&e)) {
        return PR_ERROR_INVALID_ARG;
    }
    return PR_ERROR_RUNTIME;
}

/* ============================================================================
 * Native Function Bridge
 * ============================================================================ */

/**
 * Installs a Perl sub that converts @_ to PRValues, calls the user's
 * PRNativeFunc and converts its result back. A failing callback makes the
 * Perl call die with the context's last error.
 */
static std::unique_ptr<Sub> make_bridge_function(PRContext ctx, const std::string& name, PRNativeFunc func) {
    return std::make_unique<Sub>(*ctx->interp, name,
        [ctx, func, name](Arguments& args) -> Scalar {
            // One buffer per string argument, stable while the callback runs
            std::deque<std::string> strings;
            std::vector<PRValue> pr_args(args.size());
            for (size_t i = 0; i < args.size(); ++i) {
                strings.emplace_back();
                pr_args[i] = internal_to_prvalue(ctx, args[i], strings.back());
            }

            PRValue result_val;
            result_val.type = PR_TYPE_UNDEF;
            result_val.data.int_val = 0;

            ctx->clear_error();
            PRResult rc = func(ctx, pr_args.data(), static_cast<int>(pr_args.size()), &result_val);
            if (rc != PR_OK) {
                std::string msg = ctx->last_error.empty()
                    ? "Native function '" + name + "' failed with code " + std::to_string(rc)
                    : ctx->last_error;
                throw PerlError(msg);
            }
            return prvalue_to_internal(ctx, result_val);
        });
}

/* ============================================================================
 * Context Lifecycle Implementation
 * ============================================================================ */

PR_API PRContext pr_create_context(void) {
    return pr_create_context_ex(nullptr, 0, 0);
}

PR_API PRContext pr_create_context_ex(const char* const* include_paths,
                                      int path_count,
                                      int enable_warnings) {
    InterpreterConfig config;
    config.enable_warnings = enable_warnings != 0;
    for (int i = 0; include_paths && i < path_count; ++i) {
        if (include_paths[i]) config.include_paths.emplace_back(include_paths[i]);
    }

    try {
        auto ctx = std::make_unique<PRContext_>();
        ctx->interp = std::make_unique<Interpreter>(std::move(config));
        return ctx.release();
    }
    catch (const std::exception&) {
        return nullptr;
    }
}

PR_API void pr_destroy_context(PRContext context) {
    delete context;
}

/* ============================================================================
 * Execution Implementation
 * ============================================================================ */

PR_API PRResult pr_eval(PRContext context,
                        const char* source,
                        PRValue* out_result) {
    if (!context || !source) return PR_ERROR_INVALID_ARG;
    context->clear_error();

    try {
        Scalar result = context->interp->eval(source);
        if (out_result) {
            *out_result = internal_to_prvalue(context, result, context->result_buffer);
        }
        return PR_OK;
    }
    catch (const PerlError& e) {
        PRResult code = error_code_for(e);
        context->set_error(code, e.what());
        return code;
    }
    catch (const std::bad_alloc&) {
        context->set_error(PR_ERROR_OUT_OF_MEMORY, "Out of memory");
        return PR_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::exception& e) {
        context->set_error(PR_ERROR_RUNTIME, e.what());
        return PR_ERROR_RUNTIME;
    }
}

PR_API PRResult pr_call_function(PRContext context,
                                 const char* func_name,
                                 const PRValue* args,
                                 int arg_count,
                                 PRValue* out_result) {
    if (!context || !func_name || (arg_count > 0 && !args)) return PR_ERROR_INVALID_ARG;
    context->clear_error();

    try {
        std::optional<Sub> sub = context->interp->find_sub(func_name);
        if (!sub) {
            context->set_error(PR_ERROR_NOT_FOUND,
                               std::string("Function not found: ") + func_name);
            return PR_ERROR_NOT_FOUND;
        }

        SvList packed;
        packed.reserve(static_cast<size_t>(arg_count));
        for (int i = 0; i < arg_count; ++i) {
            Scalar arg = prvalue_to_internal(context, args[i]);
            packed.push_back(RawSv::new_copy(arg.handle()));
        }

        std::vector<Scalar> results = detail::adopt_list(
            detail::invoke_sv(sub->handle(), std::move(packed), CallContext::Scalar));

        if (out_result) {
            if (results.empty()) {
                *out_result = PRValue{};
                out_result->type = PR_TYPE_UNDEF;
            } else {
                *out_result = internal_to_prvalue(context, results[0], context->result_buffer);
            }
        }
        return PR_OK;
    }
    catch (const PerlError& e) {
        PRResult code = error_code_for(e);
        context->set_error(code, e.what());
        return code;
    }
    catch (const std::bad_alloc&) {
        context->set_error(PR_ERROR_OUT_OF_MEMORY, "Out of memory");
        return PR_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::exception& e) {
        context->set_error(PR_ERROR_RUNTIME, e.what());
        return PR_ERROR_RUNTIME;
    }
}

/* ============================================================================
 * Native Function Registration Implementation
 * ============================================================================ */

PR_API PRResult pr_register_function(PRContext context,
                                     const char* perl_name,
                                     PRNativeFunc func) {
    if (!context || !perl_name || !*perl_name || !func) return PR_ERROR_INVALID_ARG;
    context->clear_error();

    try {
        std::string name(perl_name);
        context->registered_functions[name] = make_bridge_function(context, name, func);
        return PR_OK;
    }
    catch (const std::exception& e) {
        context->set_error(PR_ERROR_RUNTIME, e.what());
        return PR_ERROR_RUNTIME;
    }
}

/* ============================================================================
 * Global Variables Implementation
 * ============================================================================ */

PR_API PRResult pr_set_global(PRContext context,
                              const char* name,
                              PRValue value) {
    if (!context || !name) return PR_ERROR_INVALID_ARG;
    context->clear_error();

    try {
        Scalar internal_val = prvalue_to_internal(context, value);
        context->interp->global_scalar(name).set(internal_val);
        return PR_OK;
    }
    catch (const PerlError& e) {
        PRResult code = error_code_for(e);
        context->set_error(code, e.what());
        return code;
    }
    catch (const std::bad_alloc&) {
        context->set_error(PR_ERROR_OUT_OF_MEMORY, "Out of memory");
        return PR_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::exception& e) {
        context->set_error(PR_ERROR_RUNTIME, e.what());
        return PR_ERROR_RUNTIME;
    }
}

PR_API PRResult pr_get_global(PRContext context,
                              const char* name,
                              PRValue* out_value) {
    if (!context || !name || !out_value) return PR_ERROR_INVALID_ARG;
    context->clear_error();

    try {
        std::optional<Scalar> val = context->interp->find_scalar(name);
        if (!val) {
            return PR_ERROR_NOT_FOUND;
        }
        *out_value = internal_to_prvalue(context, *val, context->result_buffer);
        return PR_OK;
    }
    catch (const PerlError& e) {
        PRResult code = error_code_for(e);
        context->set_error(code, e.what());
        return code;
    }
    catch (const std::bad_alloc&) {
        context->set_error(PR_ERROR_OUT_OF_MEMORY, "Out of memory");
        return PR_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::exception& e) {
        context->set_error(PR_ERROR_RUNTIME, e.what());
        return PR_ERROR_RUNTIME;
    }
}

PR_API PRResult pr_release_ref(PRContext context, void* ref_ptr) {
    if (!context || !ref_ptr) return PR_ERROR_INVALID_ARG;
    auto it = context->refs.find(ref_ptr);
    if (it == context->refs.end()) {
        return PR_ERROR_NOT_FOUND;
    }
    context->refs.erase(it);
    return PR_OK;
}

/* ============================================================================
 * Callbacks Implementation
 * ============================================================================ */

PR_API void pr_set_error_callback(PRContext context,
                                  PRErrorFunc func,
                                  void* user_data) {
    if (!context) return;
    context->error_callback = func;
    context->error_user_data = user_data;
}

/* ============================================================================
 * Error Information Implementation
 * ============================================================================ */

PR_API const char* pr_get_last_error(PRContext context) {
    if (!context) return "";
    return context->last_error.c_str();
}

PR_API void pr_set_error(PRContext context, const char* message) {
    if (!context) return;
    context->last_error = message ? message : "";
}

/* ============================================================================
 * User Data Implementation
 * ============================================================================ */

PR_API void pr_set_user_data(PRContext context, void* user_data) {
    if (!context) return;
    context->user_data = user_data;
}

PR_API void* pr_get_user_data(PRContext context) {
    if (!context) return nullptr;
    return context->user_data;
}

/* ============================================================================
 * Version Implementation
 * ============================================================================ */

PR_API const char* pr_version(void) {
    return PR_VERSION_STRING;
}

PR_API void pr_version_numbers(int* major, int* minor, int* patch) {
    if (major) *major = PR_VERSION_MAJOR;
    if (minor) *minor = PR_VERSION_MINOR;
    if (patch) *patch = PR_VERSION_PATCH;
}
