// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_embed.h
 * @brief Pearl Embedding API.
 *
 * C API for embedding a Perl interpreter into hosts that only speak C
 * (plugin systems, other languages' FFI).
 *
 * Usage:
 *   1. pr_create_context()    - Create an interpreter context
 *   2. pr_register_function() - Expose host functions as Perl subs
 *   3. pr_eval()              - Run Perl source
 *   4. pr_call_function()     - Call Perl subs by name
 *   5. pr_destroy_context()   - Clean up
 */

#ifndef PR_EMBED_H
#define PR_EMBED_H

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Platform / Export Macros
 * ============================================================================ */

#ifdef __cplusplus
#define PR_EXTERN_C extern "C"
#else
#define PR_EXTERN_C
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define PR_API PR_EXTERN_C __attribute__((visibility("default")))
#else
    #define PR_API PR_EXTERN_C
#endif

/* ============================================================================
 * Opaque Handle Types
 * ============================================================================ */

/** Opaque handle to a Pearl context (one Perl interpreter) */
typedef struct PRContext_* PRContext;

/* ============================================================================
 * Value Types
 * ============================================================================ */

/** Perl value type tags */
typedef enum PRValueType {
    PR_TYPE_UNDEF  = 0,
    PR_TYPE_INT    = 1,
    PR_TYPE_FLOAT  = 2,
    PR_TYPE_STRING = 3,
    PR_TYPE_REF    = 4
} PRValueType;

/** String length meaning "NUL-terminated" */
#define PR_NPOS ((size_t)-1)

/** Perl value - POD type for FFI safety */
typedef struct PRValue {
    PRValueType type;
    union {
        int64_t     int_val;
        double      float_val;
        struct {
            const char* data;     /* UTF-8, may contain NUL bytes */
            size_t      length;   /* PR_NPOS for NUL-terminated input */
        } string_val;
        void*       ref_ptr;      /* Opaque reference, see pr_release_ref() */
    } data;
} PRValue;

/* Value construction helpers */
#define PR_UNDEF()          ((PRValue){ PR_TYPE_UNDEF,  {.int_val = 0}                })
#define PR_INT(i)           ((PRValue){ PR_TYPE_INT,    {.int_val = (i)}              })
#define PR_FLOAT(f)         ((PRValue){ PR_TYPE_FLOAT,  {.float_val = (f)}            })
#define PR_STRING(s)        ((PRValue){ PR_TYPE_STRING, {.string_val = {(s), PR_NPOS}} })
#define PR_STRING_N(s, n)   ((PRValue){ PR_TYPE_STRING, {.string_val = {(s), (n)}}    })

/* ============================================================================
 * Error Codes
 * ============================================================================ */

typedef enum PRResult {
    PR_OK                  = 0,
    PR_ERROR_STARTUP       = 1,   /* Interpreter failed to start */
    PR_ERROR_RUNTIME       = 2,   /* Perl died; message in pr_get_last_error() */
    PR_ERROR_INVALID_ARG   = 3,   /* Invalid argument passed */
    PR_ERROR_NOT_FOUND     = 4,   /* Sub/variable not found */
    PR_ERROR_OUT_OF_MEMORY = 5,   /* Memory allocation failed */
    PR_ERROR_CONVERSION    = 6    /* Value could not be converted */
} PRResult;

/* ============================================================================
 * Callback Types
 * ============================================================================ */

/**
 * Native function callback type.
 *
 * String arguments are valid only during the callback. Strings stored in
 * out_result are copied before the callback returns to Perl.
 *
 * @param context    The calling context
 * @param args       Arguments passed from Perl (@_)
 * @param arg_count  Number of arguments
 * @param out_result Pointer to store the return value (preset to undef)
 * @return PR_OK on success; any other code makes the Perl call die
 */
typedef PRResult (*PRNativeFunc)(PRContext context,
                                 const PRValue* args,
                                 int arg_count,
                                 PRValue* out_result);

/**
 * Error callback type.
 *
 * @param context    The calling context
 * @param error_code The error code
 * @param message    Human-readable error description ($@ for Perl dies)
 * @param user_data  User-provided data pointer
 */
typedef void (*PRErrorFunc)(PRContext context,
                            PRResult error_code,
                            const char* message,
                            void* user_data);

/* ============================================================================
 * Context Lifecycle
 * ============================================================================ */

/**
 * Create a new context with its own Perl interpreter.
 * Each context must be used from the thread that created it.
 *
 * @return New context handle, or NULL on failure
 */
PR_API PRContext pr_create_context(void);

/**
 * Create a context with custom configuration.
 *
 * @param include_paths   Directories prepended to @INC (can be NULL)
 * @param path_count      Number of entries in include_paths
 * @param enable_warnings Run with -w (0 = off, 1 = on)
 * @return New context handle, or NULL on failure
 */
PR_API PRContext pr_create_context_ex(const char* const* include_paths,
                                      int path_count,
                                      int enable_warnings);

/**
 * Destroy a context, its interpreter and every outstanding reference.
 *
 * @param context Context to destroy
 */
PR_API void pr_destroy_context(PRContext context);

/* ============================================================================
 * Execution
 * ============================================================================ */

/**
 * Evaluate Perl source in scalar context.
 *
 * @param context    The context
 * @param source     Source code (UTF-8, NUL-terminated)
 * @param out_result Optional: receives the value of the last statement
 * @return PR_OK on success, PR_ERROR_RUNTIME if the code died
 */
PR_API PRResult pr_eval(PRContext context,
                        const char* source,
                        PRValue* out_result);

/**
 * Call a Perl sub by name in scalar context.
 *
 * @param context    The context
 * @param func_name  Sub name, package-qualified or in main::
 * @param args       Array of arguments
 * @param arg_count  Number of arguments
 * @param out_result Optional: receives the return value
 * @return PR_OK on success, PR_ERROR_NOT_FOUND if the sub does not exist
 */
PR_API PRResult pr_call_function(PRContext context,
                                 const char* func_name,
                                 const PRValue* args,
                                 int arg_count,
                                 PRValue* out_result);

/* ============================================================================
 * Native Function Registration
 * ============================================================================ */

/**
 * Install a native C function as a Perl sub.
 *
 * @param context   The context
 * @param perl_name Sub name visible in Perl
 * @param func      Native function callback
 * @return PR_OK on success
 *
 * Example (C):
 *   PRResult my_add(PRContext ctx, const PRValue* args, int argc, PRValue* result) {
 *       if (argc != 2) return PR_ERROR_INVALID_ARG;
 *       *result = PR_INT(args[0].data.int_val + args[1].data.int_val);
 *       return PR_OK;
 *   }
 *   pr_register_function(ctx, "native_add", my_add);
 *
 * Perl usage:
 *   my $sum = native_add(3, 4);  # 7
 */
PR_API PRResult pr_register_function(PRContext context,
                                     const char* perl_name,
                                     PRNativeFunc func);

/* ============================================================================
 * Global Variables
 * ============================================================================ */

/**
 * Assign a package scalar ($name), creating it when missing.
 *
 * @param context The context
 * @param name    Variable name without sigil
 * @param value   Value to set
 * @return PR_OK on success
 */
PR_API PRResult pr_set_global(PRContext context,
                              const char* name,
                              PRValue value);

/**
 * Read a package scalar ($name).
 *
 * @param context   The context
 * @param name      Variable name without sigil
 * @param out_value Receives the value
 * @return PR_OK on success, PR_ERROR_NOT_FOUND if not defined
 */
PR_API PRResult pr_get_global(PRContext context,
                              const char* name,
                              PRValue* out_value);

/**
 * Drop a PR_TYPE_REF value handed out by this context.
 * Outstanding references are dropped by pr_destroy_context() otherwise.
 *
 * @param context The context
 * @param ref_ptr data.ref_ptr of the value
 * @return PR_OK on success, PR_ERROR_NOT_FOUND if unknown
 */
PR_API PRResult pr_release_ref(PRContext context, void* ref_ptr);

/* ============================================================================
 * Callbacks
 * ============================================================================ */

/**
 * Set a callback for error handling.
 *
 * @param context   The context
 * @param func      Error callback function (NULL to disable)
 * @param user_data Arbitrary pointer passed to the callback
 */
PR_API void pr_set_error_callback(PRContext context,
                                  PRErrorFunc func,
                                  void* user_data);

/* ============================================================================
 * Error Information
 * ============================================================================ */

/**
 * Get the last error message for the context.
 * The returned string is valid until the next API call on this context.
 *
 * @param context The context
 * @return Error message string, or empty string if no error
 */
PR_API const char* pr_get_last_error(PRContext context);

/**
 * Set the error message a failing PRNativeFunc dies with.
 * Call before returning a code other than PR_OK from the callback.
 *
 * @param context The context
 * @param message Message for $@
 */
PR_API void pr_set_error(PRContext context, const char* message);

/* ============================================================================
 * User Data
 * ============================================================================ */

PR_API void pr_set_user_data(PRContext context, void* user_data);
PR_API void* pr_get_user_data(PRContext context);

/* ============================================================================
 * Version Information
 * ============================================================================ */

/** Get Pearl version string (e.g., "1.0.0") */
PR_API const char* pr_version(void);

/** Get Pearl version components */
PR_API void pr_version_numbers(int* major, int* minor, int* patch);

#endif /* PR_EMBED_H */
