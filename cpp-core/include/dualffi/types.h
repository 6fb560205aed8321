/**
 * @file types.h
 * @brief Common C ABI types for the dualffi core.
 * 
 * This header defines the handles, enums and error codes shared by the
 * C entry points in dualffi.h. The C++ API lives in engine.h.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include <cstddef>
#include <cstdint>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Opaque handle to an owned foreign buffer.
 * 
 * Internal layout defined in ffi.cpp; release with dualffi_buffer_free().
 */
typedef struct DualFfiBuffer DualFfiBuffer;

/**
 * @brief Foreign-call engine identifier.
 */
typedef enum {
    DUALFFI_ENGINE_NONE        = 0,  ///< Bootstrap has not succeeded
    DUALFFI_ENGINE_DECLARATIVE = 1,  ///< Pre-declared, compiled type table
    DUALFFI_ENGINE_DYNAMIC     = 2,  ///< libffi, types resolved at call time
} DualFfiEngineKind;

/**
 * @brief Error codes (FFI-safe).
 */
typedef enum {
    DUALFFI_OK                    = 0,
    DUALFFI_ERR_NULL_PTR          = 1,
    DUALFFI_ERR_INVALID_ARGUMENT  = 2,
    DUALFFI_ERR_ALLOC_FAILED      = 3,
    DUALFFI_ERR_BUFFER_TOO_SMALL  = 4,
    DUALFFI_ERR_ENGINE            = 5,
    DUALFFI_ERR_LIBRARY_NOT_FOUND = 6,
} DualFfiError;

#ifdef __cplusplus
}  // extern "C"
#endif
