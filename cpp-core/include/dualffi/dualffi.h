/**
 * @file dualffi.h
 * @brief C entry points over the process-wide engine.
 * 
 * Lets C callers (and other language runtimes) allocate foreign buffers
 * and query the active engine without the C++ API.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include "dualffi/types.h"

#include <wchar.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Select the process-wide engine now rather than on first use.
 * 
 * @return DUALFFI_OK, or DUALFFI_ERR_ENGINE if no engine can start.
 */
DualFfiError dualffi_init(void) noexcept;

/**
 * @brief Check that the shared library at `path` can be loaded.
 * 
 * The library is closed again before returning.
 * 
 * @return DUALFFI_OK, DUALFFI_ERR_NULL_PTR or DUALFFI_ERR_LIBRARY_NOT_FOUND.
 */
DualFfiError dualffi_library_check(const char* path) noexcept;

/**
 * @brief Identify the active engine, selecting it on first call.
 * 
 * @return DUALFFI_ENGINE_NONE if no engine can start.
 */
DualFfiEngineKind dualffi_engine_kind(void) noexcept;

/**
 * @brief Name of the active engine ("declarative", "dynamic").
 * 
 * @return "none" if no engine can start. Never NULL.
 */
const char* dualffi_engine_name(void) noexcept;

/**
 * @brief Copy `len` bytes into a new foreign buffer.
 * 
 * @param data Source bytes (may be NULL only when len is 0).
 * @param len Number of bytes.
 * @return New buffer, or NULL on failure.
 * 
 * @note Caller must call dualffi_buffer_free() to release.
 */
DualFfiBuffer* dualffi_buffer_from_bytes(const uint8_t* data, size_t len) noexcept;

/**
 * @brief Copy `len` wide characters into a new null-terminated buffer.
 * 
 * @return New buffer, or NULL on failure.
 */
DualFfiBuffer* dualffi_buffer_from_unicode(const wchar_t* text, size_t len) noexcept;

/**
 * @brief Wipe and free a buffer.
 * 
 * @param buffer Buffer to free (NULL-safe).
 */
void dualffi_buffer_free(DualFfiBuffer* buffer) noexcept;

/**
 * @brief Address of the buffer's first byte, for passing to native code.
 */
void* dualffi_buffer_data(DualFfiBuffer* buffer) noexcept;

/**
 * @brief Payload size in bytes (terminators excluded).
 */
size_t dualffi_buffer_size(const DualFfiBuffer* buffer) noexcept;

/**
 * @brief Copy up to `maxlen` bytes of the buffer into `out`.
 * 
 * @param buffer Source buffer.
 * @param maxlen Byte limit; SIZE_MAX copies the whole buffer.
 * @param out Output buffer (allocated by caller).
 * @param out_size Size of output buffer.
 * @param written Receives the number of bytes copied.
 * @return DUALFFI_OK, DUALFFI_ERR_NULL_PTR or DUALFFI_ERR_BUFFER_TOO_SMALL.
 */
DualFfiError dualffi_bytes_from_buffer(
    const DualFfiBuffer* buffer,
    size_t maxlen,
    uint8_t* out,
    size_t out_size,
    size_t* written
) noexcept;

/**
 * @brief Copy the null-terminated byte string held by the buffer.
 * 
 * Writes the terminator too.
 * 
 * @param length Receives the string length (terminator excluded).
 * @return DUALFFI_OK, DUALFFI_ERR_NULL_PTR or DUALFFI_ERR_BUFFER_TOO_SMALL.
 */
DualFfiError dualffi_byte_string_from_buffer(
    const DualFfiBuffer* buffer,
    char* out,
    size_t out_size,
    size_t* length
) noexcept;

/**
 * @brief Null test for a raw pointer.
 * 
 * @param pointer Pointer to test.
 * @param indirection 2 when `pointer` is an out-parameter (pointer to a
 *        handle); the pointed-to handle is then tested as well.
 * @return 1 if null, 0 if not, -1 on error.
 */
int dualffi_is_null(void* pointer, int indirection) noexcept;

/**
 * @brief errno of the calling thread as seen by the active engine.
 */
int dualffi_errno(void) noexcept;

#ifdef __cplusplus
}  // extern "C"
#endif
