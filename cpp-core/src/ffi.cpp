/**
 * @file ffi.cpp
 * @brief C entry points over the process-wide engine.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/dualffi.h"
#include "dualffi/api.h"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <new>
#include <optional>

struct DualFfiBuffer {
    dualffi::Buffer buffer;
};

namespace {

DualFfiError error_code(const std::exception& e, const char* function) {
    fprintf(stderr, "%s error: %s\n", function, e.what());
    if (dynamic_cast<const dualffi::FFIEngineError*>(&e)) return DUALFFI_ERR_ENGINE;
    if (dynamic_cast<const dualffi::LibraryNotFoundError*>(&e)) return DUALFFI_ERR_LIBRARY_NOT_FOUND;
    if (dynamic_cast<const std::bad_alloc*>(&e)) return DUALFFI_ERR_ALLOC_FAILED;
    return DUALFFI_ERR_INVALID_ARGUMENT;
}

}  // namespace

extern "C" {

DualFfiError dualffi_init(void) noexcept {
    try {
        dualffi::active_engine();
        return DUALFFI_OK;
    } catch (const std::exception& e) {
        return error_code(e, "dualffi_init");
    }
}

DualFfiError dualffi_library_check(const char* path) noexcept {
    if (!path) return DUALFFI_ERR_NULL_PTR;

    try {
        dualffi::Library library = dualffi::Library::open(path);
        return DUALFFI_OK;
    } catch (const std::exception& e) {
        return error_code(e, "dualffi_library_check");
    }
}

DualFfiEngineKind dualffi_engine_kind(void) noexcept {
    try {
        return static_cast<DualFfiEngineKind>(dualffi::engine_kind());
    } catch (const std::exception& e) {
        fprintf(stderr, "dualffi_engine_kind error: %s\n", e.what());
        return DUALFFI_ENGINE_NONE;
    }
}

const char* dualffi_engine_name(void) noexcept {
    try {
        return dualffi::engine_name();
    } catch (const std::exception& e) {
        fprintf(stderr, "dualffi_engine_name error: %s\n", e.what());
        return "none";
    }
}

DualFfiBuffer* dualffi_buffer_from_bytes(const uint8_t* data, size_t len) noexcept try {
    if (!data && len != 0) return nullptr;

    dualffi::Bytes bytes;
    if (len != 0) bytes.assign(data, data + len);

    auto handle = std::make_unique<DualFfiBuffer>();
    handle->buffer = dualffi::buffer_from_bytes(bytes);
    return handle.release();
} catch (const std::exception& e) {
    fprintf(stderr, "dualffi_buffer_from_bytes error: %s\n", e.what());
    return nullptr;
}

DualFfiBuffer* dualffi_buffer_from_unicode(const wchar_t* text, size_t len) noexcept try {
    if (!text && len != 0) return nullptr;

    auto handle = std::make_unique<DualFfiBuffer>();
    handle->buffer = dualffi::buffer_from_unicode(
        len != 0 ? std::wstring_view(text, len) : std::wstring_view());
    return handle.release();
} catch (const std::exception& e) {
    fprintf(stderr, "dualffi_buffer_from_unicode error: %s\n", e.what());
    return nullptr;
}

void dualffi_buffer_free(DualFfiBuffer* buffer) noexcept {
    delete buffer;
}

void* dualffi_buffer_data(DualFfiBuffer* buffer) noexcept {
    return buffer ? buffer->buffer.data() : nullptr;
}

size_t dualffi_buffer_size(const DualFfiBuffer* buffer) noexcept {
    return buffer ? buffer->buffer.size() : 0;
}

DualFfiError dualffi_bytes_from_buffer(
    const DualFfiBuffer* buffer,
    size_t maxlen,
    uint8_t* out,
    size_t out_size,
    size_t* written
) noexcept {
    if (!buffer || !out || !written) return DUALFFI_ERR_NULL_PTR;

    try {
        std::optional<std::size_t> limit;
        if (maxlen != SIZE_MAX) limit = maxlen;

        const dualffi::Bytes bytes = dualffi::bytes_from_buffer(buffer->buffer, limit);
        if (bytes.size() > out_size) {
            fprintf(stderr, "dualffi_bytes_from_buffer: buffer too small (need %zu, have %zu)\n",
                    bytes.size(), out_size);
            return DUALFFI_ERR_BUFFER_TOO_SMALL;
        }

        if (!bytes.empty()) std::memcpy(out, bytes.data(), bytes.size());
        *written = bytes.size();
        return DUALFFI_OK;

    } catch (const std::exception& e) {
        return error_code(e, "dualffi_bytes_from_buffer");
    }
}

DualFfiError dualffi_byte_string_from_buffer(
    const DualFfiBuffer* buffer,
    char* out,
    size_t out_size,
    size_t* length
) noexcept {
    if (!buffer || !out || !length) return DUALFFI_ERR_NULL_PTR;

    try {
        const dualffi::Bytes text = dualffi::byte_string_from_buffer(buffer->buffer);
        if (text.size() + 1 > out_size) {
            fprintf(stderr, "dualffi_byte_string_from_buffer: buffer too small (need %zu, have %zu)\n",
                    text.size() + 1, out_size);
            return DUALFFI_ERR_BUFFER_TOO_SMALL;
        }

        if (!text.empty()) std::memcpy(out, text.data(), text.size());
        out[text.size()] = '\0';
        *length = text.size();
        return DUALFFI_OK;

    } catch (const std::exception& e) {
        return error_code(e, "dualffi_byte_string_from_buffer");
    }
}

int dualffi_is_null(void* pointer, int indirection) noexcept {
    if (indirection < 1 || indirection > 2) return -1;

    try {
        // The pointee of an out-parameter is itself a pointer.
        dualffi::NativeType target = dualffi::void_type();
        if (indirection == 2) target = target.pointer_to();
        return dualffi::is_null(dualffi::Pointer(pointer, target)) ? 1 : 0;
    } catch (const std::exception& e) {
        fprintf(stderr, "dualffi_is_null error: %s\n", e.what());
        return -1;
    }
}

int dualffi_errno(void) noexcept {
    try {
        return dualffi::get_errno();
    } catch (const std::exception& e) {
        fprintf(stderr, "dualffi_errno error: %s\n", e.what());
        return 0;
    }
}

}  // extern "C"
