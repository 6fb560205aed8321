/**
 * @file marshal.h
 * @brief Memory primitives shared by both engine implementations.
 * 
 * Internal header; not installed.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#pragma once

#include "dualffi/buffer.h"
#include "dualffi/native_type.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dualffi {
namespace detail {

Bytes copy_bytes(const void* address, std::size_t length);

/// Bytes up to (not including) the first null at `address`.
Bytes c_string_at(const void* address);

/// wchar_t units up to the first null at `address`.
std::wstring wide_string_at(const void* address);

Bytes bytes_from_buffer(const Buffer& buffer, std::optional<std::size_t> maxlen);
Bytes bytes_from_pointer(const Pointer& pointer, std::optional<std::size_t> maxlen);
Bytes byte_string_from_buffer(const Buffer& buffer);

/// Buffer of `element` holding `data`, zero `padding` bytes after it.
Buffer fill_buffer(const NativeType& element, const void* data, std::size_t length,
                   std::size_t padding);

/**
 * @brief Null check with the out-parameter special case.
 * 
 * A non-null pointer whose target is itself a pointer or handle is also
 * reported null when that inner value is null. Native APIs that return handles
 * through an out-pointer rely on this.
 */
bool is_null(const Pointer& pointer);

/// @throws std::invalid_argument on a null pointer
void require_address(const Pointer& pointer, const char* operation);

/// Reinterpret `pointer` as the already resolved `type`.
Pointer cast_to(const NativeType& type, const Pointer& pointer);

Bytes struct_bytes(const Pointer& struct_pointer);

/// Copy the first struct_buffer.size() bytes at `source` into struct_buffer.
void fill_struct(Buffer& struct_buffer, const Pointer& source);

/**
 * @brief Decode `size` elements of `element` starting at `pointer`.
 * 
 * @param string_type Decode each element as a C string.
 * @param wide Decode strings as wchar_t.
 */
std::vector<Value> decode_array(const NativeType& element, bool string_type, bool wide,
                                const Pointer& pointer, std::size_t size);

/// Require a struct type; @throws std::invalid_argument otherwise.
void require_struct(const NativeType& type, std::string_view name);

}  // namespace detail
}  // namespace dualffi
