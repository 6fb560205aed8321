/**
 * @file api.cpp
 * @brief Free-function primitives bound to the process-wide engine.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/api.h"
#include "marshal.h"

#include <algorithm>

namespace dualffi {

Buffer buffer_from_bytes(const Bytes& data) {
    return active_engine().buffer_from_bytes(data);
}

Buffer buffer_from_unicode(std::wstring_view text) {
    return active_engine().buffer_from_unicode(text);
}

Buffer buffer_pointer(const Buffer& buffer) {
    return active_engine().buffer_pointer(buffer);
}

Bytes bytes_from_buffer(const Buffer& buffer, std::optional<std::size_t> maxlen) {
    return active_engine().bytes_from_buffer(buffer, maxlen);
}

Bytes bytes_from_buffer(const Pointer& pointer, std::optional<std::size_t> maxlen) {
    return active_engine().bytes_from_pointer(pointer, maxlen);
}

Bytes byte_string_from_buffer(const Buffer& buffer) {
    return active_engine().byte_string_from_buffer(buffer);
}

Buffer byte_array(const Bytes& byte_string) {
    return active_engine().byte_array(byte_string);
}

Pointer null() {
    return active_engine().null();
}

bool is_null(const Pointer& pointer) {
    return active_engine().is_null(pointer);
}

int get_errno() {
    return active_engine().get_errno();
}

void set_errno(int value) {
    active_engine().set_errno(value);
}

Buffer new_value(const Library& library, std::string_view type_name, const Value& init) {
    return active_engine().new_value(&library, type_name, init);
}

Pointer cast(const Library& library, std::string_view type_name, const Pointer& pointer) {
    return active_engine().cast(&library, type_name, pointer);
}

std::size_t size_of(const Library& library, std::string_view type_name) {
    return active_engine().size_of(&library, type_name);
}

Value deref(const Pointer& pointer) {
    return active_engine().deref(pointer);
}

Value unwrap(const Pointer& pointer) {
    return active_engine().unwrap(pointer);
}

Buffer make_struct(const Library& library, std::string_view name) {
    return active_engine().make_struct(library, name);
}

Bytes struct_bytes(const Pointer& struct_pointer) {
    return active_engine().struct_bytes(struct_pointer);
}

Buffer struct_from_buffer(const Library& library, std::string_view name, const Pointer& source) {
    return active_engine().struct_from_buffer(library, name, source);
}

Buffer struct_from_buffer(const Library& library, std::string_view name, const Buffer& source) {
    return active_engine().struct_from_buffer(library, name, source.pointer());
}

std::vector<Value> array_from_pointer(const Library& library, std::string_view type_name,
                                      const Pointer& pointer, std::size_t size) {
    return active_engine().array_from_pointer(library, type_name, pointer, size);
}

namespace detail {

std::string text_from_value(const Value& value) {
    if (const auto* bytes = std::get_if<Bytes>(&value)) {
        auto end = std::find(bytes->begin(), bytes->end(), std::uint8_t{0});
        return std::string(bytes->begin(), end);
    }
    if (const auto* pointer = std::get_if<Pointer>(&value)) {
        require_address(*pointer, "native");
        const Bytes text = c_string_at(pointer->address());
        return std::string(text.begin(), text.end());
    }
    throw std::invalid_argument("native: value is not text");
}

std::wstring wide_text_from_value(const Value& value) {
    if (const auto* pointer = std::get_if<Pointer>(&value)) {
        require_address(*pointer, "native");
        return wide_string_at(pointer->address());
    }
    throw std::invalid_argument("native: value is not wide text");
}

Bytes bytes_from_value(const Value& value) {
    if (const auto* pointer = std::get_if<Pointer>(&value)) {
        require_address(*pointer, "native");
        return c_string_at(pointer->address());
    }
    throw std::invalid_argument("native: value is not a byte sequence");
}

}  // namespace detail

}  // namespace dualffi
