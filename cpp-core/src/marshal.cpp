/**
 * @file marshal.cpp
 * @brief Memory primitives shared by both engine implementations.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "marshal.h"

#include <algorithm>
#include <cstring>
#include <cwchar>
#include <stdexcept>

namespace dualffi {
namespace detail {

Bytes copy_bytes(const void* address, std::size_t length) {
    if (length == 0) return Bytes();
    const auto* bytes = static_cast<const std::uint8_t*>(address);
    return Bytes(bytes, bytes + length);
}

Bytes c_string_at(const void* address) {
    const char* text = static_cast<const char*>(address);
    return copy_bytes(text, std::strlen(text));
}

std::wstring wide_string_at(const void* address) {
    return std::wstring(static_cast<const wchar_t*>(address));
}

Bytes bytes_from_buffer(const Buffer& buffer, std::optional<std::size_t> maxlen) {
    const std::size_t length = maxlen ? std::min(*maxlen, buffer.size()) : buffer.size();
    return copy_bytes(buffer.data(), length);
}

Bytes bytes_from_pointer(const Pointer& pointer, std::optional<std::size_t> maxlen) {
    require_address(pointer, "bytes_from_pointer");
    if (maxlen) {
        return copy_bytes(pointer.address(), *maxlen);
    }
    return c_string_at(pointer.address());
}

Bytes byte_string_from_buffer(const Buffer& buffer) {
    const auto* begin = static_cast<const std::uint8_t*>(buffer.data());
    if (!begin) return Bytes();
    const auto* end = begin + buffer.size();
    return Bytes(begin, std::find(begin, end, std::uint8_t{0}));
}

Buffer fill_buffer(const NativeType& element, const void* data, std::size_t length,
                   std::size_t padding) {
    const std::size_t count = length / element.size();
    Buffer buffer(element, count, padding);
    if (length > 0) {
        std::memcpy(buffer.data(), data, count * element.size());
    }
    return buffer;
}

bool is_null(const Pointer& pointer) {
    if (!pointer) return true;
    const NativeType& target = pointer.target();
    if (target.is_pointer() || target.base.kind == ScalarKind::Pointer) {
        void* inner = nullptr;
        std::memcpy(&inner, pointer.address(), sizeof(inner));
        return inner == nullptr;
    }
    return false;
}

void require_address(const Pointer& pointer, const char* operation) {
    if (!pointer) {
        throw std::invalid_argument(std::string(operation) + ": null pointer");
    }
}

Pointer cast_to(const NativeType& type, const Pointer& pointer) {
    if (type.is_pointer()) {
        return Pointer(pointer.address(), type.pointee());
    }
    if (type.base.kind == ScalarKind::Pointer) {
        return Pointer(pointer.address(), void_type());
    }
    throw std::invalid_argument("cast: '" + type.to_string() + "' is not a pointer type");
}

Bytes struct_bytes(const Pointer& struct_pointer) {
    require_address(struct_pointer, "struct_bytes");
    return copy_bytes(struct_pointer.address(), struct_pointer.target().size());
}

void fill_struct(Buffer& struct_buffer, const Pointer& source) {
    require_address(source, "struct_from_buffer");
    std::memcpy(struct_buffer.data(), source.address(), struct_buffer.size());
}

std::vector<Value> decode_array(const NativeType& element, bool string_type, bool wide,
                                const Pointer& pointer, std::size_t size) {
    std::vector<Value> output;
    if (element.size() * size == 0) {
        return output;
    }
    require_address(pointer, "array_from_pointer");

    const Pointer array(pointer.address(), element);
    output.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        const Pointer item = array.at(i);
        if (!string_type) {
            output.push_back(load_value(element, item.address()));
            continue;
        }

        void* text = nullptr;
        std::memcpy(&text, item.address(), sizeof(text));
        if (!text) {
            output.emplace_back(std::monostate{});
        } else if (wide) {
            output.emplace_back(wide_string_at(text));
        } else {
            output.emplace_back(c_string_at(text));
        }
    }
    return output;
}

void require_struct(const NativeType& type, std::string_view name) {
    if (type.is_pointer() || type.base.kind != ScalarKind::Struct) {
        throw std::invalid_argument("'" + std::string(name) + "' is not a struct type");
    }
}

}  // namespace detail
}  // namespace dualffi
