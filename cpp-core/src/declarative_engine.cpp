/**
 * @file declarative_engine.cpp
 * @brief Engine backed by compiled type declarations.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/declarative_engine.h"
#include "dualffi/error.h"
#include "dualffi/type_spec.h"
#include "marshal.h"

#include <cerrno>
#include <stdexcept>

namespace dualffi {

namespace {

const Declarations& declarations_for(const Library* library) {
    return library ? library->declarations() : Declarations::builtins();
}

NativeType byte_type() {
    return *Declarations::builtins().lookup("unsigned char");
}

}  // namespace

NativeType DeclarativeEngine::resolve(const Library* library, std::string_view type_name) const {
    auto type = declarations_for(library).lookup(type_name);
    if (!type) {
        throw UnresolvedTypeError(std::string(type_name));
    }
    return *type;
}

Buffer DeclarativeEngine::buffer_from_bytes(const Bytes& data) const {
    return detail::fill_buffer(byte_type(), data.data(), data.size(), 0);
}

Buffer DeclarativeEngine::buffer_from_unicode(std::wstring_view text) const {
    return detail::fill_buffer(resolve(nullptr, "wchar_t"), text.data(),
                               text.size() * sizeof(wchar_t), sizeof(wchar_t));
}

Buffer DeclarativeEngine::buffer_pointer(const Buffer& buffer) const {
    Buffer slot(byte_type().pointer_to(), 1);
    store_value(slot.element(), slot.data(), buffer.pointer());
    return slot;
}

Bytes DeclarativeEngine::bytes_from_buffer(const Buffer& buffer,
                                           std::optional<std::size_t> maxlen) const {
    return detail::bytes_from_buffer(buffer, maxlen);
}

Bytes DeclarativeEngine::bytes_from_pointer(const Pointer& pointer,
                                            std::optional<std::size_t> maxlen) const {
    return detail::bytes_from_pointer(pointer, maxlen);
}

Bytes DeclarativeEngine::byte_string_from_buffer(const Buffer& buffer) const {
    return detail::byte_string_from_buffer(buffer);
}

Buffer DeclarativeEngine::byte_array(const Bytes& byte_string) const {
    return detail::fill_buffer(resolve(nullptr, "char"), byte_string.data(),
                               byte_string.size(), 0);
}

Pointer DeclarativeEngine::null() const {
    return Pointer();
}

bool DeclarativeEngine::is_null(const Pointer& pointer) const {
    return detail::is_null(pointer);
}

int DeclarativeEngine::get_errno() const {
    return errno;
}

void DeclarativeEngine::set_errno(int value) const {
    errno = value;
}

Buffer DeclarativeEngine::new_value(const Library* library, std::string_view type_name,
                                    const Value& init) const {
    const NativeType type = resolve(library, type_name);

    // Declared handle types are allocated as the handle itself.
    NativeType element;
    if (type.is_pointer()) {
        element = type.pointee();
    } else if (type.base.kind == ScalarKind::Pointer) {
        element = type;
    } else {
        throw std::invalid_argument("new_value: expected a pointer type, got '" +
                                    std::string(type_name) + "'");
    }

    Buffer value(element, 1);
    if (!std::holds_alternative<std::monostate>(init)) {
        store_value(element, value.data(), init);
    }
    return value;
}

Pointer DeclarativeEngine::cast(const Library* library, std::string_view type_name,
                                const Pointer& pointer) const {
    return detail::cast_to(resolve(library, type_name), pointer);
}

std::size_t DeclarativeEngine::size_of(const Library* library, std::string_view type_name) const {
    return resolve(library, type_name).size();
}

Value DeclarativeEngine::deref(const Pointer& pointer) const {
    detail::require_address(pointer, "deref");
    return load_value(pointer.target(), pointer.address());
}

Value DeclarativeEngine::unwrap(const Pointer& pointer) const {
    return deref(pointer);
}

Buffer DeclarativeEngine::make_struct(const Library& library, std::string_view name) const {
    const NativeType type = resolve(&library, "struct " + std::string(name));
    detail::require_struct(type, name);
    return Buffer(type, 1);
}

Bytes DeclarativeEngine::struct_bytes(const Pointer& struct_pointer) const {
    return detail::struct_bytes(struct_pointer);
}

Buffer DeclarativeEngine::struct_from_buffer(const Library& library, std::string_view name,
                                             const Pointer& source) const {
    Buffer instance = make_struct(library, name);
    detail::fill_struct(instance, source);
    return instance;
}

std::vector<Value> DeclarativeEngine::array_from_pointer(const Library& library,
                                                         std::string_view type_name,
                                                         const Pointer& pointer,
                                                         std::size_t size) const {
    const NativeType element = resolve(&library, type_name);
    return detail::decode_array(element, is_string_pointer_type(type_name),
                                is_wide_string_type(type_name), pointer, size);
}

}  // namespace dualffi
