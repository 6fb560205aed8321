/**
 * @file dynamic_engine.cpp
 * @brief Engine that resolves types through libffi at call time.
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/dynamic_engine.h"
#include "dualffi/error.h"
#include "dualffi/type_spec.h"
#include "marshal.h"

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <type_traits>

namespace dualffi {

namespace {

template <typename T>
ffi_type* ffi_integer_type() {
    static_assert(std::is_integral<T>::value, "integral types only");
    constexpr bool is_signed = std::is_signed<T>::value;
    switch (sizeof(T)) {
        case 1: return is_signed ? &ffi_type_sint8 : &ffi_type_uint8;
        case 2: return is_signed ? &ffi_type_sint16 : &ffi_type_uint16;
        case 4: return is_signed ? &ffi_type_sint32 : &ffi_type_uint32;
        default: return is_signed ? &ffi_type_sint64 : &ffi_type_uint64;
    }
}

}  // namespace

DynamicEngine::DynamicEngine() {
    ffi_cif cif;
    ffi_type* args[] = {&ffi_type_pointer, &ffi_type_uint64};
    if (ffi_prep_cif(&cif, FFI_DEFAULT_ABI, 2, &ffi_type_sint, args) != FFI_OK) {
        throw EngineUnavailable("libffi could not prepare a call interface");
    }

    add_scalar("void", &ffi_type_void);
    add_scalar("char", ffi_integer_type<char>());
    add_scalar("signed char", &ffi_type_sint8);
    add_scalar("unsigned char", &ffi_type_uint8);
    add_scalar("short", &ffi_type_sshort);
    add_scalar("unsigned short", &ffi_type_ushort);
    add_scalar("int", &ffi_type_sint);
    add_scalar("unsigned int", &ffi_type_uint);
    add_scalar("long", &ffi_type_slong);
    add_scalar("unsigned long", &ffi_type_ulong);
    add_scalar("long long", &ffi_type_sint64);
    add_scalar("unsigned long long", &ffi_type_uint64);
    add_scalar("float", &ffi_type_float);
    add_scalar("double", &ffi_type_double);
    add_scalar("wchar_t", ffi_integer_type<wchar_t>());
    add_scalar("size_t", ffi_integer_type<std::size_t>());
    add_scalar("int8_t", &ffi_type_sint8);
    add_scalar("uint8_t", &ffi_type_uint8);
    add_scalar("int16_t", &ffi_type_sint16);
    add_scalar("uint16_t", &ffi_type_uint16);
    add_scalar("int32_t", &ffi_type_sint32);
    add_scalar("uint32_t", &ffi_type_uint32);
    add_scalar("int64_t", &ffi_type_sint64);
    add_scalar("uint64_t", &ffi_type_uint64);

    add_scalar("signed", &ffi_type_sint);
    add_scalar("signed int", &ffi_type_sint);
    add_scalar("unsigned", &ffi_type_uint);
    add_scalar("short int", &ffi_type_sshort);
    add_scalar("unsigned short int", &ffi_type_ushort);
    add_scalar("long int", &ffi_type_slong);
    add_scalar("unsigned long int", &ffi_type_ulong);
    add_scalar("long long int", &ffi_type_sint64);
    add_scalar("unsigned long long int", &ffi_type_uint64);

    add_atomic_pointer("void *", "void");
    add_atomic_pointer("char *", "char");
    add_atomic_pointer("wchar_t *", "wchar_t");

#ifdef _WIN32
    add_scalar("ULONG", &ffi_type_uint32);
    add_scalar("DWORD", &ffi_type_uint32);
    add_atomic_pointer("LPSTR", "char");
    add_atomic_pointer("LPCSTR", "char");
    add_atomic_pointer("LPWSTR", "wchar_t");
    add_atomic_pointer("LPCWSTR", "wchar_t");
#endif
}

void DynamicEngine::add_scalar(const std::string& name, ffi_type* type) {
    base_types_[name] = NativeType{type_info_from_ffi(name, *type), 0, false};
}

void DynamicEngine::add_atomic_pointer(const std::string& name, const std::string& pointee) {
    NativeType type = base_types_.at(pointee).pointer_to();
    type.atomic_pointer = true;
    base_types_[name] = type;
}

TypeInfo DynamicEngine::type_info_from_ffi(const std::string& name, const ffi_type& type) {
    ScalarKind kind = ScalarKind::Void;
    switch (type.type) {
        case FFI_TYPE_VOID:    kind = ScalarKind::Void; break;
        case FFI_TYPE_UINT8:   kind = ScalarKind::UInt8; break;
        case FFI_TYPE_SINT8:   kind = ScalarKind::Int8; break;
        case FFI_TYPE_UINT16:  kind = ScalarKind::UInt16; break;
        case FFI_TYPE_SINT16:  kind = ScalarKind::Int16; break;
        case FFI_TYPE_UINT32:  kind = ScalarKind::UInt32; break;
        case FFI_TYPE_INT:
        case FFI_TYPE_SINT32:  kind = ScalarKind::Int32; break;
        case FFI_TYPE_UINT64:  kind = ScalarKind::UInt64; break;
        case FFI_TYPE_SINT64:  kind = ScalarKind::Int64; break;
        case FFI_TYPE_FLOAT:   kind = ScalarKind::Float; break;
        case FFI_TYPE_DOUBLE:  kind = ScalarKind::Double; break;
        case FFI_TYPE_POINTER: kind = ScalarKind::Pointer; break;
        case FFI_TYPE_STRUCT:  kind = ScalarKind::Struct; break;
        default:
            throw std::invalid_argument("DynamicEngine: unsupported libffi type code " +
                                        std::to_string(type.type) + " for '" + name + "'");
    }
    const std::size_t alignment = type.alignment == 0 ? 1 : type.alignment;
    return TypeInfo{name, kind, type.size, alignment};
}

NativeType DynamicEngine::resolve_base(const Library* library, const std::string& name) const {
    auto it = base_types_.find(name);
    if (it != base_types_.end()) {
        return it->second;
    }
    if (library) {
        if (ffi_type* declared = library->dynamic_types().find(name)) {
            return NativeType{type_info_from_ffi(name, *declared), 0, false};
        }
    }
    throw UnresolvedTypeError(name);
}

NativeType DynamicEngine::resolve(const Library* library, std::string_view type_name) const {
    const TypeSpec spec = TypeSpec::parse(type_name);
    NativeType type = resolve_base(library, spec.base);
    type.indirection += spec.indirection;
    return type;
}

Buffer DynamicEngine::buffer_from_bytes(const Bytes& data) const {
    return detail::fill_buffer(base_types_.at("unsigned char"), data.data(), data.size(), 1);
}

Buffer DynamicEngine::buffer_from_unicode(std::wstring_view text) const {
    return detail::fill_buffer(base_types_.at("wchar_t"), text.data(),
                               text.size() * sizeof(wchar_t), sizeof(wchar_t));
}

Buffer DynamicEngine::buffer_pointer(const Buffer& buffer) const {
    Buffer slot(base_types_.at("char *"), 1);
    store_value(slot.element(), slot.data(), buffer.pointer());
    return slot;
}

Bytes DynamicEngine::bytes_from_buffer(const Buffer& buffer,
                                       std::optional<std::size_t> maxlen) const {
    return detail::bytes_from_buffer(buffer, maxlen);
}

Bytes DynamicEngine::bytes_from_pointer(const Pointer& pointer,
                                        std::optional<std::size_t> maxlen) const {
    return detail::bytes_from_pointer(pointer, maxlen);
}

Bytes DynamicEngine::byte_string_from_buffer(const Buffer& buffer) const {
    return detail::byte_string_from_buffer(buffer);
}

Buffer DynamicEngine::byte_array(const Bytes& byte_string) const {
    return detail::fill_buffer(base_types_.at("signed char"), byte_string.data(),
                               byte_string.size(), 0);
}

Pointer DynamicEngine::null() const {
    return Pointer();
}

bool DynamicEngine::is_null(const Pointer& pointer) const {
    return detail::is_null(pointer);
}

int DynamicEngine::get_errno() const {
    return errno;
}

void DynamicEngine::set_errno(int value) const {
    errno = value;
}

Buffer DynamicEngine::new_value(const Library* library, std::string_view type_name,
                                const Value& init) const {
    const TypeSpec spec = TypeSpec::parse(type_name);
    const NativeType type = resolve(library, type_name);

    // "T *" allocates a T; anything else, atomic pointers included, is
    // allocated as itself.
    const NativeType element = spec.indirection > 0 ? type.pointee() : type;
    Buffer value(element, 1);
    if (!std::holds_alternative<std::monostate>(init)) {
        store_value(element, value.data(), init);
    }
    return value;
}

Pointer DynamicEngine::cast(const Library* library, std::string_view type_name,
                            const Pointer& pointer) const {
    return detail::cast_to(resolve(library, type_name), pointer);
}

std::size_t DynamicEngine::size_of(const Library* library, std::string_view type_name) const {
    return resolve(library, type_name).size();
}

Value DynamicEngine::deref(const Pointer& pointer) const {
    detail::require_address(pointer, "deref");
    return load_value(pointer.target(), pointer.address());
}

Value DynamicEngine::unwrap(const Pointer& pointer) const {
    detail::require_address(pointer, "unwrap");
    const NativeType& target = pointer.target();
    if (!target.is_pointer() && target.base.kind == ScalarKind::Struct) {
        return detail::struct_bytes(pointer);
    }
    return load_value(target, pointer.address());
}

Buffer DynamicEngine::make_struct(const Library& library, std::string_view name) const {
    const NativeType type = resolve_base(&library, std::string(name));
    detail::require_struct(type, name);
    return Buffer(type, 1);
}

Bytes DynamicEngine::struct_bytes(const Pointer& struct_pointer) const {
    return detail::struct_bytes(struct_pointer);
}

Buffer DynamicEngine::struct_from_buffer(const Library& library, std::string_view name,
                                         const Pointer& source) const {
    Buffer instance = make_struct(library, name);
    detail::fill_struct(instance, source);
    return instance;
}

std::vector<Value> DynamicEngine::array_from_pointer(const Library& library,
                                                     std::string_view type_name,
                                                     const Pointer& pointer,
                                                     std::size_t size) const {
    const NativeType element = resolve(&library, type_name);
    return detail::decode_array(element, is_string_pointer_type(type_name),
                                is_wide_string_type(type_name), pointer, size);
}

}  // namespace dualffi
